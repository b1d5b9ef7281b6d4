/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "testarea.h"

#include <fstream>
#include <iostream>

#include <exiv2/exiv2.hpp>

#include "logger.h"
#include "exceptions.h"

TestArea::TestArea(const std::string &name, bool recreateIfExists)
    : name(name){
    fs::path root = getFolder();
    if (name.find("..") != std::string::npos) throw FSException("Cannot use .. in name");

    if (recreateIfExists){
        if (fs::exists(root)){
            LOGD << "Removing " << root;
            LOGD << "Removed " << fs::remove_all(root) << " files/folders";
        }
    }
}

fs::path TestArea::getFolder(const fs::path &subfolder){
    fs::path root = fs::temp_directory_path() / "phorg_test_areas" / fs::path(name);
    fs::path dir = root;
    if (!subfolder.empty()) dir = dir / subfolder;

    if (!fs::exists(dir)){
        if (!fs::create_directories(dir)) throw FSException("Cannot create " + dir.string());
        LOGD << "Created test folder " << dir;
    }
    return dir;
}

fs::path TestArea::createFile(const fs::path &relPath, const std::string &content){
    fs::path p = getFolder() / relPath;
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    std::ofstream f(p.string(), std::ios::out | std::ios::trunc | std::ios::binary);
    if (!f.is_open()) throw FSException("Cannot write " + p.string());
    f << content;
    f.close();

    return p;
}

fs::path TestArea::createJpeg(const fs::path &relPath, const std::vector<std::pair<std::string, std::string>> &tags){
    fs::path p = getFolder() / relPath;
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    if (fs::exists(p)) fs::remove(p);

    auto image = Exiv2::ImageFactory::create(Exiv2::ImageType::jpeg, p.string());
    if (!image.get()) throw FSException("Cannot create " + p.string());

    Exiv2::ExifData exif;
    for (auto &t : tags) exif[t.first] = t.second;

    image->setExifData(exif);
    image->writeMetadata();

    return p;
}

void TestArea::clearAll() {
    const fs::path testAreasRoot = fs::temp_directory_path() / "phorg_test_areas";
    if (!fs::exists(testAreasRoot)) {
        std::cout << "No test areas to clear\n";
        return;
    }

    LOGD << "Removing all test areas from " << testAreasRoot;
    auto removedCount = fs::remove_all(testAreasRoot);
    LOGD << "Removed " << removedCount << " files/folders from test areas";
    std::cout << "Cleared all test areas (" << removedCount << " items removed)\n";
}
