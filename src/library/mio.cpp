/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "mio.h"

#include <cerrno>
#include <cstring>
#include <iomanip>

#include <fcntl.h>
#include <unistd.h>

#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace phorg{
namespace io{

bool Path::checkExtension(const std::initializer_list<std::string>& matches) const {
    return checkExtension(std::vector<std::string>(matches));
}

bool Path::checkExtension(const std::vector<std::string>& matches) const {
    const std::string extLowerCase = extension();
    if (extLowerCase.empty()) return false;

    for (auto &m : matches) {
        std::string ext = m;
        utils::toLower(ext);
        if (ext == extLowerCase) return true;
    }
    return false;
}

std::string Path::extension() const {
    std::string ext = p.extension().string();
    if (ext.size() < 1) return "";
    ext = ext.substr(1, ext.length());
    utils::toLower(ext);
    return ext;
}

std::string Path::string() const{
    return p.string();
}

void createDirectories(const fs::path &d){
    std::error_code ec;
    fs::create_directories(d, ec);

    // Another worker may have created it in the meantime
    if (ec && !fs::is_directory(d))
        throw FSException("Cannot create directory " + d.string() + ": " + ec.message());
}

fs::path assureFolderExists(const fs::path &d){
    if (!fs::exists(d)){
        createDirectories(d);
        LOGD << "Created " << d.string();
    }

    return d;
}

bool createExclusive(const fs::path &p){
    const int fd = open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd == -1){
        if (errno == EEXIST) return false;
        throw FSException("Cannot create " + p.string() + ": " + std::strerror(errno));
    }
    close(fd);
    return true;
}

void copyPreservingTimes(const fs::path &src, const fs::path &dst){
    std::error_code ec;

    if (dst.has_parent_path()){
        fs::create_directories(dst.parent_path(), ec);
        if (ec && !fs::is_directory(dst.parent_path()))
            throw CopyException("Cannot create " + dst.parent_path().string() + ": " + ec.message());
    }

    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) throw CopyException("Cannot copy " + src.string() + " to " + dst.string() + ": " + ec.message());

    const auto perms = fs::status(src, ec).permissions();
    if (!ec) fs::permissions(dst, perms, ec);
    if (ec) LOGD << "Cannot copy permissions to " << dst.string() << ": " << ec.message();

    const auto mtime = fs::last_write_time(src, ec);
    if (!ec) fs::last_write_time(dst, mtime, ec);
    if (ec) throw CopyException("Cannot preserve modification time of " + dst.string() + ": " + ec.message());
}

std::string bytesToHuman(std::uintmax_t bytes){
    std::ostringstream os;

    const char* suffixes[7];
    suffixes[0] = "B";
    suffixes[1] = "KB";
    suffixes[2] = "MB";
    suffixes[3] = "GB";
    suffixes[4] = "TB";
    suffixes[5] = "PB";
    suffixes[6] = "EB";
    std::uintmax_t s = 0;

    double count = static_cast<double>(bytes);

    while (count >= 1024 && s < 6){
        s++;
        count /= 1024;
    }
    if (count - std::floor(count) == 0.0){
        os << int(count) << " " << suffixes[s];
    }else{
        os << std::fixed << std::setprecision(2) << count << " " << suffixes[s];
    }

    return os.str();
}

}
}
