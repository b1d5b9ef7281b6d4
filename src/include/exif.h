/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef EXIF_H
#define EXIF_H

#include <exiv2/exiv2.hpp>
#include <string>
#include <vector>

#include "coordinates.h"
#include "json.h"
#include "utils.h"
#include "phorg_export.h"

namespace phorg {

class ExifParser {
    Exiv2::ExifData exifData;
    Exiv2::XmpData xmpData;
  public:
    PHORG_DLL ExifParser(const Exiv2::Image *image) : exifData(image->exifData()), xmpData(image->xmpData()) {};
    PHORG_DLL ExifParser(const Exiv2::ExifData &exifData, const Exiv2::XmpData &xmpData) : exifData(exifData), xmpData(xmpData) {};

    PHORG_DLL Exiv2::ExifData::const_iterator findExifKey(const std::string &key);
    PHORG_DLL Exiv2::ExifData::const_iterator findExifKey(const std::initializer_list<std::string>& keys);
    PHORG_DLL Exiv2::XmpData::const_iterator findXmpKey(const std::string &key);
    PHORG_DLL Exiv2::XmpData::const_iterator findXmpKey(const std::initializer_list<std::string>& keys);

    PHORG_DLL std::string extractMake();
    PHORG_DLL std::string extractModel();

    // Raw EXIF timestamp strings ("2021:06:15 10:30:00"), empty if missing
    PHORG_DLL std::string extractDateTimeOriginal();
    PHORG_DLL std::string extractDateTime();

    // Degrees, minutes, seconds exactly as stored in the GPS IFD
    PHORG_DLL bool extractGpsRationals(const std::string &key, std::vector<Rational> &dms);
    PHORG_DLL std::string extractGpsRef(const std::string &key);

    // Normalized metadata keys (DateTimeOriginal, GPSLatitude, ...)
    PHORG_DLL json toMetadata();

    PHORG_DLL void printAllTags();

    PHORG_DLL bool hasExif();
    PHORG_DLL bool hasXmp();
};

}

#endif // EXIF_H
