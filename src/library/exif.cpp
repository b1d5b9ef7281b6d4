/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "exif.h"
#include "constants.h"
#include "logger.h"

namespace phorg {

Exiv2::ExifData::const_iterator ExifParser::findExifKey(const std::string &key) {
    return findExifKey({key});
}

// Find the first available key, or exifData::end() if none exist
Exiv2::ExifData::const_iterator ExifParser::findExifKey(const std::initializer_list<std::string>& keys) {
    for (auto &k : keys) {
        auto it = exifData.findKey(Exiv2::ExifKey(k));
        if (it != exifData.end()) return it;
    }
    return exifData.end();
}

Exiv2::XmpData::const_iterator ExifParser::findXmpKey(const std::string &key) {
    return findXmpKey({key});
}

// Find the first available key, or xmpData::end() if none exist
Exiv2::XmpData::const_iterator ExifParser::findXmpKey(const std::initializer_list<std::string>& keys) {
    for (auto &k : keys) {
        try{
            auto it = xmpData.findKey(Exiv2::XmpKey(k));
            if (it != xmpData.end()) return it;
        }catch(Exiv2::Error&){
            // Unknown namespace, try the next key
        }
    }
    return xmpData.end();
}

std::string ExifParser::extractMake() {
    auto k = findExifKey({"Exif.Image.Make", "Exif.Photo.LensMake"});
    if (k != exifData.end()) {
        std::string make = k->toString();
        utils::trim(make);
        return make;
    }
    return "";
}

std::string ExifParser::extractModel() {
    auto k = findExifKey({"Exif.Image.Model", "Exif.Photo.LensModel"});
    if (k != exifData.end()) {
        std::string model = k->toString();
        utils::trim(model);
        return model;
    }
    return "";
}

std::string ExifParser::extractDateTimeOriginal() {
    auto k = findExifKey({"Exif.Photo.DateTimeOriginal", "Exif.Image.DateTimeOriginal"});
    if (k != exifData.end()) return k->toString();

    auto x = findXmpKey({"Xmp.exif.DateTimeOriginal", "Xmp.photoshop.DateCreated"});
    if (x != xmpData.end()) return x->toString();

    return "";
}

std::string ExifParser::extractDateTime() {
    auto k = findExifKey("Exif.Image.DateTime");
    if (k != exifData.end()) return k->toString();

    auto x = findXmpKey({"Xmp.xmp.CreateDate", "Xmp.xmp.ModifyDate"});
    if (x != xmpData.end()) return x->toString();

    return "";
}

bool ExifParser::extractGpsRationals(const std::string &key, std::vector<Rational> &dms) {
    auto k = findExifKey(key);
    if (k == exifData.end()) return false;

    dms.clear();
    for (size_t i = 0; i < k->count(); i++) {
        const Exiv2::Rational r = k->toRational(i);
        dms.emplace_back(r.first, r.second);
    }

    return !dms.empty();
}

std::string ExifParser::extractGpsRef(const std::string &key) {
    auto k = findExifKey(key);
    if (k == exifData.end()) return "";

    std::string ref = k->toString();
    utils::trim(ref);
    return ref;
}

json ExifParser::toMetadata() {
    json j = json::object();

    const std::string dateTimeOriginal = extractDateTimeOriginal();
    if (!dateTimeOriginal.empty()) j[META_DATETIME_ORIGINAL] = dateTimeOriginal;

    const std::string dateTime = extractDateTime();
    if (!dateTime.empty()) j[META_DATETIME] = dateTime;

    std::vector<Rational> latitude, longitude;
    if (extractGpsRationals("Exif.GPSInfo.GPSLatitude", latitude) &&
        extractGpsRationals("Exif.GPSInfo.GPSLongitude", longitude)) {

        auto toJson = [](const std::vector<Rational> &dms){
            json a = json::array();
            for (auto &r : dms) a.push_back({r.numerator, r.denominator});
            return a;
        };

        j[META_GPS_LATITUDE] = toJson(latitude);
        j[META_GPS_LONGITUDE] = toJson(longitude);

        const std::string latRef = extractGpsRef("Exif.GPSInfo.GPSLatitudeRef");
        const std::string lonRef = extractGpsRef("Exif.GPSInfo.GPSLongitudeRef");
        if (!latRef.empty()) j[META_GPS_LATITUDE_REF] = latRef;
        if (!lonRef.empty()) j[META_GPS_LONGITUDE_REF] = lonRef;
    }

    const std::string make = extractMake();
    const std::string model = extractModel();
    if (!make.empty()) j[META_MAKE] = make;
    if (!model.empty()) j[META_MODEL] = model;

    return j;
}

void ExifParser::printAllTags() {
    Exiv2::ExifData::const_iterator end = exifData.end();
    for (Exiv2::ExifData::const_iterator i = exifData.begin(); i != end; ++i) {
        const char* tn = i->typeName();
        LOGV << i->key() << " " << i->value() << " | " << (tn ? tn : "unknown");
    }
    for (auto i = xmpData.begin(); i != xmpData.end(); ++i) {
        const char* tn = i->typeName();
        LOGV << i->key() << " " << i->value() << " | " << (tn ? tn : "unknown");
    }
}

bool ExifParser::hasExif() {
    return !exifData.empty();
}

bool ExifParser::hasXmp() {
    return !xmpData.empty();
}

}
