/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef METADATA_H
#define METADATA_H

#include <memory>
#include <string>
#include <vector>

#include "fs.h"
#include "json.h"
#include "phorg_export.h"

namespace phorg
{

    // Reads the embedded metadata of a media file into a flat object
    // using the normalized keys of constants.h (DateTimeOriginal, DateTime,
    // CreationDate, GPSLatitude, GPSLatitudeRef, ...).
    // Throws MetadataException when the file cannot be read.
    class MetadataExtractor
    {
    public:
        virtual ~MetadataExtractor() = default;

        virtual json extract(const fs::path &file) = 0;
        virtual std::string name() const = 0;
    };

    // EXIF/XMP of still images (Exiv2). GPS positions are emitted as
    // [[num, den], [num, den], [num, den]] triples plus their references.
    class ExifExtractor : public MetadataExtractor
    {
    public:
        PHORG_DLL json extract(const fs::path &file) override;
        PHORG_DLL std::string name() const override { return "exiv2"; }
    };

    // QuickTime/MP4 atoms exposed by Exiv2 as Xmp.video.*
    class Exiv2VideoExtractor : public MetadataExtractor
    {
    public:
        PHORG_DLL json extract(const fs::path &file) override;
        PHORG_DLL std::string name() const override { return "exiv2-video"; }
    };

    // Container metadata read through libavformat
    class FFmpegVideoExtractor : public MetadataExtractor
    {
    public:
        PHORG_DLL FFmpegVideoExtractor();

        PHORG_DLL json extract(const fs::path &file) override;
        PHORG_DLL std::string name() const override { return "libavformat"; }
    };

    // Tries each extractor in order and returns the first non-empty
    // result. Throws MetadataException only if every extractor failed.
    class VideoExtractorChain : public MetadataExtractor
    {
        std::vector<std::shared_ptr<MetadataExtractor>> extractors;

    public:
        PHORG_DLL explicit VideoExtractorChain(const std::vector<std::shared_ptr<MetadataExtractor>> &extractors);

        PHORG_DLL json extract(const fs::path &file) override;
        PHORG_DLL std::string name() const override;
    };

    PHORG_DLL std::shared_ptr<MetadataExtractor> createPhotoExtractor();

    // Exiv2 first, libavformat as fallback
    PHORG_DLL std::shared_ptr<MetadataExtractor> createVideoExtractor();

    // Seconds since 1904-01-01 (QuickTime) to "YYYY-MM-DD HH:MM:SS" UTC,
    // empty if the value is not a valid timestamp
    PHORG_DLL std::string quickTimeToString(long long seconds);

    // Stores a signed decimal position as GPSLatitude/GPSLongitude
    // absolute values with N/S and E/W references
    PHORG_DLL void setDecimalPosition(json &metadata, double latitude, double longitude);

    // Picks up free-form tags such as "com.example.gps.latitude = 45.1".
    // @return true if the key was recognized as a GPS coordinate
    PHORG_DLL bool scanGpsTag(json &metadata, const std::string &key, const std::string &value);

}

#endif // METADATA_H
