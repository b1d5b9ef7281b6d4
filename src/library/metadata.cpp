/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "metadata.h"

#include <chrono>
#include <cmath>
#include <memory>

#include <cctz/time_zone.h>
#include <exiv2/exiv2.hpp>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include "constants.h"
#include "coordinates.h"
#include "exceptions.h"
#include "exif.h"
#include "logger.h"
#include "utils.h"

// 1904-01-01 to 1970-01-01
#define QUICKTIME_EPOCH_OFFSET 2082844800LL

namespace phorg
{

    namespace
    {

        struct FormatContextCloser
        {
            void operator()(AVFormatContext *ctx) const
            {
                avformat_close_input(&ctx);
            }
        };
        typedef std::unique_ptr<AVFormatContext, FormatContextCloser> FormatContextPtr;

        Exiv2::Image::UniquePtr openImage(const fs::path &file)
        {
            try
            {
                auto image = Exiv2::ImageFactory::open(file.string());
                if (!image.get())
                    throw MetadataException("Cannot open " + file.string());

                image->readMetadata();
                return image;
            }
            catch (const Exiv2::Error &e)
            {
                throw MetadataException("Cannot read metadata of " + file.string() + ": " + e.what());
            }
        }

        void setCreationDate(json &metadata, const std::string &value)
        {
            std::string v = value;
            utils::trim(v);
            if (!v.empty() && !metadata.contains(META_CREATION_DATE))
                metadata[META_CREATION_DATE] = v;
        }

        void setIso6709(json &metadata, const std::string &value)
        {
            Coordinate c;
            if (parseIso6709(value, c))
                setDecimalPosition(metadata, c.latitude, c.longitude);
            else
                LOGD << "Cannot parse ISO 6709 location \"" << value << "\"";
        }

        bool parseDecimal(const std::string &value, double &out)
        {
            try
            {
                size_t idx = 0;
                out = std::stod(value, &idx);
                return idx > 0 && std::isfinite(out);
            }
            catch (const std::logic_error &)
            {
                return false;
            }
        }

    }

    std::string quickTimeToString(long long seconds)
    {
        if (seconds <= 0)
            return "";

        const std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds> tp(
            std::chrono::seconds(seconds - QUICKTIME_EPOCH_OFFSET));
        return cctz::format("%Y-%m-%d %H:%M:%S", tp, cctz::utc_time_zone());
    }

    void setDecimalPosition(json &metadata, double latitude, double longitude)
    {
        metadata[META_GPS_LATITUDE] = std::fabs(latitude);
        metadata[META_GPS_LATITUDE_REF] = latitude >= 0 ? "N" : "S";
        metadata[META_GPS_LONGITUDE] = std::fabs(longitude);
        metadata[META_GPS_LONGITUDE_REF] = longitude >= 0 ? "E" : "W";
    }

    bool scanGpsTag(json &metadata, const std::string &key, const std::string &value)
    {
        std::string k = key;
        utils::toLower(k);
        if (k.find("gps") == std::string::npos)
            return false;

        const bool isLatitude = k.find("latitude") != std::string::npos;
        const bool isLongitude = k.find("longitude") != std::string::npos;
        if (!isLatitude && !isLongitude)
            return false;

        double d;
        if (!parseDecimal(value, d))
        {
            LOGD << "Ignoring non numeric GPS tag " << key << " = " << value;
            return false;
        }

        if (isLatitude)
        {
            metadata[META_GPS_LATITUDE] = std::fabs(d);
            metadata[META_GPS_LATITUDE_REF] = d >= 0 ? "N" : "S";
        }
        else
        {
            metadata[META_GPS_LONGITUDE] = std::fabs(d);
            metadata[META_GPS_LONGITUDE_REF] = d >= 0 ? "E" : "W";
        }
        return true;
    }

    json ExifExtractor::extract(const fs::path &file)
    {
        auto image = openImage(file);
        ExifParser e(image.get());

        if (!e.hasExif() && !e.hasXmp())
        {
            LOGD << "No EXIF/XMP data in " << file.filename().string();
            return json::object();
        }

        if (is_logger_verbose())
        {
            LOGV << "Tags of " << file.string();
            e.printAllTags();
        }

        return e.toMetadata();
    }

    json Exiv2VideoExtractor::extract(const fs::path &file)
    {
        auto image = openImage(file);
        const Exiv2::XmpData &xmp = image->xmpData();

        json j = json::object();

        try
        {
            for (auto it = xmp.begin(); it != xmp.end(); ++it)
            {
                const std::string key = it->key();
                const std::string value = it->toString();
                LOGV << key << " = " << value;

                if (key == "Xmp.video.DateUTC" || key == "Xmp.video.MediaCreateDate" || key == "Xmp.video.TrackCreateDate")
                {
                    long long seconds = 0;
                    try
                    {
                        seconds = std::stoll(value);
                    }
                    catch (const std::logic_error &)
                    {
                        // Already a formatted date
                        setCreationDate(j, value);
                        continue;
                    }
                    setCreationDate(j, quickTimeToString(seconds));
                }
                else if (key == "Xmp.video.GPSCoordinates")
                {
                    setIso6709(j, value);
                }
                else
                {
                    scanGpsTag(j, key, value);
                }
            }
        }
        catch (const Exiv2::Error &e)
        {
            throw MetadataException("Cannot read video metadata of " + file.string() + ": " + e.what());
        }

        return j;
    }

    FFmpegVideoExtractor::FFmpegVideoExtractor()
    {
        if (!is_logger_verbose())
            av_log_set_level(AV_LOG_QUIET);
    }

    json FFmpegVideoExtractor::extract(const fs::path &file)
    {
        AVFormatContext *ctx = nullptr;
        int rc = avformat_open_input(&ctx, file.c_str(), nullptr, nullptr);
        if (rc < 0)
        {
            char buf[AV_ERROR_MAX_STRING_SIZE];
            av_strerror(rc, buf, sizeof(buf));
            throw MetadataException("Cannot read video " + file.string() + ": " + buf);
        }
        FormatContextPtr av(ctx);

        json j = json::object();

        AVDictionaryEntry *t = nullptr;
        while ((t = av_dict_get(av->metadata, "", t, AV_DICT_IGNORE_SUFFIX)))
        {
            const std::string key = t->key;
            const std::string value = t->value;
            LOGV << key << " = " << value;

            if (key == "creation_time")
                setCreationDate(j, value);
            else if (key == "location" || key == "com.apple.quicktime.location.ISO6709")
                setIso6709(j, value);
            else
                scanGpsTag(j, key, value);
        }

        // Some muxers only tag the streams
        for (unsigned int i = 0; i < av->nb_streams && !j.contains(META_CREATION_DATE); i++)
        {
            AVDictionaryEntry *ct = av_dict_get(av->streams[i]->metadata, "creation_time", nullptr, 0);
            if (ct != nullptr)
                setCreationDate(j, ct->value);
        }

        return j;
    }

    VideoExtractorChain::VideoExtractorChain(const std::vector<std::shared_ptr<MetadataExtractor>> &extractors)
        : extractors(extractors)
    {
    }

    std::string VideoExtractorChain::name() const
    {
        std::string n;
        for (auto &e : extractors)
        {
            if (!n.empty())
                n += ",";
            n += e->name();
        }
        return n;
    }

    json VideoExtractorChain::extract(const fs::path &file)
    {
        std::string lastError;
        bool anySucceeded = false;

        for (auto &e : extractors)
        {
            try
            {
                json j = e->extract(file);
                anySucceeded = true;

                if (j.is_object() && !j.empty())
                {
                    LOGD << "Metadata of " << file.filename().string() << " read with " << e->name();
                    return j;
                }

                LOGD << e->name() << " found no metadata in " << file.filename().string();
            }
            catch (const MetadataException &ex)
            {
                LOGD << e->name() << " failed: " << ex.what();
                lastError = ex.what();
            }
        }

        if (!anySucceeded && !extractors.empty())
            throw MetadataException(lastError);

        return json::object();
    }

    std::shared_ptr<MetadataExtractor> createPhotoExtractor()
    {
        return std::make_shared<ExifExtractor>();
    }

    std::shared_ptr<MetadataExtractor> createVideoExtractor()
    {
        std::vector<std::shared_ptr<MetadataExtractor>> chain = {std::make_shared<Exiv2VideoExtractor>(),
                                                                  std::make_shared<FFmpegVideoExtractor>()};
        return std::make_shared<VideoExtractorChain>(chain);
    }

}
