/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "dispatcher.h"

#include <algorithm>

#include "capturedate.h"
#include "constants.h"
#include "coordinates.h"
#include "exceptions.h"
#include "logger.h"
#include "mio.h"

namespace phorg
{

    std::string mediaTypeToHuman(MediaType t)
    {
        switch (t)
        {
        case MediaType::Photo:
            return "Photo";
        case MediaType::Video:
            return "Video";
        default:
            return "Unsupported";
        }
    }

    std::string processStatusToHuman(ProcessStatus s)
    {
        switch (s)
        {
        case ProcessStatus::Success:
            return "success";
        case ProcessStatus::Skipped:
            return "skipped";
        default:
            return "error";
        }
    }

    MediaDispatcher::MediaDispatcher(std::shared_ptr<MetadataExtractor> photoExtractor,
                                     std::shared_ptr<MetadataExtractor> videoExtractor,
                                     std::shared_ptr<LocationResolver> locationResolver,
                                     const DestinationPathBuilder &pathBuilder)
        : photoExtractor(std::move(photoExtractor)), videoExtractor(std::move(videoExtractor)),
          locationResolver(std::move(locationResolver)), pathBuilder(pathBuilder),
          copier(io::copyPreservingTimes)
    {
    }

    void MediaDispatcher::setAllowedTypes(const std::vector<std::string> &types)
    {
        allowedTypes = types;
    }

    void MediaDispatcher::setCopier(const FileCopier &c)
    {
        copier = c;
    }

    MediaType MediaDispatcher::classify(const fs::path &file) const
    {
        io::Path p(file);

        if (!allowedTypes.empty() && !p.checkExtension(allowedTypes))
            return MediaType::Unsupported;

        if (p.checkExtension(PHOTO_EXTENSIONS))
            return MediaType::Photo;
        if (p.checkExtension(VIDEO_EXTENSIONS))
            return MediaType::Video;

        return MediaType::Unsupported;
    }

    json MediaDispatcher::extractMetadata(MediaType type, const fs::path &file)
    {
        auto &extractor = type == MediaType::Photo ? photoExtractor : videoExtractor;
        if (!extractor)
            return json::object();

        try
        {
            return extractor->extract(file);
        }
        catch (const MetadataException &e)
        {
            LOGW << e.what();
            return json::object();
        }
    }

    ProcessResult MediaDispatcher::process(const fs::path &file)
    {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec))
            return ProcessResult(ProcessStatus::Skipped, file, fs::path(), "Not a regular file");

        const MediaType type = classify(file);
        if (type == MediaType::Unsupported)
        {
            LOGV << "Skipping " << file.string();
            return ProcessResult(ProcessStatus::Skipped, file, fs::path(), "Unsupported file type");
        }

        fs::path destination;

        try
        {
            LOGD << "Processing " << mediaTypeToHuman(type) << " " << file.string();

            const json metadata = extractMetadata(type, file);
            const CaptureDate date = DateResolver::resolve(file, metadata);

            std::optional<Coordinate> coordinate;
            try
            {
                coordinate = extractCoordinate(metadata);
            }
            catch (const MalformedCoordinateException &e)
            {
                LOGD << "No usable GPS position in " << file.filename().string() << ": " << e.what();
            }

            const std::string place = locationResolver ? locationResolver->resolve(coordinate) : UNKNOWN_LOCATION;

            destination = pathBuilder.build(date, place, file);
            copier(file, destination);

            LOGD << file.string() << " -> " << destination.string() << " (" << DateResolver::toString(date) << ", " << place << ")";
            return ProcessResult(ProcessStatus::Success, file, destination);
        }
        catch (const AppException &e)
        {
            LOGE << "Cannot process " << file.string() << ": " << e.what();

            // Release the reserved name
            if (!destination.empty())
            {
                std::error_code rec;
                fs::remove(destination, rec);
            }
            return ProcessResult(ProcessStatus::Error, file, fs::path(), e.what());
        }
        catch (const std::exception &e)
        {
            LOGE << "Cannot process " << file.string() << ": " << e.what();
            if (!destination.empty())
            {
                std::error_code rec;
                fs::remove(destination, rec);
            }
            return ProcessResult(ProcessStatus::Error, file, fs::path(), e.what());
        }
    }

}
