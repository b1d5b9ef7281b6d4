/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef DISPATCHER_H
#define DISPATCHER_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "destination.h"
#include "fs.h"
#include "location.h"
#include "metadata.h"
#include "phorg_export.h"

namespace phorg
{

    enum MediaType
    {
        Unsupported = 0,
        Photo,
        Video
    };

    enum ProcessStatus
    {
        Success = 0,
        Skipped,
        Error
    };

    PHORG_DLL std::string mediaTypeToHuman(MediaType t);
    PHORG_DLL std::string processStatusToHuman(ProcessStatus s);

    struct ProcessResult
    {
        ProcessStatus status;
        fs::path source;
        fs::path destination; // Set on Success only
        std::string message;

        PHORG_DLL ProcessResult(ProcessStatus status, const fs::path &source,
                                const fs::path &destination = fs::path(),
                                const std::string &message = "")
            : status(status), source(source), destination(destination), message(message) {}
    };

    // Copies src to dst, keeping the modification time
    typedef std::function<void(const fs::path &src, const fs::path &dst)> FileCopier;

    // Runs a single file through extraction, date and location
    // resolution, destination allocation and copy.
    // process() never throws, every failure becomes a ProcessResult.
    class MediaDispatcher
    {
        std::shared_ptr<MetadataExtractor> photoExtractor;
        std::shared_ptr<MetadataExtractor> videoExtractor;
        std::shared_ptr<LocationResolver> locationResolver;
        DestinationPathBuilder pathBuilder;
        std::vector<std::string> allowedTypes;
        FileCopier copier;

        json extractMetadata(MediaType type, const fs::path &file);

    public:
        PHORG_DLL MediaDispatcher(std::shared_ptr<MetadataExtractor> photoExtractor,
                                  std::shared_ptr<MetadataExtractor> videoExtractor,
                                  std::shared_ptr<LocationResolver> locationResolver,
                                  const DestinationPathBuilder &pathBuilder);

        // Limits processing to these extensions (lowercase, no dot). Empty means all supported
        PHORG_DLL void setAllowedTypes(const std::vector<std::string> &types);
        PHORG_DLL void setCopier(const FileCopier &c);

        PHORG_DLL MediaType classify(const fs::path &file) const;
        PHORG_DLL ProcessResult process(const fs::path &file);
    };

}

#endif // DISPATCHER_H
