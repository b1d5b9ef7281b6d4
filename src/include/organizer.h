/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef ORGANIZER_H
#define ORGANIZER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "constants.h"
#include "dispatcher.h"
#include "fs.h"
#include "geocache.h"
#include "geocoder.h"
#include "phorg_export.h"

namespace phorg
{

    struct OrganizerOptions
    {
        fs::path inputFolder;
        fs::path outputFolder;
        size_t workers = 0; // 0 = ThreadPool::defaultThreadCount()
        bool useCache = true;
        bool includeDay = true;
        std::vector<std::string> fileTypes; // Empty = every supported type
        std::string geocoder = "nominatim";
        std::string geocoderUrl;
        std::string apiKey;
        int geocodeTimeout = DEFAULT_GEOCODE_TIMEOUT_SECONDS;
        fs::path cacheFile; // Empty = ~/.phorg/geocoding_cache.db
    };

    struct OrganizerSummary
    {
        size_t total = 0;
        size_t processed = 0;
        size_t skipped = 0;
        size_t errors = 0;
        std::uintmax_t bytesCopied = 0;
        long long durationMs = 0;
        long long cacheSize = -1; // -1 when the cache is disabled
        bool interrupted = false;

        PHORG_DLL double filesPerSecond() const;
    };

    // Called from worker threads after each file, serialized
    typedef std::function<void(const ProcessResult &result, size_t done, size_t total)> OrganizeCallback;

    class Organizer
    {
        OrganizerOptions opts;
        std::shared_ptr<GeocodeCache> cache;
        std::shared_ptr<LocationResolver> locationResolver;
        std::unique_ptr<MediaDispatcher> dispatcher;

        void init(std::shared_ptr<ReverseGeocoder> geocoder);
        void logSummary(const OrganizerSummary &s) const;

    public:
        // Throws InvalidArgsException if the input folder is not a directory
        PHORG_DLL explicit Organizer(const OrganizerOptions &opts);

        // Uses the given geocoder instead of the one named in the options
        PHORG_DLL Organizer(const OrganizerOptions &opts, std::shared_ptr<ReverseGeocoder> geocoder);

        // Every regular file below the input folder, excluding the output folder
        PHORG_DLL std::vector<fs::path> listFiles() const;

        // Blocks until every file has been processed or the process
        // has been interrupted
        PHORG_DLL OrganizerSummary run(const OrganizeCallback &callback = nullptr);

        PHORG_DLL LocationResolver &getLocationResolver();
    };

}

#endif // ORGANIZER_H
