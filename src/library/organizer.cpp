/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "organizer.h"

#include <chrono>
#include <mutex>

#include "exceptions.h"
#include "logger.h"
#include "metadata.h"
#include "mio.h"
#include "phorg.h"
#include "threadpool.h"
#include "userprofile.h"
#include "utils.h"

namespace phorg
{

    double OrganizerSummary::filesPerSecond() const
    {
        if (durationMs <= 0)
            return 0.0;
        return static_cast<double>(total) / (static_cast<double>(durationMs) / 1000.0);
    }

    Organizer::Organizer(const OrganizerOptions &opts) : opts(opts)
    {
        init(createGeocoder(opts.geocoder, opts.apiKey, opts.geocoderUrl));
    }

    Organizer::Organizer(const OrganizerOptions &opts, std::shared_ptr<ReverseGeocoder> geocoder) : opts(opts)
    {
        init(std::move(geocoder));
    }

    void Organizer::init(std::shared_ptr<ReverseGeocoder> geocoder)
    {
        std::error_code ec;
        if (!fs::is_directory(opts.inputFolder, ec))
            throw InvalidArgsException("Input folder " + opts.inputFolder.string() + " does not exist or is not a directory");

        if (opts.outputFolder.empty())
            throw InvalidArgsException("No output folder specified");

        io::assureFolderExists(opts.outputFolder);

        if (opts.useCache)
        {
            const fs::path cacheFile = opts.cacheFile.empty() ? UserProfile::get()->getGeocodeCacheFile() : opts.cacheFile;
            cache = std::make_shared<GeocodeCache>(cacheFile);
        }

        if (geocoder)
            LOGD << "Reverse geocoding with " << geocoder->name();

        locationResolver = std::make_shared<LocationResolver>(geocoder, cache, opts.geocodeTimeout);
        dispatcher = std::make_unique<MediaDispatcher>(createPhotoExtractor(), createVideoExtractor(),
                                                       locationResolver,
                                                       DestinationPathBuilder(opts.outputFolder, opts.includeDay));
        dispatcher->setAllowedTypes(opts.fileTypes);
    }

    LocationResolver &Organizer::getLocationResolver()
    {
        return *locationResolver;
    }

    std::vector<fs::path> Organizer::listFiles() const
    {
        std::vector<fs::path> files;

        std::error_code ec;
        const fs::path output = fs::weakly_canonical(opts.outputFolder, ec);
        const bool outputKnown = !ec;

        fs::recursive_directory_iterator it(opts.inputFolder, fs::directory_options::skip_permission_denied, ec);
        if (ec)
            throw FSException("Cannot list " + opts.inputFolder.string() + ": " + ec.message());

        for (; it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            if (it->is_directory(ec))
            {
                // Never reprocess our own output
                if (outputKnown && fs::weakly_canonical(it->path(), ec) == output)
                {
                    LOGD << "Skipping output folder " << it->path().string();
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (it->is_regular_file(ec))
                files.push_back(it->path());
        }

        if (ec)
            LOGW << "Listing of " << opts.inputFolder.string() << " stopped early: " << ec.message();

        return files;
    }

    OrganizerSummary Organizer::run(const OrganizeCallback &callback)
    {
        OrganizerSummary summary;
        const auto start = std::chrono::steady_clock::now();

        const std::vector<fs::path> files = listFiles();
        summary.total = files.size();
        LOGI << "Found " << files.size() << " files in " << opts.inputFolder.string();

        std::mutex resultsMutex;
        size_t done = 0;

        {
            ThreadPool pool(opts.workers > 0 ? std::min<size_t>(opts.workers, MAX_WORKERS) : ThreadPool::defaultThreadCount());

            for (const auto &f : files)
            {
                if (isInterrupted())
                    break;

                pool.submit([&, f]() {
                    if (isInterrupted())
                        return;

                    const ProcessResult r = dispatcher->process(f);

                    std::error_code ec;
                    const std::uintmax_t size = r.status == ProcessStatus::Success ? fs::file_size(r.destination, ec) : 0;

                    std::lock_guard<std::mutex> lock(resultsMutex);
                    switch (r.status)
                    {
                    case ProcessStatus::Success:
                        summary.processed++;
                        if (!ec)
                            summary.bytesCopied += size;
                        break;
                    case ProcessStatus::Skipped:
                        summary.skipped++;
                        break;
                    default:
                        summary.errors++;
                        break;
                    }
                    done++;
                    if (callback)
                        callback(r, done, summary.total);
                });
            }

            // Pool destructor waits for the queue to drain
        }

        summary.interrupted = isInterrupted();
        summary.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

        if (cache)
        {
            try
            {
                summary.cacheSize = cache->count();
            }
            catch (const DBException &e)
            {
                LOGW << "Cannot read geocode cache size: " << e.what();
            }
        }

        logSummary(summary);
        return summary;
    }

    void Organizer::logSummary(const OrganizerSummary &s) const
    {
        LOGI << "Processing summary:";
        LOGI << "  Total files: " << s.total;
        LOGI << "  Processed: " << s.processed;
        LOGI << "  Skipped: " << s.skipped;
        LOGI << "  Errors: " << s.errors;
        LOGI << "  Copied: " << io::bytesToHuman(s.bytesCopied);
        LOGI << "  Duration: " << utils::toHumanReadableTime(s.durationMs);
        LOGI << "  Speed: " << utils::stringFormat("%.2f", s.filesPerSecond()) << " files/sec";
        if (s.cacheSize >= 0)
            LOGI << "  Cached locations: " << s.cacheSize;
        if (s.interrupted)
            LOGW << "Interrupted, " << (s.total - s.processed - s.skipped - s.errors) << " files were not processed";
    }

}
