/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstdlib>
#include "organize.h"
#include "progressbar.h"
#include "exceptions.h"
#include "logger.h"
#include "organizer.h"
#include "phorg.h"
#include "utils.h"

namespace cmd {

void Organize::setOptions(cxxopts::Options &opts) {
    // clang-format off
    opts
    .positional_help("[args]")
    .custom_help("organize ./camera-roll ./library")
    .add_options()
    ("i,input", "Folder to read photos and videos from", cxxopts::value<std::string>())
    ("o,output", "Folder to copy the organized files to", cxxopts::value<std::string>())
    ("w,workers", "Number of parallel workers (0 = automatic)", cxxopts::value<int>()->default_value("0"))
    ("t,types", "Comma separated list of extensions to process (e.g. jpg,mov)", cxxopts::value<std::string>()->default_value(""))
    ("no-cache", "Do not read or write the geocoding cache", cxxopts::value<bool>())
    ("no-day-folder", "Do not create a folder per day (YYYY/MM-Month/Place)", cxxopts::value<bool>())
    ("g,geocoder", "Reverse geocoding service (nominatim|google|none)", cxxopts::value<std::string>()->default_value("nominatim"))
    ("geocoder-url", "Override the geocoding service endpoint", cxxopts::value<std::string>()->default_value(""))
    ("geocode-timeout", "Timeout of a single geocoding request in seconds", cxxopts::value<int>()->default_value(std::to_string(DEFAULT_GEOCODE_TIMEOUT_SECONDS)))
    ("cache-file", "Geocoding cache database (default: ~/" PHORG_FOLDER "/" GEOCODE_CACHE_FILE_NAME ")", cxxopts::value<std::string>()->default_value(""))
    ("no-progress", "Do not show a progress bar", cxxopts::value<bool>());

    // clang-format on
    opts.parse_positional({"input", "output"});
}

std::string Organize::description() {
    return "Copy photos and videos into a year/month/day/place folder structure";
}

void Organize::run(cxxopts::ParseResult &opts) {
    if (!opts.count("input") || !opts.count("output")) {
        printHelp();
    }

    const int workers = opts["workers"].as<int>();
    if (workers < 0) throw phorg::InvalidArgsException("Workers cannot be negative");

    phorg::OrganizerOptions o;
    o.inputFolder = opts["input"].as<std::string>();
    o.outputFolder = opts["output"].as<std::string>();
    o.workers = static_cast<size_t>(workers);
    o.fileTypes = phorg::utils::parseExtensionList(opts["types"].as<std::string>());
    o.useCache = opts["no-cache"].count() == 0;
    o.includeDay = opts["no-day-folder"].count() == 0;
    o.geocoder = opts["geocoder"].as<std::string>();
    o.geocoderUrl = opts["geocoder-url"].as<std::string>();
    o.geocodeTimeout = opts["geocode-timeout"].as<int>();
    o.cacheFile = opts["cache-file"].as<std::string>();

    const char *apiKey = std::getenv(PHORG_API_KEY_ENV);
    if (apiKey != nullptr) o.apiKey = apiKey;

    phorg::Organizer organizer(o);

    const bool showProgress = opts["no-progress"].count() == 0 && !is_logger_verbose();
    ProgressBar pb;

    auto summary = organizer.run([&](const phorg::ProcessResult &r, size_t done, size_t total){
        if (r.status == phorg::ProcessStatus::Error && !showProgress) {
            std::cerr << r.source.string() << ": " << r.message << std::endl;
        }
        if (showProgress) pb.update(done, total);
    });

    if (showProgress && summary.total > 0) pb.done();

    if (summary.interrupted) {
        throw phorg::InterruptedException("Interrupted by user");
    }
}

}
