/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "cache.h"
#include "exceptions.h"
#include "geocache.h"
#include "phorg.h"
#include "userprofile.h"

namespace cmd {

void Cache::setOptions(cxxopts::Options &opts) {
    // clang-format off
    opts
    .positional_help("[args]")
    .custom_help("cache [--clear]")
    .add_options()
    ("clear", "Remove every cached location", cxxopts::value<bool>())
    ("cache-file", "Geocoding cache database (default: ~/" PHORG_FOLDER "/" GEOCODE_CACHE_FILE_NAME ")", cxxopts::value<std::string>()->default_value(""));
    // clang-format on
}

std::string Cache::description() {
    return "Show or clear the reverse geocoding cache";
}

void Cache::run(cxxopts::ParseResult &opts) {
    const std::string cacheFile = opts["cache-file"].as<std::string>();
    phorg::GeocodeCache cache(cacheFile.empty() ? phorg::UserProfile::get()->getGeocodeCacheFile() : fs::path(cacheFile));

    if (opts["clear"].count()) {
        const long long before = cache.count();
        cache.clear();
        std::cout << "Removed " << before << " cached locations" << std::endl;
    }

    std::cout << "Location: " << cache.getPath().string() << std::endl;
    std::cout << "Entries: " << cache.count() << std::endl;
}

}
