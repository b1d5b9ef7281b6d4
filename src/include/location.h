/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef LOCATION_H
#define LOCATION_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "constants.h"
#include "coordinates.h"
#include "geocache.h"
#include "geocoder.h"
#include "json.h"
#include "lrucache.h"
#include "phorg_export.h"

namespace phorg
{

    typedef std::function<void(std::chrono::seconds)> Sleeper;

    // Turns a GPS position into a place name, always returning a usable
    // name (UNKNOWN_LOCATION when the position is absent or cannot be resolved).
    // Lookups go through a bounded in-process memo, then the durable cache,
    // then the reverse geocoder.
    class LocationResolver
    {
        std::shared_ptr<ReverseGeocoder> geocoder;
        std::shared_ptr<GeocodeCache> cache;
        LruCache<std::string, std::string> memo;
        int timeoutSeconds;
        Sleeper sleeper;

        std::optional<std::string> cached(double latitude, double longitude, const std::string &key);
        void remember(double latitude, double longitude, const std::string &key, const std::string &place);

    public:
        // @param geocoder nullptr disables reverse geocoding
        // @param cache nullptr disables the durable cache
        PHORG_DLL LocationResolver(std::shared_ptr<ReverseGeocoder> geocoder,
                                   std::shared_ptr<GeocodeCache> cache,
                                   int timeoutSeconds = DEFAULT_GEOCODE_TIMEOUT_SECONDS,
                                   size_t memoCapacity = DEFAULT_LOCATION_MEMO_CAPACITY);

        PHORG_DLL std::string resolve(const std::optional<Coordinate> &coordinate);

        // Replaces the function used to wait between attempts
        PHORG_DLL void setSleeper(const Sleeper &s);

        PHORG_DLL bool isGeocodingEnabled() const;
        PHORG_DLL size_t memoSize() const;

        // First present of city, town, village, suburb, state, county
        PHORG_DLL static std::string placeNameFromAddress(const json &address);
    };

}

#endif // LOCATION_H
