/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "location.h"

#include <thread>

#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace phorg
{

    LocationResolver::LocationResolver(std::shared_ptr<ReverseGeocoder> geocoder,
                                       std::shared_ptr<GeocodeCache> cache,
                                       int timeoutSeconds,
                                       size_t memoCapacity)
        : geocoder(std::move(geocoder)), cache(std::move(cache)), memo(memoCapacity),
          timeoutSeconds(timeoutSeconds > 0 ? timeoutSeconds : DEFAULT_GEOCODE_TIMEOUT_SECONDS),
          sleeper([](std::chrono::seconds s) { std::this_thread::sleep_for(s); })
    {
    }

    void LocationResolver::setSleeper(const Sleeper &s)
    {
        sleeper = s;
    }

    bool LocationResolver::isGeocodingEnabled() const
    {
        return geocoder != nullptr;
    }

    size_t LocationResolver::memoSize() const
    {
        return memo.size();
    }

    std::string LocationResolver::placeNameFromAddress(const json &address)
    {
        static const char *priority[] = {"city", "town", "village", "suburb", "state", "county"};

        if (!address.is_object())
            return UNKNOWN_LOCATION;

        for (const char *k : priority)
        {
            if (address.contains(k) && address[k].is_string())
            {
                std::string name = address[k].get<std::string>();
                utils::trim(name);
                if (!name.empty())
                    return name;
            }
        }

        return UNKNOWN_LOCATION;
    }

    std::optional<std::string> LocationResolver::cached(double latitude, double longitude, const std::string &key)
    {
        if (auto hit = memo.get(key))
        {
            LOGV << "Memo hit for " << key << ": " << *hit;
            return hit;
        }

        if (!cache)
            return std::nullopt;

        try
        {
            auto hit = cache->lookup(latitude, longitude);
            if (hit)
            {
                LOGD << "Cache hit for " << key << ": " << *hit;
                memo.put(key, *hit);
            }
            return hit;
        }
        catch (const DBException &e)
        {
            LOGW << "Cannot read geocode cache: " << e.what();
            return std::nullopt;
        }
    }

    void LocationResolver::remember(double latitude, double longitude, const std::string &key, const std::string &place)
    {
        if (cache)
        {
            try
            {
                cache->store(latitude, longitude, place);
            }
            catch (const DBException &e)
            {
                // The memo must never hold a value the cache does not
                LOGW << "Cannot write geocode cache: " << e.what();
                return;
            }
        }

        memo.put(key, place);
    }

    std::string LocationResolver::resolve(const std::optional<Coordinate> &coordinate)
    {
        if (!coordinate)
            return UNKNOWN_LOCATION;

        if (!geocoder)
        {
            LOGV << "Geocoding disabled, using " << UNKNOWN_LOCATION;
            return UNKNOWN_LOCATION;
        }

        const double lat = coordinate->latitude;
        const double lon = coordinate->longitude;
        const std::string key = GeocodeCache::coordinateKey(lat, lon);

        if (auto hit = cached(lat, lon, key))
            return *hit;

        for (int attempt = 1; attempt <= GEOCODE_ATTEMPTS; attempt++)
        {
            std::chrono::seconds backoff(0);

            try
            {
                const json address = geocoder->reverse(lat, lon, timeoutSeconds);

                if (address.is_object() && !address.empty())
                {
                    const std::string place = placeNameFromAddress(address);
                    LOGD << "Resolved " << key << " to " << place << " (" << geocoder->name() << ")";
                    remember(lat, lon, key, place);
                    return place;
                }

                LOGD << "Empty geocoding response for " << key << " (attempt " << attempt << "/" << GEOCODE_ATTEMPTS << ")";
                backoff = std::chrono::seconds(GEOCODE_EMPTY_BACKOFF_SECONDS);
            }
            catch (const GeocodeTimeoutException &e)
            {
                LOGW << "Geocoding timed out for " << key << " (attempt " << attempt << "/" << GEOCODE_ATTEMPTS << "): " << e.what();
                backoff = std::chrono::seconds(GEOCODE_TIMEOUT_BACKOFF_SECONDS);
            }
            catch (const AppException &e)
            {
                LOGE << "Geocoding failed for " << key << ": " << e.what();
                break;
            }
            catch (const std::exception &e)
            {
                LOGE << "Unexpected geocoding error for " << key << ": " << e.what();
                break;
            }

            if (attempt < GEOCODE_ATTEMPTS)
                sleeper(backoff);
        }

        return UNKNOWN_LOCATION;
    }

}
