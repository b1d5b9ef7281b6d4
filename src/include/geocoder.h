/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef GEOCODER_H
#define GEOCODER_H

#include <memory>
#include <string>

#include "json.h"
#include "phorg_export.h"

namespace phorg
{

    // Reverse geocoding backend.
    // reverse() returns a flat object of address components keyed
    // by city, town, village, suburb, state, county (any subset), or an
    // empty object when the service has no result for the position.
    // Throws GeocodeTimeoutException when the attempt timed out and
    // GeocodeException on any other failure.
    class ReverseGeocoder
    {
    public:
        virtual ~ReverseGeocoder() = default;

        virtual json reverse(double latitude, double longitude, int timeoutSeconds) = 0;
        virtual std::string name() const = 0;
    };

    // OpenStreetMap Nominatim (and compatible services such as LocationIQ)
    class NominatimGeocoder : public ReverseGeocoder
    {
        std::string url;
        std::string apiKey;

    public:
        PHORG_DLL NominatimGeocoder(const std::string &apiKey, const std::string &url = "");

        PHORG_DLL json reverse(double latitude, double longitude, int timeoutSeconds) override;
        PHORG_DLL std::string name() const override { return "nominatim"; }

        PHORG_DLL static json parseResponse(const std::string &body);
    };

    // Google Maps Geocoding API
    class GoogleGeocoder : public ReverseGeocoder
    {
        std::string url;
        std::string apiKey;

    public:
        PHORG_DLL GoogleGeocoder(const std::string &apiKey, const std::string &url = "");

        PHORG_DLL json reverse(double latitude, double longitude, int timeoutSeconds) override;
        PHORG_DLL std::string name() const override { return "google"; }

        // Maps address_components onto the flat keys used by Nominatim
        PHORG_DLL static json parseResponse(const std::string &body);
    };

    // @param backend "nominatim", "google" or "none"
    // @return nullptr when geocoding is disabled (backend "none" or no API key)
    PHORG_DLL std::unique_ptr<ReverseGeocoder> createGeocoder(const std::string &backend,
                                                              const std::string &apiKey,
                                                              const std::string &url = "");

}

#endif // GEOCODER_H
