/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "geocoder.h"

#include <cpr/cpr.h>

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "utils.h"
#include "version.h"

namespace phorg
{

    namespace
    {

        void checkResponse(const cpr::Response &res, const std::string &service)
        {
            if (res.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT)
                throw GeocodeTimeoutException(service + " request timed out: " + res.error.message);

            if (res.error)
                throw GeocodeException(service + " request failed: " + res.error.message);

            if (res.status_code != 200)
                throw GeocodeException(service + " returned HTTP " + std::to_string(res.status_code));
        }

        json parseBody(const std::string &body, const std::string &service)
        {
            try
            {
                return json::parse(body);
            }
            catch (const json::exception &e)
            {
                throw GeocodeException("Invalid " + service + " response: " + std::string(e.what()));
            }
        }

        int timeoutMs(int timeoutSeconds)
        {
            return (timeoutSeconds > 0 ? timeoutSeconds : DEFAULT_GEOCODE_TIMEOUT_SECONDS) * 1000;
        }

    }

    NominatimGeocoder::NominatimGeocoder(const std::string &apiKey, const std::string &url)
        : url(url.empty() ? NOMINATIM_DEFAULT_URL : url), apiKey(apiKey)
    {
    }

    json NominatimGeocoder::reverse(double latitude, double longitude, int timeoutSeconds)
    {
        LOGD << "Querying " << url << " for " << latitude << ", " << longitude;

        cpr::Parameters params{{"lat", utils::shortestDouble(latitude)},
                               {"lon", utils::shortestDouble(longitude)},
                               {"format", "jsonv2"},
                               {"addressdetails", "1"},
                               {"accept-language", "en"}};
        if (!apiKey.empty())
            params.Add({"key", apiKey});

        const auto res = cpr::Get(cpr::Url{url}, params,
                                  cpr::Header{{"User-Agent", std::string(APP_NAME "/" APP_VERSION)}},
                                  cpr::Timeout{std::chrono::milliseconds(timeoutMs(timeoutSeconds))});

        checkResponse(res, "Nominatim");
        return parseResponse(res.text);
    }

    json NominatimGeocoder::parseResponse(const std::string &body)
    {
        const json j = parseBody(body, "Nominatim");

        if (!j.is_object())
            throw GeocodeException("Unexpected Nominatim response: " + body);

        // {"error": "Unable to geocode"} means nothing was found
        if (j.contains("error"))
        {
            LOGD << "Nominatim returned no results: " << j["error"].dump();
            return json::object();
        }

        if (!j.contains("address") || !j["address"].is_object())
            return json::object();

        LOGV << "Address components: " << j["address"].dump(2);
        return j["address"];
    }

    GoogleGeocoder::GoogleGeocoder(const std::string &apiKey, const std::string &url)
        : url(url.empty() ? GOOGLE_GEOCODING_DEFAULT_URL : url), apiKey(apiKey)
    {
    }

    json GoogleGeocoder::reverse(double latitude, double longitude, int timeoutSeconds)
    {
        LOGD << "Querying Google Geocoding API for " << latitude << ", " << longitude;

        const auto res = cpr::Get(cpr::Url{url},
                                  cpr::Parameters{{"latlng", utils::shortestDouble(latitude) + "," + utils::shortestDouble(longitude)},
                                                  {"language", "en"},
                                                  {"key", apiKey}},
                                  cpr::Timeout{std::chrono::milliseconds(timeoutMs(timeoutSeconds))});

        checkResponse(res, "Google Geocoding");
        return parseResponse(res.text);
    }

    json GoogleGeocoder::parseResponse(const std::string &body)
    {
        const json j = parseBody(body, "Google Geocoding");

        if (!j.is_object())
            throw GeocodeException("Unexpected Google Geocoding response: " + body);

        const std::string status = j.value("status", "");
        if (status == "ZERO_RESULTS")
            return json::object();
        if (status != "OK")
            throw GeocodeException("Google Geocoding error " + status + ": " + j.value("error_message", ""));

        // Google component type -> flat address key
        static const std::vector<std::pair<std::string, std::string>> typeMap = {
            {"locality", "city"},
            {"postal_town", "town"},
            {"sublocality", "suburb"},
            {"neighborhood", "suburb"},
            {"administrative_area_level_1", "state"},
            {"administrative_area_level_2", "county"},
            {"country", "country"}};

        json address = json::object();
        if (!j.contains("results") || !j["results"].is_array())
            return address;

        // Results go from most to least specific, the first match wins
        for (const auto &result : j["results"])
        {
            if (!result.contains("address_components"))
                continue;

            for (const auto &component : result["address_components"])
            {
                if (!component.contains("types") || !component.contains("long_name"))
                    continue;

                for (const auto &type : component["types"])
                {
                    for (const auto &m : typeMap)
                    {
                        if (type == m.first && !address.contains(m.second))
                            address[m.second] = component["long_name"];
                    }
                }
            }
        }

        LOGV << "Address components: " << address.dump(2);
        return address;
    }

    std::unique_ptr<ReverseGeocoder> createGeocoder(const std::string &backend,
                                                    const std::string &apiKey,
                                                    const std::string &url)
    {
        std::string b = backend;
        utils::toLower(b);

        if (b == "none")
            return nullptr;

        if (b != "nominatim" && b != "google")
            throw InvalidArgsException("Unknown geocoder: " + backend + " (expected nominatim, google or none)");

        if (apiKey.empty())
        {
            LOGW << "No geocoding API key configured, all files will be placed in \"" << UNKNOWN_LOCATION << "\"";
            return nullptr;
        }

        if (b == "google")
            return std::make_unique<GoogleGeocoder>(apiKey, url);
        return std::make_unique<NominatimGeocoder>(apiKey, url);
    }

}
