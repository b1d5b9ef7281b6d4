/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "coordinates.h"

#include <cmath>
#include <regex>

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace phorg
{

    double dmsToDecimal(const std::vector<Rational> &dms)
    {
        if (dms.size() < 3)
            throw MalformedCoordinateException("Expected degrees, minutes and seconds, got " + std::to_string(dms.size()) + " components");

        double parts[3];
        for (size_t i = 0; i < 3; i++)
        {
            if (dms[i].denominator == 0)
                throw MalformedCoordinateException("Zero denominator in GPS rational " + std::to_string(dms[i].numerator) + "/0");
            parts[i] = static_cast<double>(dms[i].numerator) / static_cast<double>(dms[i].denominator);
        }

        return parts[0] + parts[1] / 60.0 + parts[2] / 3600.0;
    }

    Coordinate applyReferences(double latitude, const std::string &latitudeRef,
                               double longitude, const std::string &longitudeRef)
    {
        std::string latRef = latitudeRef;
        std::string lonRef = longitudeRef;
        utils::trim(latRef);
        utils::trim(lonRef);
        utils::toUpper(latRef);
        utils::toUpper(lonRef);

        if (latRef == "S")
            latitude = -latitude;
        if (lonRef == "W")
            longitude = -std::fabs(longitude);

        if (!std::isfinite(latitude) || !std::isfinite(longitude) ||
            latitude < -90.0 || latitude > 90.0 || longitude < -180.0 || longitude > 180.0)
        {
            throw MalformedCoordinateException("GPS position out of range: " + utils::shortestDouble(latitude) + ", " + utils::shortestDouble(longitude));
        }

        return Coordinate(latitude, longitude);
    }

    Coordinate convertCoordinate(const std::vector<Rational> &latitude, const std::string &latitudeRef,
                                 const std::vector<Rational> &longitude, const std::string &longitudeRef)
    {
        return applyReferences(dmsToDecimal(latitude), latitudeRef, dmsToDecimal(longitude), longitudeRef);
    }

    namespace
    {

        std::vector<Rational> toRationals(const json &value, const char *key)
        {
            std::vector<Rational> result;
            for (const auto &component : value)
            {
                if (!component.is_array() || component.size() != 2 ||
                    !component[0].is_number_integer() || !component[1].is_number_integer())
                {
                    throw MalformedCoordinateException(std::string("Invalid rational in ") + key + ": " + component.dump());
                }
                result.emplace_back(component[0].get<long long>(), component[1].get<long long>());
            }
            return result;
        }

        double toDecimal(const json &value, const char *key)
        {
            if (value.is_number())
                return value.get<double>();
            if (value.is_array())
                return dmsToDecimal(toRationals(value, key));

            throw MalformedCoordinateException(std::string("Unexpected value for ") + key + ": " + value.dump());
        }

        std::string reference(const json &metadata, const char *key, const char *defaultValue)
        {
            if (metadata.contains(key) && metadata[key].is_string())
                return metadata[key].get<std::string>();
            return defaultValue;
        }

    }

    std::optional<Coordinate> extractCoordinate(const json &metadata)
    {
        if (!metadata.is_object() || !metadata.contains(META_GPS_LATITUDE) || !metadata.contains(META_GPS_LONGITUDE))
        {
            LOGV << "Missing required GPS coordinates";
            return std::nullopt;
        }

        const double latitude = toDecimal(metadata[META_GPS_LATITUDE], META_GPS_LATITUDE);
        const double longitude = toDecimal(metadata[META_GPS_LONGITUDE], META_GPS_LONGITUDE);

        const std::string latRef = reference(metadata, META_GPS_LATITUDE_REF, "N");
        const std::string lonRef = reference(metadata, META_GPS_LONGITUDE_REF, "E");

        LOGV << "Raw latitude: " << latitude << " (" << latRef << "), raw longitude: " << longitude << " (" << lonRef << ")";

        return applyReferences(latitude, latRef, longitude, lonRef);
    }

    bool parseIso6709(const std::string &location, Coordinate &coordinate)
    {
        static const std::regex iso6709(R"(^\s*([+-]\d+(?:\.\d+)?)([+-]\d+(?:\.\d+)?))");

        std::smatch match;
        if (!std::regex_search(location, match, iso6709))
            return false;

        try
        {
            const double latitude = std::stod(match[1].str());
            const double longitude = std::stod(match[2].str());
            if (latitude < -90.0 || latitude > 90.0 || longitude < -180.0 || longitude > 180.0)
                return false;

            coordinate = Coordinate(latitude, longitude);
            return true;
        }
        catch (const std::logic_error &)
        {
            return false;
        }
    }

}
