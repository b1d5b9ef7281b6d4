/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef COORDINATES_H
#define COORDINATES_H

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "json.h"
#include "phorg_export.h"

namespace phorg
{

    struct Rational
    {
        long long numerator;
        long long denominator;

        PHORG_DLL Rational() : numerator(0), denominator(1) {}
        PHORG_DLL Rational(long long numerator, long long denominator) : numerator(numerator), denominator(denominator) {}
    };

    // Signed decimal degrees, positive = North/East
    struct Coordinate
    {
        double latitude;
        double longitude;

        PHORG_DLL Coordinate() : latitude(0), longitude(0) {}
        PHORG_DLL Coordinate(double latitude, double longitude) : latitude(latitude), longitude(longitude) {}
    };
    inline std::ostream &operator<<(std::ostream &os, const Coordinate &c)
    {
        os << c.latitude << ", " << c.longitude;
        return os;
    }

    // degrees + minutes / 60 + seconds / 3600
    // Throws MalformedCoordinateException if there are fewer than
    // 3 components or a denominator is zero
    PHORG_DLL double dmsToDecimal(const std::vector<Rational> &dms);

    // "S" negates the latitude, "W" forces the longitude negative
    // (-|lon|) regardless of its sign. References are case insensitive.
    // Throws MalformedCoordinateException if the result is out of range
    PHORG_DLL Coordinate applyReferences(double latitude, const std::string &latitudeRef,
                                         double longitude, const std::string &longitudeRef);

    PHORG_DLL Coordinate convertCoordinate(const std::vector<Rational> &latitude, const std::string &latitudeRef,
                                           const std::vector<Rational> &longitude, const std::string &longitudeRef);

    // Reads the GPS position from raw metadata. Latitude/longitude can be
    // either DMS rational triples ([[num, den], [num, den], [num, den]])
    // or plain decimal numbers.
    // @return std::nullopt if the metadata has no GPS position
    PHORG_DLL std::optional<Coordinate> extractCoordinate(const json &metadata);

    // Parses an ISO 6709 location string ("+48.8566+002.3522+035.000/")
    PHORG_DLL bool parseIso6709(const std::string &location, Coordinate &coordinate);

}

#endif // COORDINATES_H
