/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#ifndef UTILS_H
#define UTILS_H

#include <memory>
#include <iostream>
#include <chrono>
#include <algorithm>
#include <sstream>
#include <cstdio>
#include <cctype>
#include <string>
#include <vector>
#include <cmath>
#include "exceptions.h"
#include "logger.h"
#include "fs.h"
#include "phorg_export.h"

namespace phorg{
namespace utils{

static inline void toLower(std::string &s) {
    std::transform(s.begin(), s.end(), s.begin(),[](int ch) {
        return std::tolower(ch);
    });
}

static inline void toUpper(std::string &s) {
    std::transform(s.begin(), s.end(), s.begin(),[](int ch) {
        return std::toupper(ch);
    });
}

static inline void ltrim(std::string &s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
        return !std::isspace(ch);
    }));
}

static inline void rtrim(std::string &s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

static inline void trim(std::string &s) {
    ltrim(s);
    rtrim(s);
}

// https://stackoverflow.com/questions/2342162/stdstring-formatting-like-sprintf/25440014
template<typename ... Args>
std::string stringFormat( const std::string& format, Args ... args ) {
    size_t size = snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
    std::unique_ptr<char[]> buf( new char[ size ] );
    snprintf( buf.get(), size, format.c_str(), args ... );
    return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

// Shortest decimal representation that round-trips to the same double
PHORG_DLL std::string shortestDouble(double value);

// Splits "jpg, .MOV,png" into {"jpg", "mov", "png"}
PHORG_DLL std::vector<std::string> parseExtensionList(const std::string &list);

PHORG_DLL std::string toHumanReadableTime(long long milliseconds);

PHORG_DLL void printVersions();

}
}

#endif // UTILS_H
