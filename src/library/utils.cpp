/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "utils.h"

#include <charconv>
#include <clocale>
#include <iomanip>

#include <curl/curl.h>
#include <exiv2/exiv2.hpp>
#include <sqlite3.h>

extern "C" {
#include <libavformat/avformat.h>
}

#include "version.h"

namespace phorg {
namespace utils {

std::string shortestDouble(double value) {
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value);
    if (res.ec != std::errc())
        return stringFormat("%.17g", value);
    return std::string(buf, res.ptr);
}

std::vector<std::string> parseExtensionList(const std::string &list) {
    std::vector<std::string> result;
    std::stringstream ss(list);
    std::string item;

    while (std::getline(ss, item, ',')) {
        trim(item);
        if (!item.empty() && item[0] == '.') item.erase(0, 1);
        if (item.empty()) continue;
        toLower(item);
        if (std::find(result.begin(), result.end(), item) == result.end())
            result.push_back(item);
    }

    return result;
}

std::string toHumanReadableTime(long long milliseconds) {
    std::ostringstream os;

    if (milliseconds < 1000) {
        os << milliseconds << "ms";
        return os.str();
    }

    const long long totalSeconds = milliseconds / 1000;
    const long long hours = totalSeconds / 3600;
    const long long minutes = (totalSeconds % 3600) / 60;
    const double seconds = static_cast<double>(milliseconds % 60000) / 1000.0;

    if (hours > 0) os << hours << "h ";
    if (hours > 0 || minutes > 0) os << minutes << "m ";
    os << std::fixed << std::setprecision(2) << seconds << "s";

    return os.str();
}

PHORG_DLL void printVersions() {
    LOGV << "phorg v" << APP_VERSION;

    LOGV << "SQLite: " << sqlite3_libversion();
    LOGV << "Exiv2: " << Exiv2::versionString();
    LOGV << "CURL: " << curl_version();
    LOGV << "libavformat: " << LIBAVFORMAT_IDENT;

    LOGD << "Current locale (LC_ALL): " << std::setlocale(LC_ALL, nullptr);
}

}
}
