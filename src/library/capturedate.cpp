/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "capturedate.h"

#include <algorithm>
#include <chrono>
#include <regex>

#include <fcntl.h>
#include <sys/stat.h>

#include <cctz/time_zone.h>

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace phorg
{

    namespace
    {

        // Formats written by cameras and phones, tried first
        const char *exifFormats[] = {"%Y:%m:%d %H:%M:%S",
                                     "%Y-%m-%d %H:%M:%S",
                                     "%Y:%m:%d %H:%M:%E*S",
                                     "%Y-%m-%d %H:%M:%E*S"};

        const char *freeFormats[] = {"%Y-%m-%d %H:%M:%E*S",
                                     "%Y-%m-%d %H:%M",
                                     "%Y/%m/%d %H:%M:%E*S",
                                     "%Y/%m/%d %H:%M",
                                     "%Y.%m.%d %H:%M:%E*S",
                                     "%Y:%m:%d",
                                     "%Y-%m-%d",
                                     "%Y/%m/%d",
                                     "%Y.%m.%d",
                                     "%m/%d/%Y %H:%M:%E*S",
                                     "%m/%d/%Y",
                                     "%d %b %Y %H:%M:%E*S",
                                     "%d %b %Y",
                                     "%b %d %Y %H:%M:%E*S",
                                     "%b %d, %Y %H:%M:%E*S",
                                     "%b %d %Y",
                                     "%b %d, %Y",
                                     "%a %b %d %H:%M:%E*S %Y",
                                     "%a, %d %b %Y %H:%M:%E*S"};

        bool parseWith(const char *format, const std::string &input, CaptureDate &out)
        {
            const cctz::time_zone utc = cctz::utc_time_zone();
            std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds> tp;

            if (!cctz::parse(format, input, utc, &tp))
                return false;

            out = cctz::convert(tp, utc);
            return true;
        }

        CaptureDate toLocal(time_t t)
        {
            return cctz::convert(std::chrono::system_clock::from_time_t(t), cctz::local_time_zone());
        }

        // "2021-06-15T10:30:00.5+02:00" -> "2021-06-15 10:30:00.5"
        // The offset is dropped, the wall clock time is what we file by
        std::string normalize(const std::string &timestamp)
        {
            static const std::regex zone(R"(\s*(Z|UTC|GMT|[+-]\d{2}:?\d{2})$)", std::regex::icase);
            static const std::regex isoT(R"(^(\d{4}[-:/.]\d{2}[-:/.]\d{2})T)");

            std::string s = timestamp;
            utils::trim(s);
            s = std::regex_replace(s, isoT, "$1 ");

            // Keep the dash of a plain date such as "2021-06-15"
            if (s.size() > 10)
                s = std::regex_replace(s, zone, "");
            utils::trim(s);
            return s;
        }

        bool parseCompact(const std::string &s, CaptureDate &out)
        {
            static const std::regex compact(R"(^(\d{4})(\d{2})(\d{2})(?:[ _-]?(\d{2})(\d{2})(\d{2}))?$)");

            std::smatch m;
            if (!std::regex_match(s, m, compact))
                return false;

            const int month = std::stoi(m[2].str());
            const int day = std::stoi(m[3].str());
            const int hour = m[4].matched ? std::stoi(m[4].str()) : 0;
            const int minute = m[5].matched ? std::stoi(m[5].str()) : 0;
            const int second = m[6].matched ? std::stoi(m[6].str()) : 0;

            if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
                return false;

            out = CaptureDate(std::stoi(m[1].str()), month, day, hour, minute, second);

            // Reject dates that cctz had to normalize (Feb 30 and such)
            return out.month() == month && out.day() == day;
        }

    }

    CaptureDate DateResolver::parseTimestamp(const std::string &timestamp)
    {
        CaptureDate d;

        for (const char *format : exifFormats)
        {
            if (parseWith(format, timestamp, d))
                return d;
        }

        const std::string s = normalize(timestamp);
        if (!s.empty())
        {
            for (const char *format : freeFormats)
            {
                if (parseWith(format, s, d))
                {
                    LOGV << "Parsed \"" << timestamp << "\" with free-form format " << format;
                    return d;
                }
            }

            if (parseCompact(s, d))
                return d;
        }

        throw UnparseableDateException("Cannot parse date \"" + timestamp + "\"");
    }

    std::optional<CaptureDate> DateResolver::fromMetadata(const json &metadata)
    {
        if (!metadata.is_object())
            return std::nullopt;

        static const char *keys[] = {META_DATETIME_ORIGINAL, META_CREATION_DATE, META_DATETIME};

        for (const char *k : keys)
        {
            if (!metadata.contains(k) || !metadata[k].is_string())
                continue;

            std::string value = metadata[k].get<std::string>();
            utils::trim(value);
            if (value.empty())
                continue;

            LOGV << "Using " << k << " = " << value;
            return parseTimestamp(value);
        }

        return std::nullopt;
    }

    std::optional<CaptureDate> DateResolver::fromFilesystem(const fs::path &file)
    {
        struct stat st;
        if (stat(file.c_str(), &st) != 0)
        {
            LOGD << "Cannot stat " << file.string();
            return std::nullopt;
        }

        return toLocal(std::min(st.st_mtime, st.st_ctime));
    }

    std::optional<CaptureDate> DateResolver::fromCreationTime(const fs::path &file)
    {
#ifdef STATX_BTIME
        struct statx stx;
        if (statx(AT_FDCWD, file.c_str(), 0, STATX_BTIME, &stx) == 0 && (stx.stx_mask & STATX_BTIME))
            return toLocal(static_cast<time_t>(stx.stx_btime.tv_sec));
#else
        LOGV << "Creation time is not available on this platform";
#endif
        return std::nullopt;
    }

    CaptureDate DateResolver::resolve(const fs::path &file, const json &metadata)
    {
        try
        {
            if (auto d = fromMetadata(metadata))
                return *d;
            LOGD << "No capture date in metadata of " << file.filename().string();
        }
        catch (const UnparseableDateException &e)
        {
            LOGD << e.what() << ", falling back to filesystem dates for " << file.string();
        }

        if (auto d = fromFilesystem(file))
            return *d;

        if (auto d = fromCreationTime(file))
            return *d;

        LOGW << "Cannot determine any date for " << file.string() << ", using the current time";
        return toLocal(time(nullptr));
    }

    std::string DateResolver::toString(const CaptureDate &date)
    {
        return utils::stringFormat("%04lld-%02d-%02d %02d:%02d:%02d",
                                   static_cast<long long>(date.year()), date.month(), date.day(),
                                   date.hour(), date.minute(), date.second());
    }

}
