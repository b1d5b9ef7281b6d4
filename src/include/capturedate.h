/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CAPTUREDATE_H
#define CAPTUREDATE_H

#include <optional>
#include <string>

#include <cctz/civil_time.h>

#include "fs.h"
#include "json.h"
#include "phorg_export.h"

namespace phorg
{

    // Wall clock time a file was taken, no timezone attached
    typedef cctz::civil_second CaptureDate;

    class DateResolver
    {
    public:
        // Never fails. Tries in order: the embedded capture timestamp,
        // the earlier of the file's modification and status change time,
        // the file's creation time, the current time.
        PHORG_DLL static CaptureDate resolve(const fs::path &file, const json &metadata);

        // Picks DateTimeOriginal, then CreationDate, then DateTime
        // @return std::nullopt if the metadata carries no timestamp
        // Throws UnparseableDateException if the timestamp cannot be parsed
        PHORG_DLL static std::optional<CaptureDate> fromMetadata(const json &metadata);

        // Tries the EXIF style formats ("2021:06:15 10:30:00", optionally
        // with fractional seconds or dashes), then a best-effort free-form parse.
        // Throws UnparseableDateException
        PHORG_DLL static CaptureDate parseTimestamp(const std::string &timestamp);

        // min(mtime, ctime) in local time
        PHORG_DLL static std::optional<CaptureDate> fromFilesystem(const fs::path &file);

        // Birth time in local time, where the filesystem records one
        PHORG_DLL static std::optional<CaptureDate> fromCreationTime(const fs::path &file);

        // "YYYY-MM-DD HH:MM:SS"
        PHORG_DLL static std::string toString(const CaptureDate &date);
    };

}

#endif // CAPTUREDATE_H
