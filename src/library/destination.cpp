/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "destination.h"

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "mio.h"
#include "utils.h"

namespace phorg
{

    DestinationPathBuilder::DestinationPathBuilder(const fs::path &outputRoot, bool includeDay)
        : outputRoot(outputRoot), includeDay(includeDay)
    {
    }

    std::string DestinationPathBuilder::monthFolder(int month)
    {
        static const char *names[] = {"January", "February", "March", "April", "May", "June",
                                      "July", "August", "September", "October", "November", "December"};

        if (month < 1 || month > 12)
            throw InvalidArgsException("Invalid month " + std::to_string(month));

        return utils::stringFormat("%02d-%s", month, names[month - 1]);
    }

    std::string DestinationPathBuilder::sanitizeFolderName(const std::string &name)
    {
        std::string s = name;
        for (auto &c : s)
        {
            if (c == '/' || c == '\\' || c == '\0')
                c = '-';
        }
        utils::trim(s);

        if (s.empty() || s == "." || s == "..")
            return UNKNOWN_LOCATION;
        return s;
    }

    fs::path DestinationPathBuilder::directoryFor(const CaptureDate &date, const std::string &place) const
    {
        fs::path dir = outputRoot / utils::stringFormat("%04lld", static_cast<long long>(date.year())) / monthFolder(date.month());
        if (includeDay)
            dir /= utils::stringFormat("%02d", date.day());
        return dir / sanitizeFolderName(place);
    }

    fs::path DestinationPathBuilder::build(const CaptureDate &date, const std::string &place, const fs::path &originalFile) const
    {
        const fs::path dir = directoryFor(date, place);
        io::createDirectories(dir);

        const fs::path filename = originalFile.filename();
        if (filename.empty())
            throw InvalidArgsException("Cannot build a destination for " + originalFile.string());

        fs::path candidate = dir / filename;
        const std::string stem = filename.stem().string();
        const std::string ext = filename.extension().string();

        for (unsigned long i = 1; !io::createExclusive(candidate); i++)
        {
            candidate = dir / (stem + "_" + std::to_string(i) + ext);
        }

        LOGV << originalFile.string() << " -> " << candidate.string();
        return candidate;
    }

}
