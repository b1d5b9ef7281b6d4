/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef DESTINATION_H
#define DESTINATION_H

#include <string>

#include "capturedate.h"
#include "fs.h"
#include "phorg_export.h"

namespace phorg
{

    // Computes <root>/<YYYY>/<MM-MonthName>/[<DD>/]<place>/<filename>
    class DestinationPathBuilder
    {
        fs::path outputRoot;
        bool includeDay;

    public:
        PHORG_DLL DestinationPathBuilder(const fs::path &outputRoot, bool includeDay = true);

        // Creates the intermediate directories and reserves the returned
        // path by creating an empty file at it. When <filename> is taken,
        // <stem>_1<ext>, <stem>_2<ext>, ... are tried in order.
        // Reservation is atomic (O_EXCL), so concurrent workers never
        // receive the same path. The caller must overwrite or remove it.
        PHORG_DLL fs::path build(const CaptureDate &date, const std::string &place, const fs::path &originalFile) const;

        // Directory part only, no side effects
        PHORG_DLL fs::path directoryFor(const CaptureDate &date, const std::string &place) const;

        // "06-June"
        PHORG_DLL static std::string monthFolder(int month);

        // Place names come from the network, keep them to a single path component
        PHORG_DLL static std::string sanitizeFolderName(const std::string &name);
    };

}

#endif // DESTINATION_H
