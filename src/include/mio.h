/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef MIO_H
#define MIO_H

// "My" I/O library
// io.h was taken :/

#include <ctime>
#include <initializer_list>
#include <string>
#include <vector>
#include "fs.h"
#include "phorg_export.h"

namespace phorg{
namespace io{

class Path{
    fs::path p;

public:
    PHORG_DLL Path(){}
    PHORG_DLL Path(const fs::path &p) : p(p) {}

    // Compares an extension with a list of extension strings
    // @return true if the extension matches one of those in the list
    PHORG_DLL bool checkExtension(const std::initializer_list<std::string>& matches) const;
    PHORG_DLL bool checkExtension(const std::vector<std::string>& matches) const;

    // Lowercase extension without the leading dot ("" if none)
    PHORG_DLL std::string extension() const;

    PHORG_DLL std::string string() const;
    PHORG_DLL fs::path get() const{ return p; }
};

PHORG_DLL fs::path assureFolderExists(const fs::path &d);
PHORG_DLL void createDirectories(const fs::path &d);

// Atomically creates an empty file at p
// @return false if something already exists at p
PHORG_DLL bool createExclusive(const fs::path &p);

// Copies src over dst, carrying over permissions and modification time.
// Parent directories of dst are created as needed.
// Throws CopyException on failure
PHORG_DLL void copyPreservingTimes(const fs::path &src, const fs::path &dst);

// Prints a nice number of bytes (KB, MB, GB, etc)
PHORG_DLL std::string bytesToHuman(std::uintmax_t bytes);

}
}
#endif // MIO_H
