/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef GEOCACHE_H
#define GEOCACHE_H

#include <optional>
#include <string>

#include "fs.h"
#include "sqlite_database.h"
#include "phorg_export.h"

namespace phorg{

// Durable coordinates -> place name store.
// Every call opens (and closes) its own connection, so a single
// instance can be shared by any number of worker threads.
class GeocodeCache {
    fs::path dbPath;

    void connect(SqliteDatabase &db) const;
public:
    PHORG_DLL explicit GeocodeCache(const fs::path &dbPath);

    PHORG_DLL std::optional<std::string> lookup(double latitude, double longitude) const;

    // Overwrites any previous entry for the same coordinates
    PHORG_DLL void store(double latitude, double longitude, const std::string &location) const;

    PHORG_DLL long long count() const;
    PHORG_DLL void clear() const;
    PHORG_DLL fs::path getPath() const;

    // Exact (round-trippable) "lat,lon" key, no rounding
    PHORG_DLL static std::string coordinateKey(double latitude, double longitude);
};

}

#endif // GEOCACHE_H
