/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "geocache.h"

#include "constants.h"
#include "exceptions.h"
#include "logger.h"
#include "mio.h"
#include "utils.h"

namespace phorg{

GeocodeCache::GeocodeCache(const fs::path &dbPath) : dbPath(dbPath){
    if (dbPath.has_parent_path()) io::assureFolderExists(dbPath.parent_path());

    SqliteDatabase db;
    connect(db);

    const int version = db.getUserVersion();
    if (version > PHORG_CACHE_SCHEMA_VERSION)
        throw DBException(dbPath.string() + " was written by a newer version of phorg (schema " +
                          std::to_string(version) + "), use a different --cache-file");

    try{
        db.setJournalMode("WAL");
    }catch(const SQLException &e){
        LOGD << "Cannot enable WAL journal on " << dbPath.string() << ": " << e.what();
    }

    db.exec("CREATE TABLE IF NOT EXISTS geocoding_cache ("
            "  coordinates TEXT PRIMARY KEY,"
            "  location TEXT,"
            "  timestamp DATETIME DEFAULT CURRENT_TIMESTAMP"
            ")");
    if (version < PHORG_CACHE_SCHEMA_VERSION) db.setUserVersion(PHORG_CACHE_SCHEMA_VERSION);

    LOGD << "Geocode cache ready at " << dbPath.string();
}

void GeocodeCache::connect(SqliteDatabase &db) const{
    db.open(dbPath.string());
    db.setBusyTimeout(CACHE_BUSY_TIMEOUT);
}

std::optional<std::string> GeocodeCache::lookup(double latitude, double longitude) const{
    SqliteDatabase db;
    connect(db);

    auto q = db.query("SELECT location FROM geocoding_cache WHERE coordinates = ?");
    q->bind(1, coordinateKey(latitude, longitude));

    if (q->fetch() && !q->isNull(0)) return q->getText(0);
    return std::nullopt;
}

void GeocodeCache::store(double latitude, double longitude, const std::string &location) const{
    SqliteDatabase db;
    connect(db);

    auto q = db.query("INSERT OR REPLACE INTO geocoding_cache (coordinates, location) VALUES (?, ?)");
    q->bind(1, coordinateKey(latitude, longitude));
    q->bind(2, location);
    q->execute();
}

long long GeocodeCache::count() const{
    SqliteDatabase db;
    connect(db);

    auto q = db.query("SELECT COUNT(*) FROM geocoding_cache");
    if (q->fetch()) return q->getInt64(0);
    return 0;
}

void GeocodeCache::clear() const{
    SqliteDatabase db;
    connect(db);
    db.exec("DELETE FROM geocoding_cache");
    LOGD << "Cleared " << db.changes() << " cached locations";
}

fs::path GeocodeCache::getPath() const{
    return dbPath;
}

std::string GeocodeCache::coordinateKey(double latitude, double longitude){
    return utils::shortestDouble(latitude) + "," + utils::shortestDouble(longitude);
}

}
