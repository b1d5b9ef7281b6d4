/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PHORG_SQLITE_DATABASE_H
#define PHORG_SQLITE_DATABASE_H

#include <sqlite3.h>

#include <string>
#include <memory>

#include "statement.h"
#include "fs.h"
#include "phorg_export.h"

namespace phorg{

class SqliteDatabase {
    sqlite3 *db;
    std::string openFile;
  public:
    PHORG_DLL SqliteDatabase();
    PHORG_DLL SqliteDatabase &open(const std::string &file);
    PHORG_DLL SqliteDatabase &close();
    PHORG_DLL SqliteDatabase &exec(const std::string &sql);
    PHORG_DLL int changes();

    // How long a connection waits on a locked database before giving up
    PHORG_DLL void setBusyTimeout(int milliseconds);
    PHORG_DLL void setJournalMode(const std::string &mode);

    // PRAGMA user_version, used as the schema version
    PHORG_DLL int getUserVersion();
    PHORG_DLL void setUserVersion(int version);

    PHORG_DLL std::unique_ptr<Statement> query(const std::string &query) const;

    SqliteDatabase(const SqliteDatabase &) = delete;
    SqliteDatabase &operator=(const SqliteDatabase &) = delete;

    PHORG_DLL virtual ~SqliteDatabase();
};

}

#endif // PHORG_SQLITE_DATABASE_H
