/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#ifndef STATEMENT_H
#define STATEMENT_H

#include <sqlite3.h>
#include <string>
#include "logger.h"
#include "phorg_export.h"

namespace phorg{

class Statement {
    sqlite3 *db;
    std::string query;

    bool hasRow;
    bool done;

    sqlite3_stmt *stmt;

    void bindCheck(int ret);
    Statement &step();
  public:
    PHORG_DLL Statement(sqlite3 *db, const std::string &query);
    PHORG_DLL ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    PHORG_DLL Statement &bind(int paramNum, const std::string &value);

    PHORG_DLL bool fetch();

    PHORG_DLL int getInt(int columnId);
    PHORG_DLL long long getInt64(int columnId);
    PHORG_DLL std::string getText(int columnId);
    PHORG_DLL bool isNull(int columnId);

    PHORG_DLL void reset();
    PHORG_DLL void execute();
};

}

#endif // STATEMENT_H
