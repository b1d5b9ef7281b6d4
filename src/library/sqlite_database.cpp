/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <string>

#include "logger.h"
#include "exceptions.h"
#include "sqlite_database.h"
#include "utils.h"

namespace phorg{

SqliteDatabase::SqliteDatabase() : db(nullptr) {}

SqliteDatabase &SqliteDatabase::open(const std::string &file) {
    if (db != nullptr) throw DBException("Can't open database " + file + ", one is already open (" + openFile + ")");
    LOGV << "Opening connection to " << file;
    if (sqlite3_open(file.c_str(), &db) != SQLITE_OK) {
        std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw DBException("Can't open database: " + file + " (" + error + ")");
    }

    this->openFile = file;

    return *this;
}

SqliteDatabase &SqliteDatabase::close() {
    if (db != nullptr) {
        LOGV << "Closing connection to " << openFile;
        sqlite3_close(db);
        db = nullptr;
    }

    return *this;
}

SqliteDatabase &SqliteDatabase::exec(const std::string &sql) {
    if (db == nullptr) throw DBException("Can't execute SQL: " + sql + ", db is not open");

    char *errMsg = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK ) {
        std::string error(errMsg != nullptr ? errMsg : "unknown error");
        sqlite3_free(errMsg);
        throw SQLException(error);
    }

    return *this;
}

// @return  the number of rows modified, inserted or deleted by the
// most recently completed INSERT, UPDATE or DELETE statement
int SqliteDatabase::changes(){
    return sqlite3_changes(db);
}

void SqliteDatabase::setBusyTimeout(int milliseconds){
    if (db == nullptr) throw DBException("Can't set busy timeout, db is not open");
    sqlite3_busy_timeout(db, milliseconds);
}

void SqliteDatabase::setJournalMode(const std::string &mode){
    auto q = query("PRAGMA journal_mode=" + mode);

    // The pragma answers with the mode actually in effect
    std::string current = q->fetch() ? q->getText(0) : "";
    utils::toUpper(current);
    if (current != mode) LOGD << "Journal mode of " << openFile << " is " << current << ", not " << mode;
}

int SqliteDatabase::getUserVersion(){
    auto q = query("PRAGMA user_version");
    return q->fetch() ? q->getInt(0) : 0;
}

void SqliteDatabase::setUserVersion(int version){
    exec("PRAGMA user_version = " + std::to_string(version));
}

std::unique_ptr<Statement> SqliteDatabase::query(const std::string &query) const{
    if (db == nullptr) throw DBException("Can't query: " + query + ", db is not open");
    return std::make_unique<Statement>(db, query);
}

SqliteDatabase::~SqliteDatabase() {
    this->close();
}

}
