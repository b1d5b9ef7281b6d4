/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include <assert.h>
#include "statement.h"
#include "exceptions.h"
#include "logger.h"

namespace phorg{

Statement::Statement(sqlite3 *db, const std::string &query)
    : db(db), query(query), hasRow(false), done(false), stmt(nullptr) {
    if (sqlite3_prepare_v2(db, query.c_str(), static_cast<int>(query.length()), &stmt, nullptr) != SQLITE_OK) {
        throw SQLException("Cannot prepare SQL statement: " + query + " (" + sqlite3_errmsg(db) + ")");
    }

    LOGV << "Prepared " << query;
}

void Statement::bindCheck(int ret) {
    if (ret != SQLITE_OK) {
        throw SQLException("Cannot bind value for " + query + ": " + sqlite3_errstr(ret));
    }
}

Statement::~Statement() {
    if (stmt != nullptr) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }
}

Statement &Statement::bind(int paramNum, const std::string &value) {
    assert(stmt != nullptr && db != nullptr);
    bindCheck(sqlite3_bind_text(stmt, paramNum, value.c_str(), static_cast<int>(value.length()), SQLITE_TRANSIENT));
    return *this;
}

Statement &Statement::step() {
    assert(stmt != nullptr);

    const int code = sqlite3_step(stmt);
    if (code == SQLITE_ROW) {
        hasRow = true;
    } else if (code == SQLITE_DONE) {
        hasRow = false;
        done = true;
    } else if (code == SQLITE_BUSY || code == SQLITE_LOCKED) {
        // Another worker or process kept the database locked past the busy timeout
        throw DBException("Database is locked while running " + query);
    } else {
        throw SQLException("Cannot execute " + query + ": " + sqlite3_errmsg(db) + " (" + std::to_string(code) + ")");
    }

    return *this;
}

bool Statement::fetch() {
    this->step();
    return hasRow;
}

int Statement::getInt(int columnId) {
    assert(stmt != nullptr);
    return sqlite3_column_int(stmt, columnId);
}

long long Statement::getInt64(int columnId) {
    assert(stmt != nullptr);
    return sqlite3_column_int64(stmt, columnId);
}

std::string Statement::getText(int columnId) {
    assert(stmt != nullptr);
    const unsigned char *text = sqlite3_column_text(stmt, columnId);
    if (text == nullptr) return "";
    return std::string(reinterpret_cast<const char*>(text));
}

bool Statement::isNull(int columnId){
    assert(stmt != nullptr);
    return sqlite3_column_type(stmt, columnId) == SQLITE_NULL;
}

void Statement::reset() {
    assert(stmt != nullptr);

    // sqlite3_reset repeats the error of a failed step, which was already reported
    sqlite3_reset(stmt);
    if (sqlite3_clear_bindings(stmt) != SQLITE_OK) {
        throw SQLException("Cannot clear bindings of " + query);
    }

    done = false;
    hasRow = false;
}

void Statement::execute() {
    fetch();
    reset();
}

}
