/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PHORG_H
#define PHORG_H

#include <exception>

#include "phorg_export.h"

#define PHORG_LOG_ENV "PHORG_LOG"
#define PHORG_DEBUG_ENV "PHORG_DEBUG"
#define PHORG_API_KEY_ENV "PHORG_GEOCODING_API_KEY"
#define PHORG_PROFILE_ENV "PHORG_PROFILE_DIR"

#define PHORG_FOLDER ".phorg"
#define GEOCODE_CACHE_FILE_NAME "geocoding_cache.db"

namespace phorg {

/** This must be called as the very first function
 * of every phorg process/program
 * @param verbose whether the program should output debug messages to stdout */
PHORG_DLL void registerProcess(bool verbose = false);

/** Get library version */
PHORG_DLL const char* getVersion();

/** @return true once the user has asked the process to stop (SIGINT/SIGTERM) */
PHORG_DLL bool isInterrupted();

// Same as receiving SIGINT. false clears a pending request
PHORG_DLL void setInterrupted(bool interrupted = true);

// Process exit status for an error that ended a command:
// 130 (128 + SIGINT) after an interruption, EXIT_FAILURE otherwise
PHORG_DLL int exitCode(const std::exception &e);

}

#endif // PHORG_H
