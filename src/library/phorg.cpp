/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "phorg.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include <curl/curl.h>
#include <exiv2/exiv2.hpp>

#include "exceptions.h"
#include "logger.h"
#include "utils.h"
#include "version.h"

using namespace phorg;

namespace {

std::once_flag initializationFlag;
std::atomic<bool> interruptRequested(false);

void setupLogging(bool verbose) {
    try {
        const char *logEnv = std::getenv(PHORG_LOG_ENV);

        // PHORG_LOG=1 logs to the default file, any other value is a path
        std::string logFile;
        if (logEnv != nullptr) {
            const std::string v(logEnv);
            logFile = (v.empty() || v == "1") ? LOG_FILE_NAME : v;
        }

        const bool enableVerbose = verbose || std::getenv(PHORG_DEBUG_ENV) != nullptr;

        init_logger(logFile, enableVerbose || !logFile.empty());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    }
}

void onInterrupt(int) {
    interruptRequested.store(true);
}

void setupSignalHandlers() {
    LOGD << "Setting up signal handlers";
    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);
}

void setupLibraries() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOGW << "Cannot initialize CURL, reverse geocoding will fail";
    }

    // Must run once before Exiv2 is used from multiple threads
    Exiv2::XmpParser::initialize();

#ifdef EXV_ENABLE_BMFF
    // HEIC/HEIF
    Exiv2::enableBMFF(true);
#endif

    if (!is_logger_verbose()) {
        Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
    }
}

}

namespace phorg {

void registerProcess(bool verbose) {
    std::call_once(initializationFlag, [verbose]() {
        setupLogging(verbose);
        LOGD << "Initializing phorg process";

        setupLibraries();
        setupSignalHandlers();

        utils::printVersions();
    });
}

const char* getVersion() {
    return APP_VERSION;
}

bool isInterrupted() {
    return interruptRequested.load();
}

void setInterrupted(bool interrupted) {
    interruptRequested.store(interrupted);
}

int exitCode(const std::exception &e) {
    if (dynamic_cast<const InterruptedException *>(&e) != nullptr) return 128 + SIGINT;
    return EXIT_FAILURE;
}

}
