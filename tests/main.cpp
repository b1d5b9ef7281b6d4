/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <gtest/gtest.h>
#include "logger.h"
#include "phorg.h"
#include "utils.h"
#include "testarea.h"

namespace {

// Removes flag from argv
// @return true if it was present
bool consumeFlag(int &argc, char **argv, const char *flag) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], flag) != 0) continue;

        for (int j = i; j < argc - 1; j++) argv[j] = argv[j + 1];
        argc--;
        return true;
    }
    return false;
}

void printUsage() {
    std::cout << "phorg test runner\n"
              << "Usage: phorgtest [options] [gtest_options]\n\n"
              << "Options:\n"
              << "  --clean-testdata    Remove every test area and exit (or continue if gtest options follow)\n"
              << "  --gtest_filter=PATTERN    Run only tests matching the pattern\n";
}

}

int main(int argc, char **argv) {
    if (consumeFlag(argc, argv, "--help") || consumeFlag(argc, argv, "-h")) {
        printUsage();
        return 0;
    }

    // Tests must never reach a real geocoding service
    unsetenv(PHORG_API_KEY_ENV);

    registerProcess(true);

    if (consumeFlag(argc, argv, "--clean-testdata")) {
        TestArea::clearAll();
        if (argc == 1) return 0;
    }

    const auto start = std::chrono::steady_clock::now();

    ::testing::InitGoogleTest(&argc, argv);
    const int res = RUN_ALL_TESTS();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    std::cout << "Tests finished in " << phorg::utils::toHumanReadableTime(elapsed) << std::endl;

    return res;
}
