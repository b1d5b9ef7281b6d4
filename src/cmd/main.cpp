/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstdlib>
#include <cstring>
#include <iostream>

#include "cmd/cmdlist.h"
#include "logger.h"
#include "exceptions.h"
#include "phorg.h"

using namespace std;
using namespace phorg;

[[ noreturn ]] void printHelp(char *argv[], int status = EXIT_SUCCESS) {
    std::cout << "phorg v" << getVersion() << " - Sort photos and videos by date and place" << std::endl <<
              "Usage:" << std::endl <<
              "	" << argv[0] << " <command> [args]" << std::endl << std::endl <<
              "Commands:" << std::endl;
    for (auto &cmd : cmd::commands){
        std::cout << "	" << cmd.first << " - " << cmd.second->description() << std::endl;
    }
    std::cout << std::endl <<
              "	-h, --help		Print help" << std::endl <<
              "	--version		Print version" << std::endl << std::endl <<
              "For detailed command help use: " << argv[0] << " <command> --help " << std::endl <<
              "Set " PHORG_API_KEY_ENV " to enable reverse geocoding." << std::endl;
    exit(status);
}

bool hasParam(int argc, char *argv[], const char* param) {
    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], param) == 0) return true;
    }
    return false;
}


int main(int argc, char* argv[]) {
    registerProcess(hasParam(argc, argv, "--debug"));

    if (argc <= 1) printHelp(argv, EXIT_FAILURE);

    std::string cmdKey = std::string(argv[1]);

    if (cmdKey == "--help" || cmdKey == "-h") {
        printHelp(argv);
    }

    if (hasParam(argc, argv, "--version")) {
        std::cout << getVersion() << std::endl;
        return 0;
    }

    cmd::Command *command = cmd::findCommand(cmdKey);
    if (command == nullptr) {
        std::cerr << "Unknown command: " << cmdKey << std::endl << std::endl;
        printHelp(argv, EXIT_FAILURE);
    }

    try {
        // Run command
        argv[1] = argv[0];
        command->run(argc - 1, argv + 1);
    } catch (const AppException &exception) {
        std::cerr << exception.what() << std::endl;
        return exitCode(exception);
    }

    return 0;
}
