/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "command.h"
#include "logger.h"
#include "exceptions.h"
#include "phorg.h"

namespace cmd {

Command::Command() {
}

cxxopts::Options Command::genOptions(const char *programName){
    cxxopts::Options opts(programName, description() + extendedDescription());
    opts
    .show_positional_help();

    setOptions(opts);
    opts.add_options()
    ("h,help", "Print help")
    ("debug", "Show debug output");

    return opts;
}

void Command::run(int argc, char *argv[]) {
    cxxopts::Options opts = genOptions(argv[0]);

    try{
        auto result = opts.parse(argc, argv);

        if (result.count("help")) {
            printHelp();
        }

        if (result.count("debug")) {
            set_logger_verbose();
        }

        run(result);
    }catch(const cxxopts::OptionParseException &e){
        // Unknown option, missing argument or a value of the wrong type
        usageError(e);
    }catch(const phorg::InvalidArgsException &e){
        usageError(e);
    }catch(const phorg::InterruptedException &e){
        LOGW << e.what();
        exit(phorg::exitCode(e));
    }catch(const phorg::AppException &e){
        std::cerr << e.what() << std::endl;
        exit(phorg::exitCode(e));
    }catch(const std::exception &e){
        // Library errors that escaped the per-file boundary (filesystem, JSON)
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        exit(phorg::exitCode(e));
    }
}

void Command::usageError(const std::exception &e) {
    std::cerr << e.what() << std::endl << std::endl;
    printHelp(std::cerr, false);
    exit(phorg::exitCode(e));
}

void Command::printHelp(std::ostream &out, bool exitAfterPrint) {
    out << genOptions().help({""});
    if (exitAfterPrint) exit(0);
}

}
