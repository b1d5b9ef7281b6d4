/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PHORG_CMDLIST_H
#define PHORG_CMDLIST_H

#include <map>
#include <string>
#include "command.h"

namespace cmd {

  // Command name => handler, in the order shown by --help
  extern std::map<std::string, Command*> commands;

  // Short name => command name
  extern std::map<std::string, std::string> aliases;

  // Resolves a command name or one of its aliases
  // @return nullptr if nothing matches
  Command *findCommand(const std::string &name);

}

#endif // PHORG_CMDLIST_H
