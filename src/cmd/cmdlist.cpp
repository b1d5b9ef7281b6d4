/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "cmdlist.h"
#include "organize.h"
#include "cache.h"
#include "meta.h"

namespace cmd {

  std::map<std::string, Command*> commands = {
      {"organize", new Organize()},
      {"cache", new Cache()},
      {"meta", new Meta()}
  };

  std::map<std::string, std::string> aliases = {
      {"org", "organize"},
      {"o", "organize"},
      {"m", "meta"},
      {"info", "meta"}
  };

  Command *findCommand(const std::string &name) {
      auto alias = aliases.find(name);
      const std::string &key = alias != aliases.end() ? alias->second : name;

      auto it = commands.find(key);
      return it != commands.end() ? it->second : nullptr;
  }

}
