/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PHORG_FS_H
#define PHORG_FS_H

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

#endif // PHORG_FS_H
