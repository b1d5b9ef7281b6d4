/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PHORG_JSON_H
#define PHORG_JSON_H

#include <nlohmann/json.hpp>

// Raw metadata maps, geocoder payloads and `meta --format json` output
using json = nlohmann::json;

#endif // PHORG_JSON_H
