/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef PHORG_EXPORT_H
#define PHORG_EXPORT_H

#ifdef _WIN32
    #define PHORG_DLL   __declspec(dllexport)
#else
    #define PHORG_DLL
#endif // _WIN32

// Geocode cache schema version
// Version 1 = coordinates/location/timestamp table
#define PHORG_CACHE_SCHEMA_VERSION 1

#endif // PHORG_EXPORT_H
