/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#ifndef USERPROFILE_H
#define USERPROFILE_H

#include "fs.h"
#include "logger.h"
#include "phorg_export.h"

namespace phorg{

class UserProfile{
public:
    PHORG_DLL static UserProfile* get();

    PHORG_DLL fs::path getHomeDir();
    PHORG_DLL fs::path getProfileDir();
    PHORG_DLL fs::path getGeocodeCacheFile();
private:
    UserProfile();

    void createDir(const fs::path &p);

    static UserProfile *instance;
};

}

#endif // USERPROFILE_H
