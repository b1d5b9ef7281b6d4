/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "userprofile.h"

#include <cstdlib>

#include "phorg.h"
#include "exceptions.h"

namespace phorg{

UserProfile *UserProfile::instance = nullptr;

UserProfile *UserProfile::get(){
    if (!instance){
        instance = new UserProfile();
    }

    return instance;
}

UserProfile::UserProfile(){
}

void UserProfile::createDir(const fs::path &dir){
    if (!fs::exists(dir)){
        std::error_code ec;
        if (fs::create_directories(dir, ec)){
            LOGD << "Created " << dir.string();
        }else{
            // Was it created by a competing process?
            if (!fs::exists(dir)) throw AppException("Cannot create profile directory: " + dir.string() + ". Check that you have permissions to write.");
            LOGD << "Dir was already created (by another process?): " << dir.string();
        }
    }
}

fs::path UserProfile::getHomeDir()
{
    const char *home = std::getenv("HOME");
    if (home) return std::string(home);

    home = std::getenv("USERPROFILE");
    if (home) return std::string(home);

    home = std::getenv("HOMEDRIVE");
    const char *homePath = std::getenv("HOMEPATH");

    if (!home || !homePath){
        throw AppException("Cannot find home directory. Make sure that either your HOME or USERPROFILE environment variable is set and points to the current user's home directory.");
    }

    return fs::path(std::string(home)) / fs::path(std::string(homePath));
}

fs::path UserProfile::getProfileDir(){
    const char *dir = std::getenv(PHORG_PROFILE_ENV);
    if (dir != nullptr && dir[0] != '\0') return fs::path(dir);

    return getHomeDir() / PHORG_FOLDER;
}

fs::path UserProfile::getGeocodeCacheFile(){
    const fs::path dir = getProfileDir();
    createDir(dir);
    return dir / GEOCODE_CACHE_FILE_NAME;
}

}
