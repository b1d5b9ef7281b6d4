/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstdlib>
#include <fstream>

#include "gtest/gtest.h"
#include "exceptions.h"
#include "mio.h"
#include "phorg.h"
#include "userprofile.h"
#include "utils.h"
#include "testarea.h"

namespace {

using namespace phorg;

TEST(utils, ShortestDouble) {
    EXPECT_EQ(utils::shortestDouble(48.8566), "48.8566");
    EXPECT_EQ(utils::shortestDouble(-0.5), "-0.5");
    EXPECT_EQ(utils::shortestDouble(2.0), "2");
    EXPECT_EQ(std::stod(utils::shortestDouble(0.1 + 0.2)), 0.1 + 0.2);
}

TEST(utils, ParseExtensionList) {
    EXPECT_EQ(utils::parseExtensionList("jpg, .MOV,png,,jpg"), std::vector<std::string>({"jpg", "mov", "png"}));
    EXPECT_TRUE(utils::parseExtensionList("").empty());
    EXPECT_TRUE(utils::parseExtensionList(" , ").empty());
}

TEST(utils, HumanReadableTime) {
    EXPECT_EQ(utils::toHumanReadableTime(250), "250ms");
    EXPECT_EQ(utils::toHumanReadableTime(1500), "1.50s");
    EXPECT_EQ(utils::toHumanReadableTime(61500), "1m 1.50s");
    EXPECT_EQ(utils::toHumanReadableTime(3600000), "1h 0m 0.00s");
}

TEST(utils, Trim) {
    std::string s = "  Paris \t";
    utils::trim(s);
    EXPECT_EQ(s, "Paris");

    utils::toUpper(s);
    EXPECT_EQ(s, "PARIS");
}

TEST(io, CheckExtension) {
    io::Path p("/a/b/IMG.JPG");
    EXPECT_EQ(p.extension(), "jpg");
    EXPECT_TRUE(p.checkExtension({"png", "jpg"}));
    EXPECT_FALSE(p.checkExtension({"mov"}));
    EXPECT_FALSE(io::Path("/a/b/noext").checkExtension({"jpg"}));
}

TEST(io, CreateExclusive) {
    TestArea ta(TEST_NAME, true);
    const fs::path p = ta.getFolder() / "reserved.jpg";

    EXPECT_TRUE(io::createExclusive(p));
    EXPECT_FALSE(io::createExclusive(p));
    EXPECT_THROW(io::createExclusive(ta.getFolder() / "missing" / "x.jpg"), FSException);
}

TEST(io, CopyPreservingTimes) {
    TestArea ta(TEST_NAME, true);
    const fs::path src = ta.getFolder() / "src.jpg";
    {
        std::ofstream f(src.string());
        f << "0123456789";
    }
    const auto past = fs::last_write_time(src) - std::chrono::hours(24 * 365);
    fs::last_write_time(src, past);

    const fs::path dst = ta.getFolder() / "a" / "b" / "dst.jpg";
    io::copyPreservingTimes(src, dst);

    EXPECT_EQ(fs::file_size(dst), 10);
    EXPECT_EQ(fs::last_write_time(dst), past);

    // Overwrites a reserved placeholder
    io::copyPreservingTimes(src, dst);
    EXPECT_EQ(fs::file_size(dst), 10);

    EXPECT_THROW(io::copyPreservingTimes(ta.getFolder() / "missing.jpg", dst), CopyException);
}

TEST(io, BytesToHuman) {
    EXPECT_EQ(io::bytesToHuman(512), "512 B");
    EXPECT_EQ(io::bytesToHuman(1024), "1 KB");
    EXPECT_EQ(io::bytesToHuman(1536), "1.50 KB");
}

TEST(phorg, ExitCode) {
    EXPECT_EQ(exitCode(InterruptedException("Interrupted by user")), 130);
    EXPECT_EQ(exitCode(InvalidArgsException("bad folder")), EXIT_FAILURE);
    EXPECT_EQ(exitCode(GeocodeTimeoutException("slow")), EXIT_FAILURE);
    EXPECT_EQ(exitCode(std::runtime_error("other")), EXIT_FAILURE);
}

TEST(userProfile, ProfileDirOverride) {
    TestArea ta(TEST_NAME, true);
    const fs::path profile = ta.getFolder() / "profile";

    setenv(PHORG_PROFILE_ENV, profile.c_str(), 1);
    const fs::path cacheFile = UserProfile::get()->getGeocodeCacheFile();
    unsetenv(PHORG_PROFILE_ENV);

    EXPECT_EQ(cacheFile, profile / GEOCODE_CACHE_FILE_NAME);
    EXPECT_TRUE(fs::is_directory(profile));
    EXPECT_EQ(UserProfile::get()->getProfileDir().filename(), PHORG_FOLDER);
}

}
