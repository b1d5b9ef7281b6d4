/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <algorithm>
#include <memory>

#include "gtest/gtest.h"
#include "constants.h"
#include "exceptions.h"
#include "fakes.h"
#include "organizer.h"
#include "phorg.h"
#include "testarea.h"

namespace {

using namespace phorg;

TEST(organizer, Run) {
    TestArea ta(TEST_NAME, true);
    const fs::path in = ta.getFolder("in");
    const fs::path out = in / "organized";

    ta.createJpeg("in/a.jpg", {
        {"Exif.Photo.DateTimeOriginal", "2020:01:02 03:04:05"},
        {"Exif.GPSInfo.GPSLatitudeRef", "N"},
        {"Exif.GPSInfo.GPSLatitude", "48/1 51/1 2376/100"},
        {"Exif.GPSInfo.GPSLongitudeRef", "E"},
        {"Exif.GPSInfo.GPSLongitude", "2/1 21/1 792/100"}
    });
    ta.createJpeg("in/nested/deeper/b.jpg", {{"Exif.Photo.DateTimeOriginal", "2021:06:15 10:30:00"}});
    ta.createFile("in/notes.txt");

    // Output of a previous run must not be picked up again
    ta.createJpeg("in/organized/2019/01-January/01/Unknown Location/old.jpg", {});

    OrganizerOptions o;
    o.inputFolder = in;
    o.outputFolder = out;
    o.workers = 2;
    o.useCache = false;

    auto geo = std::make_shared<ScriptedGeocoder>(std::vector<ScriptedGeocoder::Step>{ScriptedGeocoder::city("Paris")});
    Organizer organizer(o, geo);

    auto files = organizer.listFiles();
    EXPECT_EQ(files.size(), 3);

    size_t callbacks = 0;
    auto summary = organizer.run([&](const ProcessResult &, size_t done, size_t total){
        callbacks++;
        EXPECT_LE(done, total);
    });

    EXPECT_EQ(summary.total, 3);
    EXPECT_EQ(summary.processed, 2);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_EQ(summary.errors, 0);
    EXPECT_EQ(summary.cacheSize, -1);
    EXPECT_FALSE(summary.interrupted);
    EXPECT_EQ(callbacks, 3);
    EXPECT_EQ(summary.bytesCopied, fs::file_size(in / "a.jpg") + fs::file_size(in / "nested" / "deeper" / "b.jpg"));

    EXPECT_TRUE(fs::exists(out / "2020" / "01-January" / "02" / "Paris" / "a.jpg"));
    EXPECT_TRUE(fs::exists(out / "2021" / "06-June" / "15" / UNKNOWN_LOCATION / "b.jpg"));
    EXPECT_FALSE(fs::exists(out / "2019" / "01-January" / "01" / UNKNOWN_LOCATION / "old_1.jpg"));
}

TEST(organizer, CacheAndOptions) {
    TestArea ta(TEST_NAME, true);
    const fs::path in = ta.getFolder("in");
    const fs::path out = ta.getFolder("out");

    ta.createJpeg("in/a.jpg", {
        {"Exif.Photo.DateTimeOriginal", "2020:01:02 03:04:05"},
        {"Exif.GPSInfo.GPSLatitudeRef", "N"},
        {"Exif.GPSInfo.GPSLatitude", "48/1 51/1 2376/100"},
        {"Exif.GPSInfo.GPSLongitudeRef", "E"},
        {"Exif.GPSInfo.GPSLongitude", "2/1 21/1 792/100"}
    });
    ta.createJpeg("in/b.jpg", {{"Exif.Photo.DateTimeOriginal", "2020:01:02 03:04:05"}});

    OrganizerOptions o;
    o.inputFolder = in;
    o.outputFolder = out;
    o.includeDay = false;
    o.fileTypes = {"jpg"};
    o.cacheFile = ta.getFolder() / "cache.db";

    auto geo = std::make_shared<ScriptedGeocoder>(std::vector<ScriptedGeocoder::Step>{ScriptedGeocoder::city("Paris")});
    Organizer organizer(o, geo);
    auto summary = organizer.run();

    EXPECT_EQ(summary.processed, 2);
    EXPECT_EQ(summary.cacheSize, 1);
    EXPECT_TRUE(fs::exists(out / "2020" / "01-January" / "Paris" / "a.jpg"));
    EXPECT_TRUE(fs::exists(out / "2020" / "01-January" / UNKNOWN_LOCATION / "b.jpg"));
    EXPECT_GE(summary.filesPerSecond(), 0.0);
}

TEST(organizer, InvalidInput) {
    TestArea ta(TEST_NAME, true);

    OrganizerOptions o;
    o.inputFolder = ta.getFolder() / "does-not-exist";
    o.outputFolder = ta.getFolder("out");
    o.useCache = false;
    EXPECT_THROW(Organizer organizer(o, nullptr), InvalidArgsException);

    o.inputFolder = ta.createFile("file.jpg");
    EXPECT_THROW(Organizer organizer(o, nullptr), InvalidArgsException);

    o.inputFolder = ta.getFolder("in");
    o.outputFolder = "";
    EXPECT_THROW(Organizer organizer(o, nullptr), InvalidArgsException);
}

TEST(organizer, GeocoderFromOptions) {
    TestArea ta(TEST_NAME, true);

    OrganizerOptions o;
    o.inputFolder = ta.getFolder("in");
    o.outputFolder = ta.getFolder("out");
    o.useCache = false;
    o.apiKey = "";

    Organizer organizer(o);
    EXPECT_FALSE(organizer.getLocationResolver().isGeocodingEnabled());

    o.geocoder = "unknown";
    EXPECT_THROW(Organizer bad(o), InvalidArgsException);
}

TEST(organizer, EmptyInput) {
    TestArea ta(TEST_NAME, true);

    OrganizerOptions o;
    o.inputFolder = ta.getFolder("in");
    o.outputFolder = ta.getFolder("out");
    o.useCache = false;

    Organizer organizer(o, nullptr);
    auto summary = organizer.run();
    EXPECT_EQ(summary.total, 0);
    EXPECT_EQ(summary.processed, 0);
}

TEST(organizer, Interrupted) {
    TestArea ta(TEST_NAME, true);
    for (int i = 0; i < 5; i++)
        ta.createJpeg("in/" + std::to_string(i) + ".jpg", {{"Exif.Photo.DateTimeOriginal", "2020:01:02 03:04:05"}});

    OrganizerOptions o;
    o.inputFolder = ta.getFolder("in");
    o.outputFolder = ta.getFolder("out");
    o.workers = 1;
    o.useCache = false;

    Organizer organizer(o, nullptr);
    auto summary = organizer.run([](const ProcessResult &, size_t, size_t){
        setInterrupted();
    });
    setInterrupted(false);

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.total, 5);
    EXPECT_GE(summary.processed, 1);
    EXPECT_LT(summary.processed, 5);
    EXPECT_FALSE(isInterrupted());
}

}
