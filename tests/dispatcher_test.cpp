/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <memory>

#include "gtest/gtest.h"
#include "constants.h"
#include "dispatcher.h"
#include "exceptions.h"
#include "fakes.h"
#include "testarea.h"

namespace {

using namespace phorg;

const std::vector<std::pair<std::string, std::string>> parisTags = {
    {"Exif.Photo.DateTimeOriginal", "2020:01:02 03:04:05"},
    {"Exif.GPSInfo.GPSLatitudeRef", "N"},
    {"Exif.GPSInfo.GPSLatitude", "48/1 51/1 2376/100"},
    {"Exif.GPSInfo.GPSLongitudeRef", "E"},
    {"Exif.GPSInfo.GPSLongitude", "2/1 21/1 792/100"}
};

std::shared_ptr<LocationResolver> resolverFor(const std::string &city){
    auto geo = std::make_shared<ScriptedGeocoder>(std::vector<ScriptedGeocoder::Step>{ScriptedGeocoder::city(city)});
    return std::make_shared<LocationResolver>(geo, nullptr);
}

MediaDispatcher dispatcherFor(const fs::path &out, std::shared_ptr<LocationResolver> resolver,
                              std::shared_ptr<MetadataExtractor> video = createVideoExtractor()){
    return MediaDispatcher(createPhotoExtractor(), video, resolver, DestinationPathBuilder(out));
}

TEST(mediaDispatcher, PhotoEndToEnd) {
    TestArea ta(TEST_NAME, true);
    const fs::path src = ta.createJpeg("in/IMG_1234.jpg", parisTags);
    const fs::path out = ta.getFolder("out");

    MediaDispatcher d = dispatcherFor(out, resolverFor("Paris"));
    ProcessResult r = d.process(src);

    ASSERT_EQ(r.status, ProcessStatus::Success) << r.message;
    EXPECT_EQ(r.destination, out / "2020" / "01-January" / "02" / "Paris" / "IMG_1234.jpg");
    EXPECT_TRUE(fs::exists(r.destination));
    EXPECT_EQ(fs::file_size(r.destination), fs::file_size(src));
    EXPECT_EQ(fs::last_write_time(r.destination), fs::last_write_time(src));

    // Same file again lands next to the first copy
    r = d.process(src);
    ASSERT_EQ(r.status, ProcessStatus::Success);
    EXPECT_EQ(r.destination.filename(), "IMG_1234_1.jpg");
}

TEST(mediaDispatcher, GeocodingDisabled) {
    TestArea ta(TEST_NAME, true);
    const fs::path src = ta.createJpeg("in/IMG_1234.jpg", parisTags);
    const fs::path out = ta.getFolder("out");

    MediaDispatcher d = dispatcherFor(out, std::make_shared<LocationResolver>(nullptr, nullptr));
    ProcessResult r = d.process(src);

    ASSERT_EQ(r.status, ProcessStatus::Success) << r.message;
    EXPECT_EQ(r.destination, out / "2020" / "01-January" / "02" / UNKNOWN_LOCATION / "IMG_1234.jpg");
}

TEST(mediaDispatcher, Video) {
    TestArea ta(TEST_NAME, true);
    const fs::path src = ta.createFile("in/clip.MP4", "not really a video");
    const fs::path out = ta.getFolder("out");

    json m;
    m[META_CREATION_DATE] = "2019-05-06T07:08:09.000000Z";
    setDecimalPosition(m, 41.9028, 12.4964);

    auto video = std::make_shared<FakeExtractor>("fake", m);
    MediaDispatcher d = dispatcherFor(out, resolverFor("Rome"), video);

    EXPECT_EQ(d.classify(src), MediaType::Video);
    ProcessResult r = d.process(src);
    ASSERT_EQ(r.status, ProcessStatus::Success) << r.message;
    EXPECT_EQ(r.destination, out / "2019" / "05-May" / "06" / "Rome" / "clip.MP4");
    EXPECT_EQ(video->calls, 1);
}

TEST(mediaDispatcher, UnreadableMetadataIsNotAnError) {
    TestArea ta(TEST_NAME, true);
    const fs::path src = ta.createFile("in/broken.jpg", "garbage");
    const fs::path out = ta.getFolder("out");

    MediaDispatcher d = dispatcherFor(out, resolverFor("Paris"));
    ProcessResult r = d.process(src);

    ASSERT_EQ(r.status, ProcessStatus::Success) << r.message;
    EXPECT_EQ(r.destination.parent_path().filename(), UNKNOWN_LOCATION);
    EXPECT_TRUE(fs::exists(r.destination));
}

TEST(mediaDispatcher, Skipped) {
    TestArea ta(TEST_NAME, true);
    const fs::path out = ta.getFolder("out");
    const fs::path txt = ta.createFile("in/notes.txt");
    const fs::path jpg = ta.createJpeg("in/a.jpg", parisTags);

    MediaDispatcher d = dispatcherFor(out, resolverFor("Paris"));
    EXPECT_EQ(d.process(txt).status, ProcessStatus::Skipped);
    EXPECT_EQ(d.process(ta.getFolder("in")).status, ProcessStatus::Skipped);
    EXPECT_EQ(d.process(ta.getFolder() / "missing.jpg").status, ProcessStatus::Skipped);

    d.setAllowedTypes({"mov"});
    EXPECT_EQ(d.classify(jpg), MediaType::Unsupported);
    EXPECT_EQ(d.process(jpg).status, ProcessStatus::Skipped);

    d.setAllowedTypes({"jpg"});
    EXPECT_EQ(d.classify(jpg), MediaType::Photo);

    // Nothing was written
    EXPECT_TRUE(fs::is_empty(out));
}

TEST(mediaDispatcher, CopyFailure) {
    TestArea ta(TEST_NAME, true);
    const fs::path src = ta.createJpeg("in/a.jpg", parisTags);
    const fs::path out = ta.getFolder("out");

    MediaDispatcher d = dispatcherFor(out, resolverFor("Paris"));
    d.setCopier([](const fs::path &, const fs::path &){
        throw CopyException("No space left on device");
    });

    ProcessResult r = d.process(src);
    EXPECT_EQ(r.status, ProcessStatus::Error);
    EXPECT_NE(r.message.find("No space left"), std::string::npos);

    // The reserved name was released
    EXPECT_FALSE(fs::exists(out / "2020" / "01-January" / "02" / "Paris" / "a.jpg"));
}

TEST(mediaDispatcher, Classify) {
    MediaDispatcher d(nullptr, nullptr, nullptr, DestinationPathBuilder(fs::path()));
    EXPECT_EQ(d.classify("a.JPG"), MediaType::Photo);
    EXPECT_EQ(d.classify("a.heic"), MediaType::Photo);
    EXPECT_EQ(d.classify("a.png"), MediaType::Photo);
    EXPECT_EQ(d.classify("a.mov"), MediaType::Video);
    EXPECT_EQ(d.classify("a.m4v"), MediaType::Video);
    EXPECT_EQ(d.classify("a.txt"), MediaType::Unsupported);
    EXPECT_EQ(d.classify("jpg"), MediaType::Unsupported);

    EXPECT_EQ(processStatusToHuman(ProcessStatus::Skipped), "skipped");
    EXPECT_EQ(mediaTypeToHuman(MediaType::Video), "Video");
}

}
