/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <chrono>

#include <utime.h>

#include <cctz/time_zone.h>

#include "gtest/gtest.h"
#include "capturedate.h"
#include "exceptions.h"
#include "testarea.h"

namespace {

using namespace phorg;

CaptureDate localTime(time_t t){
    return cctz::convert(std::chrono::system_clock::from_time_t(t), cctz::local_time_zone());
}

void setModificationTime(const fs::path &p, time_t t){
    struct utimbuf times;
    times.actime = t;
    times.modtime = t;
    ASSERT_EQ(utime(p.c_str(), &times), 0);
}

TEST(parseTimestamp, ExifFormats) {
    EXPECT_EQ(DateResolver::parseTimestamp("2021:06:15 10:30:00"), CaptureDate(2021, 6, 15, 10, 30, 0));
    EXPECT_EQ(DateResolver::parseTimestamp("2021-06-15 10:30:00"), CaptureDate(2021, 6, 15, 10, 30, 0));
    EXPECT_EQ(DateResolver::parseTimestamp("2021:06:15 10:30:00.123"), CaptureDate(2021, 6, 15, 10, 30, 0));
    EXPECT_EQ(DateResolver::parseTimestamp("2021-06-15 10:30:59.5"), CaptureDate(2021, 6, 15, 10, 30, 59));
}

TEST(parseTimestamp, FreeForm) {
    // Offsets are ignored, we file by wall clock time
    EXPECT_EQ(DateResolver::parseTimestamp("2020-01-02T03:04:05.000000Z"), CaptureDate(2020, 1, 2, 3, 4, 5));
    EXPECT_EQ(DateResolver::parseTimestamp("2020-01-02T03:04:05+02:00"), CaptureDate(2020, 1, 2, 3, 4, 5));
    EXPECT_EQ(DateResolver::parseTimestamp("  2019/12/31 23:59:59 "), CaptureDate(2019, 12, 31, 23, 59, 59));
    EXPECT_EQ(DateResolver::parseTimestamp("2018-07-04"), CaptureDate(2018, 7, 4, 0, 0, 0));
    EXPECT_EQ(DateResolver::parseTimestamp("20170305"), CaptureDate(2017, 3, 5, 0, 0, 0));
    EXPECT_EQ(DateResolver::parseTimestamp("20170305_141516"), CaptureDate(2017, 3, 5, 14, 15, 16));
    EXPECT_EQ(DateResolver::parseTimestamp("Mar 5 2017"), CaptureDate(2017, 3, 5, 0, 0, 0));
    EXPECT_EQ(DateResolver::parseTimestamp("Sun Mar 05 14:15:16 2017"), CaptureDate(2017, 3, 5, 14, 15, 16));
}

TEST(parseTimestamp, Unparseable) {
    EXPECT_THROW(DateResolver::parseTimestamp(""), UnparseableDateException);
    EXPECT_THROW(DateResolver::parseTimestamp("not a date"), UnparseableDateException);
    EXPECT_THROW(DateResolver::parseTimestamp("0000:00:00 00:00:00"), UnparseableDateException);
    EXPECT_THROW(DateResolver::parseTimestamp("20170230"), UnparseableDateException);
}

TEST(fromMetadata, Priority) {
    json m = {{"DateTime", "2010:01:01 00:00:00"}, {"DateTimeOriginal", "2021:06:15 10:30:00"}};
    EXPECT_EQ(*DateResolver::fromMetadata(m), CaptureDate(2021, 6, 15, 10, 30, 0));

    m = {{"DateTime", "2010:01:01 00:00:00"}};
    EXPECT_EQ(*DateResolver::fromMetadata(m), CaptureDate(2010, 1, 1, 0, 0, 0));

    m = {{"DateTime", "2010:01:01 00:00:00"}, {"CreationDate", "2015-05-05 05:05:05"}};
    EXPECT_EQ(*DateResolver::fromMetadata(m), CaptureDate(2015, 5, 5, 5, 5, 5));

    // Blank values are skipped
    m = {{"DateTimeOriginal", "   "}, {"DateTime", "2010:01:01 00:00:00"}};
    EXPECT_EQ(*DateResolver::fromMetadata(m), CaptureDate(2010, 1, 1, 0, 0, 0));

    EXPECT_FALSE(DateResolver::fromMetadata(json::object()).has_value());
    EXPECT_FALSE(DateResolver::fromMetadata(json{{"Make", "Canon"}}).has_value());
}

TEST(dateResolver, Metadata) {
    TestArea ta(TEST_NAME, true);
    fs::path f = ta.createFile("a.jpg");

    EXPECT_EQ(DateResolver::resolve(f, json{{"DateTimeOriginal", "2021:06:15 10:30:00"}}),
              CaptureDate(2021, 6, 15, 10, 30, 0));
}

TEST(dateResolver, FilesystemFallback) {
    TestArea ta(TEST_NAME, true);
    fs::path f = ta.createFile("a.jpg");

    // mtime in the past, ctime is now
    const time_t mtime = 1000000000;
    setModificationTime(f, mtime);

    EXPECT_EQ(DateResolver::resolve(f, json::object()), localTime(mtime));
    EXPECT_EQ(*DateResolver::fromFilesystem(f), localTime(mtime));

    // Unparseable metadata falls through as well
    EXPECT_EQ(DateResolver::resolve(f, json{{"DateTimeOriginal", "garbage"}}), localTime(mtime));
}

TEST(dateResolver, MissingFile) {
    TestArea ta(TEST_NAME, true);
    fs::path f = ta.getFolder() / "missing.jpg";

    EXPECT_FALSE(DateResolver::fromFilesystem(f).has_value());
    EXPECT_FALSE(DateResolver::fromCreationTime(f).has_value());

    // Still produces a value
    const CaptureDate d = DateResolver::resolve(f, json::object());
    EXPECT_GE(d.year(), 2024);
}

TEST(dateResolver, ToString) {
    EXPECT_EQ(DateResolver::toString(CaptureDate(2021, 6, 5, 7, 8, 9)), "2021-06-05 07:08:09");
}

}
