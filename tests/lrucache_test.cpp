/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <string>

#include "gtest/gtest.h"
#include "lrucache.h"

namespace {

using namespace phorg;

TEST(lruCache, Eviction) {
    LruCache<std::string, int> c(2);
    c.put("a", 1);
    c.put("b", 2);

    // Touch "a" so that "b" becomes the oldest
    EXPECT_EQ(*c.get("a"), 1);
    c.put("c", 3);

    EXPECT_EQ(c.size(), 2);
    EXPECT_FALSE(c.get("b").has_value());
    EXPECT_EQ(*c.get("a"), 1);
    EXPECT_EQ(*c.get("c"), 3);
}

TEST(lruCache, Update) {
    LruCache<std::string, int> c(2);
    c.put("a", 1);
    c.put("a", 10);
    EXPECT_EQ(c.size(), 1);
    EXPECT_EQ(*c.get("a"), 10);

    c.clear();
    EXPECT_EQ(c.size(), 0);
    EXPECT_FALSE(c.get("a").has_value());
}

TEST(lruCache, Disabled) {
    LruCache<std::string, int> c(0);
    c.put("a", 1);
    EXPECT_EQ(c.size(), 0);
    EXPECT_FALSE(c.get("a").has_value());
}

}
