/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <atomic>
#include <stdexcept>

#include "gtest/gtest.h"
#include "constants.h"
#include "threadpool.h"

namespace {

using namespace phorg;

TEST(threadPool, RunsEverything) {
    std::atomic<int> counter(0);
    {
        ThreadPool pool(4);
        EXPECT_EQ(pool.size(), 4);
        for (int i = 0; i < 100; i++) {
            pool.submit([&counter](){ counter++; });
        }
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(threadPool, Futures) {
    ThreadPool pool(2);
    auto f = pool.submitTask([](){ return 6 * 7; });
    EXPECT_EQ(f.get(), 42);

    auto e = pool.submitTask([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(e.get(), std::runtime_error);
}

TEST(threadPool, DefaultThreadCount) {
    const size_t n = ThreadPool::defaultThreadCount();
    EXPECT_GE(n, 1);
    EXPECT_LE(n, MAX_WORKERS);

    ThreadPool zero(0);
    EXPECT_EQ(zero.size(), 1);
}

}
