/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef THREADPOOL_H
#define THREADPOOL_H

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "phorg_export.h"

namespace phorg{

// Fixed number of workers draining a FIFO queue.
// The destructor waits for every queued task to run.
class ThreadPool {
    std::queue<std::function<void()>> tasks;
    std::mutex mtx;
    std::condition_variable condition;
    std::vector<std::thread> workers;
    bool stop;

    void workerThread();
public:
    PHORG_DLL explicit ThreadPool(size_t threadCount);
    PHORG_DLL ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    PHORG_DLL void submit(std::function<void()> task);

    // Exceptions thrown by f are rethrown by future::get()
    template <typename F>
    auto submitTask(F f) -> std::future<decltype(f())> {
        auto task = std::make_shared<std::packaged_task<decltype(f())()>>(std::move(f));
        auto result = task->get_future();
        submit([task](){ (*task)(); });
        return result;
    }

    PHORG_DLL size_t size() const { return workers.size(); }

    // min(MAX_WORKERS, 2 * cores), at least 1
    PHORG_DLL static size_t defaultThreadCount();
};

}

#endif // THREADPOOL_H
