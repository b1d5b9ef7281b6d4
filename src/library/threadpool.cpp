/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "threadpool.h"

#include <algorithm>

#include "constants.h"
#include "logger.h"

namespace phorg{

ThreadPool::ThreadPool(size_t threadCount) : stop(false){
    if (threadCount == 0) threadCount = 1;

    for (size_t i = 0; i < threadCount; ++i){
        workers.emplace_back(&ThreadPool::workerThread, this);
    }
    LOGD << "Started " << threadCount << " workers";
}

ThreadPool::~ThreadPool(){
    {
        std::unique_lock<std::mutex> lock(mtx);
        stop = true;
    }
    condition.notify_all();
    for (std::thread &worker : workers){
        worker.join();
    }
}

void ThreadPool::submit(std::function<void()> task){
    {
        std::lock_guard<std::mutex> lock(mtx);
        tasks.push(std::move(task));
    }
    condition.notify_one();
}

void ThreadPool::workerThread(){
    while (true){
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mtx);
            condition.wait(lock, [this]{ return stop || !tasks.empty(); });
            if (stop && tasks.empty()) return;
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

size_t ThreadPool::defaultThreadCount(){
    const size_t cores = std::max<size_t>(1, std::thread::hardware_concurrency());
    return std::min<size_t>(MAX_WORKERS, cores * 2);
}

}
