/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace orchestra {

using PoolJob = std::function<void()>;

// Fixed set of worker threads draining a FIFO of jobs.
class Pool {
public:
    Pool(int workers, std::string name) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start();
    // Jobs already submitted run to completion before the workers exit.
    void stop() noexcept;
    [[nodiscard]] bool submit(PoolJob job) noexcept;
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);
    
    int workers_;
    std::string name_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<PoolJob> jobQueue_;
    
    std::vector<std::thread> workerThreads_;
};

}
