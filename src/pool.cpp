/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/pool.hpp"
#include "orchestra/logger.hpp"

namespace orchestra {

Pool::Pool(int workers, std::string name) noexcept
    : workers_(workers < 1 ? 1 : workers), name_(std::move(name)) {
    LOG_DEBUG("Pool " + name_ + " created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool " + name_ + " already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_DEBUG("Pool " + name_ + " started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool " + name_ + ": " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool " + name_ + "...");
    
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    
    jobAvailable_.notify_all();
    
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    workerThreads_.clear();
    LOG_DEBUG("Pool " + name_ + " stopped");
}

bool Pool::submit(PoolJob job) noexcept {
    if (!job) {
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit job to stopped pool " + name_);
                return false;
            }
            jobQueue_.push(std::move(job));
        }
        
        jobAvailable_.notify_one();
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue job on pool " + name_);
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return jobQueue_.size();
    } catch (...) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    const std::string workerName = name_ + "-" + std::to_string(workerId);
    setThreadName(workerName);
    LOG_TRACE(workerName + " thread started");
    
    try {
        for (;;) {
            PoolJob job;
            
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                
                jobAvailable_.wait(lock, [this] { 
                    return !jobQueue_.empty() || shutdown_.load(); 
                });
                
                // Drain before honouring shutdown
                if (jobQueue_.empty()) {
                    break;
                }
                
                job = std::move(jobQueue_.front());
                jobQueue_.pop();
            }
            
            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR(workerName + " job error: " + std::string(e.what()));
            } catch (...) {
                LOG_ERROR(workerName + " unknown job error");
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(workerName + " fatal error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR(workerName + " unknown fatal error");
    }
    
    LOG_TRACE(workerName + " stopped");
    clearThreadName();
}

}
