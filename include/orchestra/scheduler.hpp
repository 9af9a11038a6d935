/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestra/task.hpp"
#include "orchestra/types.hpp"

namespace orchestra {

struct SchedulerStats {
    std::size_t pending = 0;
    std::size_t claimed = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;

    [[nodiscard]] nlohmann::json toJson() const;
};

// Pending tasks ordered by priority (highest first) then creation time
// (oldest first), plus id-keyed partitions for tasks already handed out.
//
// A task handed to an agent that queued it instead of starting it sits in
// the claimed partition until reconcile() sees it running.
class Scheduler final {
public:
    Scheduler() noexcept = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    void add(const TaskPtr& task);

    // Removes and returns the first pending task whose dependencies are all
    // completed and whose requirements are covered by `capabilities`;
    // nullptr if none qualifies.
    [[nodiscard]] TaskPtr next(const CapabilitySet& capabilities);

    // Moves the task to the partition matching its current status.
    void update(const TaskPtr& task);

    // Re-files claimed tasks whose status has moved on.
    void reconcile();

    [[nodiscard]] std::vector<TaskPtr> runningTasks() const;
    // Running or claimed task with this id, or nullptr.
    [[nodiscard]] TaskPtr findActive(const TaskId& id) const;
    // Completed or failed task with this id, or nullptr.
    [[nodiscard]] TaskPtr findTerminal(const TaskId& id) const;
    [[nodiscard]] SchedulerStats stats() const;

private:
    void sortPendingLocked();
    void updateLocked(const TaskPtr& task);

    mutable std::mutex mutex_;
    std::vector<TaskPtr> pending_;
    std::unordered_map<TaskId, TaskPtr> claimed_;
    std::unordered_map<TaskId, TaskPtr> running_;
    std::unordered_map<TaskId, TaskPtr> completed_;
    std::unordered_map<TaskId, TaskPtr> failed_;
};

}
