/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/scheduler.hpp"
#include "orchestra/logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace orchestra {

nlohmann::json SchedulerStats::toJson() const {
    return {
        {"pending_tasks", pending},
        {"claimed_tasks", claimed},
        {"running_tasks", running},
        {"completed_tasks", completed},
        {"failed_tasks", failed}
    };
}

void Scheduler::add(const TaskPtr& task) {
    if (!task) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    claimed_.erase(task->id());
    if (std::find(pending_.begin(), pending_.end(), task) != pending_.end()) {
        LOG_DEBUG("Task already pending: " + task->id());
        return;
    }
    pending_.push_back(task);
    sortPendingLocked();
    LOG_DEBUG("Task added to scheduler: " + task->id() + " (priority " +
              std::to_string(static_cast<int>(task->priority())) + ")");
}

TaskPtr Scheduler::next(const CapabilitySet& capabilities) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::unordered_set<TaskId> completedIds;
    completedIds.reserve(completed_.size());
    for (const auto& entry : completed_) {
        completedIds.insert(entry.first);
    }

    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        const TaskPtr& task = *it;
        if (task->status() != TaskStatus::Pending || !task->canStart(completedIds)) {
            continue;
        }

        const auto& required = task->requiredCapabilities();
        bool covered = std::all_of(required.begin(), required.end(),
            [&capabilities](const std::string& cap) { return capabilities.count(cap) > 0; });
        if (!covered) {
            continue;
        }

        TaskPtr selected = task;
        pending_.erase(it);
        LOG_TRACE("Scheduler selected task: " + selected->id());
        return selected;
    }

    return nullptr;
}

void Scheduler::update(const TaskPtr& task) {
    if (!task) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    updateLocked(task);
}

void Scheduler::updateLocked(const TaskPtr& task) {
    const TaskId& id = task->id();
    TaskStatus status = task->status();

    if (status == TaskStatus::Running) {
        claimed_.erase(id);
        running_[id] = task;
        return;
    }

    claimed_.erase(id);
    running_.erase(id);
    completed_.erase(id);
    failed_.erase(id);

    switch (status) {
        case TaskStatus::Pending:
            claimed_[id] = task;
            break;
        case TaskStatus::Completed:
            completed_[id] = task;
            LOG_DEBUG("Task completed: " + id);
            break;
        case TaskStatus::Failed:
            failed_[id] = task;
            LOG_DEBUG("Task failed: " + id + " - " + task->error().value_or(""));
            break;
        case TaskStatus::Cancelled:
            pending_.erase(std::remove(pending_.begin(), pending_.end(), task), pending_.end());
            LOG_DEBUG("Task cancelled: " + id);
            break;
        default:
            break;
    }
}

void Scheduler::reconcile() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TaskPtr> moved;
    for (const auto& entry : claimed_) {
        if (entry.second->status() != TaskStatus::Pending) {
            moved.push_back(entry.second);
        }
    }
    for (const auto& task : moved) {
        updateLocked(task);
    }
}

std::vector<TaskPtr> Scheduler::runningTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskPtr> tasks;
    tasks.reserve(running_.size());
    for (const auto& entry : running_) {
        tasks.push_back(entry.second);
    }
    return tasks;
}

TaskPtr Scheduler::findActive(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(id);
    if (it != running_.end()) {
        return it->second;
    }
    it = claimed_.find(id);
    return it != claimed_.end() ? it->second : nullptr;
}

TaskPtr Scheduler::findTerminal(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = completed_.find(id);
    if (it != completed_.end()) {
        return it->second;
    }
    it = failed_.find(id);
    return it != failed_.end() ? it->second : nullptr;
}

SchedulerStats Scheduler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SchedulerStats stats;
    stats.pending = static_cast<std::size_t>(std::count_if(pending_.begin(), pending_.end(),
        [](const TaskPtr& task) { return task->status() == TaskStatus::Pending; }));
    stats.claimed = claimed_.size();
    stats.running = running_.size();
    stats.completed = completed_.size();
    stats.failed = failed_.size();
    return stats;
}

void Scheduler::sortPendingLocked() {
    std::stable_sort(pending_.begin(), pending_.end(), [](const TaskPtr& a, const TaskPtr& b) {
        if (a->priority() != b->priority()) {
            return a->priority() > b->priority();
        }
        return a->createdAt() < b->createdAt();
    });
}

}
