/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestra/clock.hpp"
#include "orchestra/types.hpp"

namespace orchestra {

// A schedulable unit of work. Identity, requirements and creation time are
// fixed at construction; lifecycle fields are guarded by an internal mutex
// because the owning agent and the coordinator both touch them.
//
// A timeout of zero or less means the task never expires.
class Task final {
public:
    explicit Task(std::string description,
                  CapabilitySet requiredCapabilities = {},
                  TaskPriority priority = TaskPriority::Medium,
                  nlohmann::json parameters = nlohmann::json::object(),
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                  std::vector<TaskId> dependencies = {});

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&) = delete;
    Task& operator=(Task&&) = delete;

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const CapabilitySet& requiredCapabilities() const noexcept { return requiredCapabilities_; }
    [[nodiscard]] TaskPriority priority() const noexcept { return priority_; }
    [[nodiscard]] const nlohmann::json& parameters() const noexcept { return parameters_; }
    [[nodiscard]] std::optional<std::chrono::milliseconds> timeout() const noexcept { return timeout_; }
    [[nodiscard]] const std::vector<TaskId>& dependencies() const noexcept { return dependencies_; }
    [[nodiscard]] TimePoint createdAt() const noexcept { return createdAt_; }

    [[nodiscard]] TaskStatus status() const;
    [[nodiscard]] std::optional<std::string> assignedAgent() const;
    [[nodiscard]] std::optional<TimePoint> startedAt() const;
    [[nodiscard]] std::optional<TimePoint> completedAt() const;
    [[nodiscard]] std::optional<nlohmann::json> result() const;
    [[nodiscard]] std::optional<std::string> error() const;

    void setAssignedAgent(const std::string& agent);

    [[nodiscard]] bool canStart(const std::unordered_set<TaskId>& completed) const;
    [[nodiscard]] bool isExpired() const;
    [[nodiscard]] bool isExpired(TimePoint now) const;

    // Lifecycle transitions. Each is a compare-and-set on the status and
    // returns false, leaving the task untouched, if the current state does
    // not allow it. Terminal states are never overwritten.
    bool markRunning(const std::string& agent, TimePoint now = Clock::now());
    bool complete(nlohmann::json result, TimePoint now = Clock::now());
    bool fail(const std::string& error, TimePoint now = Clock::now());
    bool cancel(TimePoint now = Clock::now());

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static std::shared_ptr<Task> fromJson(const nlohmann::json& data);

private:
    TaskId id_;
    std::string description_;
    CapabilitySet requiredCapabilities_;
    TaskPriority priority_;
    nlohmann::json parameters_;
    std::optional<std::chrono::milliseconds> timeout_;
    std::vector<TaskId> dependencies_;
    TimePoint createdAt_;

    mutable std::mutex mutex_;
    TaskStatus status_ = TaskStatus::Pending;
    std::optional<std::string> assignedAgent_;
    std::optional<TimePoint> startedAt_;
    std::optional<TimePoint> completedAt_;
    std::optional<nlohmann::json> result_;
    std::optional<std::string> error_;
};

using TaskPtr = std::shared_ptr<Task>;

}
