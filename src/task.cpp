/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/task.hpp"
#include "orchestra/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace orchestra {

namespace {
nlohmann::json optionalTime(const std::optional<TimePoint>& tp) {
    return tp ? nlohmann::json(toIso8601(*tp)) : nlohmann::json(nullptr);
}

std::optional<TimePoint> readOptionalTime(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return std::nullopt;
    }
    return parseIso8601(it->get<std::string>());
}

std::optional<std::string> readOptionalString(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}
}

Task::Task(std::string description, CapabilitySet requiredCapabilities, TaskPriority priority,
           nlohmann::json parameters, std::optional<std::chrono::milliseconds> timeout,
           std::vector<TaskId> dependencies)
    : id_(generateId()),
      description_(std::move(description)),
      requiredCapabilities_(std::move(requiredCapabilities)),
      priority_(priority),
      parameters_(parameters.is_null() ? nlohmann::json::object() : std::move(parameters)),
      timeout_(timeout && timeout->count() > 0 ? timeout : std::optional<std::chrono::milliseconds>()),
      dependencies_(std::move(dependencies)),
      createdAt_(Clock::now()) {
}

TaskStatus Task::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<std::string> Task::assignedAgent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assignedAgent_;
}

std::optional<TimePoint> Task::startedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return startedAt_;
}

std::optional<TimePoint> Task::completedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completedAt_;
}

std::optional<nlohmann::json> Task::result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

std::optional<std::string> Task::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void Task::setAssignedAgent(const std::string& agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    assignedAgent_ = agent;
}

bool Task::canStart(const std::unordered_set<TaskId>& completed) const {
    return std::all_of(dependencies_.begin(), dependencies_.end(),
        [&completed](const TaskId& dep) { return completed.count(dep) > 0; });
}

bool Task::isExpired() const {
    return isExpired(Clock::now());
}

bool Task::isExpired(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!timeout_ || !startedAt_) {
        return false;
    }
    return now - *startedAt_ > *timeout_;
}

bool Task::markRunning(const std::string& agent, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TaskStatus::Pending) {
        return false;
    }
    status_ = TaskStatus::Running;
    assignedAgent_ = agent;
    startedAt_ = now;
    return true;
}

bool Task::complete(nlohmann::json result, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TaskStatus::Running) {
        return false;
    }
    status_ = TaskStatus::Completed;
    result_ = std::move(result);
    completedAt_ = now;
    return true;
}

bool Task::fail(const std::string& error, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TaskStatus::Running) {
        return false;
    }
    status_ = TaskStatus::Failed;
    error_ = error;
    completedAt_ = now;
    return true;
}

bool Task::cancel(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TaskStatus::Pending && status_ != TaskStatus::Running) {
        return false;
    }
    status_ = TaskStatus::Cancelled;
    completedAt_ = now;
    return true;
}

nlohmann::json Task::toJson() const {
    // Sorted so the representation does not depend on hash order
    std::vector<std::string> capabilities(requiredCapabilities_.begin(), requiredCapabilities_.end());
    std::sort(capabilities.begin(), capabilities.end());

    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"id", id_},
        {"description", description_},
        {"required_capabilities", capabilities},
        {"priority", static_cast<int>(priority_)},
        {"parameters", parameters_},
        {"timeout", timeout_ ? nlohmann::json(timeout_->count() / 1000.0) : nlohmann::json(nullptr)},
        {"status", toString(status_)},
        {"assigned_agent", assignedAgent_ ? nlohmann::json(*assignedAgent_) : nlohmann::json(nullptr)},
        {"created_at", toIso8601(createdAt_)},
        {"started_at", optionalTime(startedAt_)},
        {"completed_at", optionalTime(completedAt_)},
        {"result", result_ ? *result_ : nlohmann::json(nullptr)},
        {"error", error_ ? nlohmann::json(*error_) : nlohmann::json(nullptr)},
        {"dependencies", dependencies_}
    };
}

std::shared_ptr<Task> Task::fromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("Task record must be a JSON object");
    }

    std::optional<std::chrono::milliseconds> timeout;
    auto timeoutIt = data.find("timeout");
    if (timeoutIt != data.end() && !timeoutIt->is_null()) {
        double seconds = timeoutIt->get<double>();
        timeout = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    }

    auto task = std::make_shared<Task>(
        data.at("description").get<std::string>(),
        data.value("required_capabilities", CapabilitySet{}),
        priorityFromInt(data.value("priority", static_cast<int>(TaskPriority::Medium))),
        data.value("parameters", nlohmann::json::object()),
        timeout,
        data.value("dependencies", std::vector<TaskId>{}));

    task->id_ = data.at("id").get<std::string>();
    task->createdAt_ = parseIso8601(data.at("created_at").get<std::string>());
    task->status_ = parseTaskStatus(data.value("status", std::string("pending")));
    task->assignedAgent_ = readOptionalString(data, "assigned_agent");
    task->startedAt_ = readOptionalTime(data, "started_at");
    task->completedAt_ = readOptionalTime(data, "completed_at");
    task->error_ = readOptionalString(data, "error");

    auto resultIt = data.find("result");
    if (resultIt != data.end() && !resultIt->is_null()) {
        task->result_ = *resultIt;
    }

    LOG_TRACE("Task restored from record: " + task->id_);
    return task;
}

}
