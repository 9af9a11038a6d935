/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/types.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace orchestra {

const char* toString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* toString(AgentStatus status) noexcept {
    switch (status) {
        case AgentStatus::Idle:    return "idle";
        case AgentStatus::Busy:    return "busy";
        case AgentStatus::Error:   return "error";
        case AgentStatus::Offline: return "offline";
        default: return "unknown";
    }
}

const char* toString(MessageType type) noexcept {
    switch (type) {
        case MessageType::TaskRequest:  return "task_request";
        case MessageType::TaskResponse: return "task_response";
        case MessageType::StatusUpdate: return "status_update";
        case MessageType::Coordination: return "coordination";
        case MessageType::Error:        return "error";
        case MessageType::Info:         return "info";
        default: return "unknown";
    }
}

TaskStatus parseTaskStatus(const std::string& name) {
    if (name == "pending") return TaskStatus::Pending;
    if (name == "running") return TaskStatus::Running;
    if (name == "completed") return TaskStatus::Completed;
    if (name == "failed") return TaskStatus::Failed;
    if (name == "cancelled") return TaskStatus::Cancelled;
    throw std::invalid_argument("Unknown task status: " + name);
}

MessageType parseMessageType(const std::string& name) {
    if (name == "task_request") return MessageType::TaskRequest;
    if (name == "task_response") return MessageType::TaskResponse;
    if (name == "status_update") return MessageType::StatusUpdate;
    if (name == "coordination") return MessageType::Coordination;
    if (name == "error") return MessageType::Error;
    if (name == "info") return MessageType::Info;
    throw std::invalid_argument("Unknown message type: " + name);
}

TaskPriority priorityFromInt(int value) {
    if (value < static_cast<int>(TaskPriority::Low) || value > static_cast<int>(TaskPriority::Critical)) {
        throw std::invalid_argument("Priority out of range: " + std::to_string(value));
    }
    return static_cast<TaskPriority>(value);
}

std::string generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << std::to_string(now) << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

}
