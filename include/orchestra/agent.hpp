/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestra/config.hpp"
#include "orchestra/executor.hpp"
#include "orchestra/message.hpp"
#include "orchestra/pool.hpp"
#include "orchestra/task.hpp"
#include "orchestra/types.hpp"

namespace orchestra {

struct AgentMetrics {
    std::uint64_t tasksCompleted = 0;
    std::uint64_t tasksFailed = 0;
    double totalExecutionSeconds = 0.0;
    std::optional<TimePoint> lastActivity;
};

// Optional detail attached to a capability name.
struct CapabilityInfo {
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();
};

// Runs up to maxConcurrent tasks at once on its own execution threads.
// Tasks assigned while at capacity wait in an intake queue that a
// background loop polls.
class Agent final {
public:
    Agent(std::string name, CapabilitySet capabilities, std::shared_ptr<Executor> executor,
          int maxConcurrent = 1, AgentConfig config = {});
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;
    Agent(Agent&&) = delete;
    Agent& operator=(Agent&&) = delete;

    bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // False when the agent is offline or lacks a required capability; the
    // task is left untouched. Otherwise the task is started or queued.
    [[nodiscard]] bool assign(const TaskPtr& task);
    [[nodiscard]] bool canAccept(const Task& task) const;

    // Re-adding a capability replaces its description and parameters.
    void addCapability(const std::string& capability, std::string description = {},
                       nlohmann::json parameters = nlohmann::json::object());
    [[nodiscard]] bool hasCapability(const std::string& capability) const;
    [[nodiscard]] CapabilitySet capabilities() const;
    [[nodiscard]] std::optional<CapabilityInfo> capabilityInfo(const std::string& capability) const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] int maxConcurrent() const noexcept { return maxConcurrent_; }
    [[nodiscard]] AgentStatus status() const;
    [[nodiscard]] std::size_t runningCount() const;
    [[nodiscard]] std::size_t queuedCount() const;
    [[nodiscard]] AgentMetrics metrics() const;

    // Tasks still waiting in the intake queue, removed from the agent.
    [[nodiscard]] std::vector<TaskPtr> takeQueued();

    // Outbound notifications; terminal task outcomes are reported to
    // `recipient` as TASK_RESPONSE messages.
    void setMessageHandler(MessageHandler handler, const std::string& recipient = "system");
    void sendMessage(const std::string& recipient, MessageType type, nlohmann::json content);

    [[nodiscard]] nlohmann::json statusJson() const;

private:
    [[nodiscard]] bool canAcceptLocked(const Task& task) const;
    void beginExecutionLocked(const TaskPtr& task);
    void execute(const TaskPtr& task);
    void intakeLoop();
    void notify(const Message& message);

    std::string name_;
    CapabilitySet capabilities_;
    std::unordered_map<std::string, CapabilityInfo> capabilityInfo_;
    std::shared_ptr<Executor> executor_;
    int maxConcurrent_;
    AgentConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable intakeCondition_;
    AgentStatus status_ = AgentStatus::Idle;
    std::deque<TaskPtr> intake_;
    std::unordered_map<TaskId, TaskPtr> current_;
    AgentMetrics metrics_;
    MessageHandler handler_;
    std::string notifyRecipient_ = "system";

    std::atomic<bool> running_{false};
    Pool pool_;
    std::thread intakeThread_;
};

}
