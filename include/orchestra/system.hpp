/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestra/agent.hpp"
#include "orchestra/bus.hpp"
#include "orchestra/config.hpp"
#include "orchestra/router.hpp"
#include "orchestra/scheduler.hpp"

namespace orchestra {

class AgentSystem final {
public:
    explicit AgentSystem(SystemConfig config = {});
    ~AgentSystem();

    AgentSystem(const AgentSystem&) = delete;
    AgentSystem& operator=(const AgentSystem&) = delete;
    AgentSystem(AgentSystem&&) = delete;
    AgentSystem& operator=(AgentSystem&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // False if an agent with the same name is already registered.
    bool registerAgent(const std::shared_ptr<Agent>& agent);
    // Stops the agent and returns its queued tasks to the scheduler.
    bool unregisterAgent(const std::string& name);
    [[nodiscard]] std::shared_ptr<Agent> agent(const std::string& name) const;

    TaskId submit(const TaskPtr& task);

    // Polls for a terminal outcome; nullptr if none within `budget`.
    [[nodiscard]] TaskPtr waitForResult(const TaskId& id, std::chrono::milliseconds budget) const;

    [[nodiscard]] std::vector<std::string> findAgentsByCapability(const std::string& capability) const;
    void broadcast(const std::string& sender, MessageType type, const nlohmann::json& content);
    void sendMessage(Message message);

    // One coordination pass: assignment, then timeouts.
    void tick();

    [[nodiscard]] nlohmann::json status() const;
    [[nodiscard]] const SystemConfig& config() const noexcept { return config_; }
    [[nodiscard]] Scheduler& scheduler() noexcept { return scheduler_; }
    [[nodiscard]] MessageBus& bus() noexcept { return bus_; }
    [[nodiscard]] Router& router() noexcept { return router_; }

private:
    void coordinationLoop();
    void assignPendingTasks();
    void checkTaskTimeouts();
    void handleAgentMessage(const Message& message);
    void handleBusMessage(const Message& message);
    void applyTaskResponse(const Message& message);
    [[nodiscard]] std::vector<std::shared_ptr<Agent>> agentSnapshot() const;

    SystemConfig config_;
    Scheduler scheduler_;
    MessageBus bus_;
    Router router_;

    mutable std::mutex agentsMutex_;
    std::vector<std::shared_ptr<Agent>> agents_;
    std::unordered_map<std::string, SubscriptionId> agentSubscriptions_;
    SubscriptionId selfSubscription_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread coordinatorThread_;
};

}
