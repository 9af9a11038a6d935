/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/system.hpp"
#include "orchestra/logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace orchestra {

namespace {
constexpr const char* kTimeoutError = "Task timeout exceeded";

std::string stringField(const nlohmann::json& content, const char* key, const std::string& defv) {
    auto it = content.find(key);
    if (it == content.end() || !it->is_string()) {
        return defv;
    }
    return it->get<std::string>();
}
}

AgentSystem::AgentSystem(SystemConfig config)
    : config_(std::move(config)),
      bus_(config_.historyCapacity, config_.busPollInterval),
      router_(bus_) {
    selfSubscription_ = bus_.subscribe(config_.name, [this](const Message& message) {
        handleBusMessage(message);
    });
    LOG_DEBUG("Agent system created: " + config_.name + " (tick " +
              std::to_string(config_.tickInterval.count()) + "ms)");
}

AgentSystem::~AgentSystem() {
    shutdown();

    // Agents may outlive the system; detach them so nothing calls back into it
    for (const auto& agent : agentSnapshot()) {
        agent->stop();
        agent->setMessageHandler(nullptr);
    }
    bus_.stop();
    bus_.unsubscribe(config_.name, selfSubscription_);
}

bool AgentSystem::start() {
    if (running_.load()) {
        LOG_WARN("Agent system already running");
        return false;
    }

    LOG_INFO("Starting agent system " + config_.name + "...");

    try {
        if (!bus_.isRunning() && !bus_.start()) {
            LOG_ERROR("Failed to start message bus");
            return false;
        }

        for (const auto& agent : agentSnapshot()) {
            if (!agent->isRunning() && !agent->start()) {
                LOG_WARN("Agent failed to start: " + agent->name());
            }
        }

        shutdown_.store(false);
        running_.store(true);
        coordinatorThread_ = std::thread(&AgentSystem::coordinationLoop, this);

        LOG_INFO("Agent system started with " + std::to_string(agentSnapshot().size()) + " agent(s)");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start agent system: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void AgentSystem::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down agent system...");

    shutdown_.store(true);
    running_.store(false);

    if (coordinatorThread_.joinable()) {
        coordinatorThread_.join();
    }

    for (const auto& agent : agentSnapshot()) {
        agent->stop();
    }

    bus_.stop();

    LOG_INFO("Agent system shutdown complete");
}

bool AgentSystem::registerAgent(const std::shared_ptr<Agent>& agent) {
    if (!agent) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(agentsMutex_);
        auto existing = std::find_if(agents_.begin(), agents_.end(),
            [&agent](const std::shared_ptr<Agent>& a) { return a->name() == agent->name(); });
        if (existing != agents_.end()) {
            LOG_WARN("Agent already registered: " + agent->name());
            return false;
        }
        agents_.push_back(agent);
        agentSubscriptions_[agent->name()] = bus_.subscribe(agent->name(), [this](const Message& message) {
            handleBusMessage(message);
        });
    }

    agent->setMessageHandler([this](const Message& message) { handleAgentMessage(message); }, config_.name);

    if (running_.load() && !agent->isRunning() && !agent->start()) {
        LOG_WARN("Registered agent failed to start: " + agent->name());
    }

    LOG_INFO("Agent registered: " + agent->name());
    return true;
}

bool AgentSystem::unregisterAgent(const std::string& name) {
    std::shared_ptr<Agent> agent;
    {
        std::lock_guard<std::mutex> lock(agentsMutex_);
        auto it = std::find_if(agents_.begin(), agents_.end(),
            [&name](const std::shared_ptr<Agent>& a) { return a->name() == name; });
        if (it == agents_.end()) {
            return false;
        }
        agent = *it;
        agents_.erase(it);

        auto sub = agentSubscriptions_.find(name);
        if (sub != agentSubscriptions_.end()) {
            bus_.unsubscribe(name, sub->second);
            agentSubscriptions_.erase(sub);
        }
    }

    // Let in-flight work report back before detaching
    agent->stop();
    agent->setMessageHandler(nullptr);

    auto queued = agent->takeQueued();
    for (const auto& task : queued) {
        LOG_WARN("Recovering queued task from unregistered agent " + name + ": " + task->id());
        scheduler_.add(task);
    }

    LOG_INFO("Agent unregistered: " + name);
    return true;
}

std::shared_ptr<Agent> AgentSystem::agent(const std::string& name) const {
    std::lock_guard<std::mutex> lock(agentsMutex_);
    for (const auto& agent : agents_) {
        if (agent->name() == name) {
            return agent;
        }
    }
    return nullptr;
}

TaskId AgentSystem::submit(const TaskPtr& task) {
    if (!task) {
        return {};
    }
    scheduler_.add(task);
    LOG_INFO("Task submitted: " + task->id() + " (" + task->description() + ")");
    return task->id();
}

TaskPtr AgentSystem::waitForResult(const TaskId& id, std::chrono::milliseconds budget) const {
    const auto deadline = std::chrono::steady_clock::now() + budget;

    for (;;) {
        if (TaskPtr task = scheduler_.findTerminal(id)) {
            return task;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(config_.resultPollInterval, remaining));
    }

    LOG_DEBUG("No result for task " + id + " within " + std::to_string(budget.count()) + "ms");
    return nullptr;
}

std::vector<std::string> AgentSystem::findAgentsByCapability(const std::string& capability) const {
    std::vector<std::string> names;
    for (const auto& agent : agentSnapshot()) {
        if (agent->hasCapability(capability)) {
            names.push_back(agent->name());
        }
    }
    return names;
}

void AgentSystem::broadcast(const std::string& sender, MessageType type, const nlohmann::json& content) {
    for (const auto& agent : agentSnapshot()) {
        if (agent->name() != sender) {
            bus_.send(Message::create(sender, agent->name(), type, content));
        }
    }
}

void AgentSystem::sendMessage(Message message) {
    router_.route(std::move(message));
}

void AgentSystem::tick() {
    assignPendingTasks();
    checkTaskTimeouts();
}

void AgentSystem::coordinationLoop() {
    setThreadName("Coordinator");
    LOG_DEBUG("Coordination loop started");

    const auto sleepChunk = std::min(config_.tickInterval, std::chrono::milliseconds(100));

    while (!shutdown_.load()) {
        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Coordination loop error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("Unknown coordination loop error");
        }

        auto sleepEnd = std::chrono::steady_clock::now() + config_.tickInterval;
        while (!shutdown_.load()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= sleepEnd) {
                break;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(sleepEnd - now);
            std::this_thread::sleep_for(std::min(sleepChunk, remaining + std::chrono::milliseconds(1)));
        }
    }

    LOG_DEBUG("Coordination loop stopped");
    clearThreadName();
}

// Agents are visited in registration order; an early agent can take every
// eligible task on a tick.
void AgentSystem::assignPendingTasks() {
    for (const auto& agent : agentSnapshot()) {
        if (shutdown_.load()) {
            break;
        }
        if (agent->status() != AgentStatus::Idle) {
            continue;
        }

        TaskPtr task = scheduler_.next(agent->capabilities());
        if (!task) {
            continue;
        }

        if (agent->assign(task)) {
            task->setAssignedAgent(agent->name());
            scheduler_.update(task);
            LOG_DEBUG("Assigned task " + task->id() + " to agent " + agent->name());
        } else {
            LOG_DEBUG("Agent " + agent->name() + " refused task " + task->id() + ", requeued");
            scheduler_.add(task);
        }
    }
}

void AgentSystem::checkTaskTimeouts() {
    scheduler_.reconcile();

    for (const auto& task : scheduler_.runningTasks()) {
        if (!task->isExpired()) {
            continue;
        }
        if (task->fail(kTimeoutError)) {
            LOG_WARN("Task timed out: " + task->id() + " (agent " + task->assignedAgent().value_or("?") + ")");
        }
        scheduler_.update(task);
    }
}

void AgentSystem::handleAgentMessage(const Message& message) {
    if (message.type == MessageType::TaskResponse) {
        applyTaskResponse(message);
    } else if (message.type == MessageType::StatusUpdate) {
        LOG_DEBUG("Status update from " + message.sender + ": " + message.content.dump());
    }

    // Downstream observers see every agent message
    bus_.send(message);
}

void AgentSystem::handleBusMessage(const Message& message) {
    if (message.type == MessageType::TaskResponse) {
        applyTaskResponse(message);
    } else {
        LOG_TRACE("Message for " + message.recipient + " from " + message.sender + ": " +
                  toString(message.type));
    }
}

void AgentSystem::applyTaskResponse(const Message& message) {
    const auto& content = message.content;
    if (!content.is_object()) {
        LOG_DEBUG("Ignoring task response without payload from " + message.sender);
        return;
    }

    TaskId id = stringField(content, "task_id", "");
    if (id.empty()) {
        LOG_DEBUG("Ignoring task response without task_id from " + message.sender);
        return;
    }

    TaskPtr task = scheduler_.findActive(id);
    if (!task) {
        LOG_TRACE("Task response for inactive task: " + id);
        return;
    }

    auto successIt = content.find("success");
    bool success = successIt != content.end() && successIt->is_boolean() && successIt->get<bool>();
    if (success) {
        auto resultIt = content.find("result");
        (void)task->complete(resultIt != content.end() ? *resultIt : nlohmann::json(nullptr));
    } else {
        (void)task->fail(stringField(content, "error", "Task reported failure"));
    }
    scheduler_.update(task);
}

nlohmann::json AgentSystem::status() const {
    nlohmann::json agents = nlohmann::json::object();
    for (const auto& agent : agentSnapshot()) {
        agents[agent->name()] = agent->statusJson();
    }

    return {
        {"name", config_.name},
        {"agents", agents},
        {"tasks", scheduler_.stats().toJson()},
        {"message_bus", bus_.stats().toJson()},
        {"running", running_.load()}
    };
}

std::vector<std::shared_ptr<Agent>> AgentSystem::agentSnapshot() const {
    std::lock_guard<std::mutex> lock(agentsMutex_);
    return agents_;
}

}
