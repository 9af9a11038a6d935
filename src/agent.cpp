/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/agent.hpp"
#include "orchestra/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace orchestra {

Agent::Agent(std::string name, CapabilitySet capabilities, std::shared_ptr<Executor> executor,
             int maxConcurrent, AgentConfig config)
    : name_(std::move(name)),
      capabilities_(std::move(capabilities)),
      executor_(std::move(executor)),
      maxConcurrent_(maxConcurrent < 1 ? 1 : maxConcurrent),
      config_(config),
      pool_(maxConcurrent_, "Agent-" + name_) {
    if (!executor_) {
        throw std::invalid_argument("Agent " + name_ + " requires an executor");
    }
    LOG_DEBUG("Agent created: " + name_ + " (max concurrent: " + std::to_string(maxConcurrent_) + ")");
}

Agent::~Agent() {
    stop();
}

bool Agent::start() {
    if (running_.load()) {
        LOG_WARN("Agent already running: " + name_);
        return false;
    }

    if (!pool_.start()) {
        LOG_ERROR("Failed to start execution pool for agent: " + name_);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(true);
        status_ = current_.empty() ? AgentStatus::Idle : AgentStatus::Busy;
    }

    try {
        intakeThread_ = std::thread(&Agent::intakeLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start intake loop for agent " + name_ + ": " + std::string(e.what()));
        running_.store(false);
        pool_.stop();
        return false;
    }

    LOG_INFO("Agent started: " + name_);
    return true;
}

void Agent::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = AgentStatus::Offline;
        if (!running_.exchange(false)) {
            return;
        }
    }

    intakeCondition_.notify_all();
    if (intakeThread_.joinable()) {
        intakeThread_.join();
    }

    // In-flight executions finish naturally
    pool_.stop();

    std::size_t queued = queuedCount();
    if (queued > 0) {
        LOG_WARN("Agent " + name_ + " stopped with " + std::to_string(queued) + " queued task(s)");
    }
    LOG_INFO("Agent stopped: " + name_);
}

bool Agent::assign(const TaskPtr& task) {
    if (!task) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!canAcceptLocked(*task)) {
        LOG_DEBUG("Agent " + name_ + " refused task: " + task->id());
        return false;
    }

    if (running_.load() && intake_.empty() &&
        current_.size() < static_cast<std::size_t>(maxConcurrent_)) {
        beginExecutionLocked(task);
    } else {
        intake_.push_back(task);
        LOG_DEBUG("Agent " + name_ + " queued task: " + task->id() +
                  " (queue: " + std::to_string(intake_.size()) + ")");
    }
    return true;
}

bool Agent::canAccept(const Task& task) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return canAcceptLocked(task);
}

bool Agent::canAcceptLocked(const Task& task) const {
    if (status_ == AgentStatus::Offline) {
        return false;
    }
    const auto& required = task.requiredCapabilities();
    return std::all_of(required.begin(), required.end(),
        [this](const std::string& cap) { return capabilities_.count(cap) > 0; });
}

void Agent::addCapability(const std::string& capability, std::string description,
                          nlohmann::json parameters) {
    std::lock_guard<std::mutex> lock(mutex_);
    capabilities_.insert(capability);
    if (description.empty() && (parameters.is_null() || parameters.empty())) {
        capabilityInfo_.erase(capability);
        return;
    }
    capabilityInfo_[capability] = CapabilityInfo{std::move(description),
        parameters.is_null() ? nlohmann::json::object() : std::move(parameters)};
}

bool Agent::hasCapability(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_.count(capability) > 0;
}

CapabilitySet Agent::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

std::optional<CapabilityInfo> Agent::capabilityInfo(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = capabilityInfo_.find(capability);
    if (it == capabilityInfo_.end()) {
        return std::nullopt;
    }
    return it->second;
}

AgentStatus Agent::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::size_t Agent::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.size();
}

std::size_t Agent::queuedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return intake_.size();
}

AgentMetrics Agent::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

std::vector<TaskPtr> Agent::takeQueued() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskPtr> queued(intake_.begin(), intake_.end());
    intake_.clear();
    return queued;
}

void Agent::setMessageHandler(MessageHandler handler, const std::string& recipient) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
    notifyRecipient_ = recipient;
}

void Agent::sendMessage(const std::string& recipient, MessageType type, nlohmann::json content) {
    notify(Message::create(name_, recipient, type, std::move(content)));
}

void Agent::notify(const Message& message) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (!handler) {
        return;
    }

    try {
        handler(message);
    } catch (const std::exception& e) {
        LOG_ERROR("Agent " + name_ + " message handler error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Agent " + name_ + " unknown message handler error");
    }
}

void Agent::beginExecutionLocked(const TaskPtr& task) {
    if (!task->markRunning(name_)) {
        LOG_WARN("Agent " + name_ + " skipped task not in pending state: " + task->id() +
                 " (" + toString(task->status()) + ")");
        return;
    }

    current_[task->id()] = task;
    if (status_ != AgentStatus::Error) {
        status_ = AgentStatus::Busy;
    }
    metrics_.lastActivity = Clock::now();

    if (!pool_.submit([this, task] { execute(task); })) {
        current_.erase(task->id());
        (void)task->fail("Agent " + name_ + " could not schedule execution");
        ++metrics_.tasksFailed;
        if (current_.empty() && status_ != AgentStatus::Offline) {
            status_ = AgentStatus::Idle;
        }
        LOG_ERROR("Agent " + name_ + " failed to dispatch task: " + task->id());
        return;
    }

    LOG_INFO("Agent " + name_ + " started task: " + task->id() + " (" + task->description() + ")");
}

void Agent::execute(const TaskPtr& task) {
    auto startTime = std::chrono::steady_clock::now();

    ExecResult result;
    try {
        result = executor_->execute(*task);
    } catch (const std::exception& e) {
        result = {false, nullptr, e.what()};
    } catch (...) {
        result = {false, nullptr, "Unknown execution error"};
    }

    if (!result.ok && result.error.empty()) {
        result.error = "Task execution failed";
    }

    bool applied = result.ok ? task->complete(result.output) : task->fail(result.error);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

    std::string recipient;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.erase(task->id());
        metrics_.totalExecutionSeconds += elapsed;
        metrics_.lastActivity = Clock::now();

        if (applied) {
            if (result.ok) {
                ++metrics_.tasksCompleted;
            } else {
                ++metrics_.tasksFailed;
                if (status_ != AgentStatus::Offline) {
                    status_ = AgentStatus::Error;
                }
            }
        }

        if (current_.empty() && status_ != AgentStatus::Offline) {
            status_ = AgentStatus::Idle;
        }
        recipient = notifyRecipient_;
    }

    if (!applied) {
        LOG_WARN("Agent " + name_ + " outcome for task " + task->id() + " discarded, already " +
                 toString(task->status()));
        return;
    }

    if (result.ok) {
        LOG_INFO("Agent " + name_ + " completed task: " + task->id());
    } else {
        LOG_WARN("Agent " + name_ + " failed task: " + task->id() + " - " + result.error);
    }

    nlohmann::json content = {{"task_id", task->id()}, {"success", result.ok}};
    if (result.ok) {
        content["result"] = result.output;
    } else {
        content["error"] = result.error;
    }
    sendMessage(recipient, MessageType::TaskResponse, std::move(content));
}

void Agent::intakeLoop() {
    setThreadName("Agent-" + name_ + "-intake");
    LOG_DEBUG("Intake loop started for agent: " + name_);

    while (running_.load()) {
        try {
            std::unique_lock<std::mutex> lock(mutex_);
            intakeCondition_.wait_for(lock, config_.intakePollInterval,
                [this] { return !running_.load(); });
            if (!running_.load()) {
                break;
            }

            while (!intake_.empty() && current_.size() < static_cast<std::size_t>(maxConcurrent_)) {
                TaskPtr task = intake_.front();
                intake_.pop_front();
                beginExecutionLocked(task);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Agent " + name_ + " intake loop error: " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ != AgentStatus::Offline) {
                status_ = AgentStatus::Error;
            }
        } catch (...) {
            LOG_ERROR("Agent " + name_ + " unknown intake loop error");
        }
    }

    LOG_DEBUG("Intake loop stopped for agent: " + name_);
    clearThreadName();
}

nlohmann::json Agent::statusJson() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> caps(capabilities_.begin(), capabilities_.end());
    std::sort(caps.begin(), caps.end());

    nlohmann::json details = nlohmann::json::object();
    for (const auto& entry : capabilityInfo_) {
        details[entry.first] = {
            {"description", entry.second.description},
            {"parameters", entry.second.parameters}
        };
    }

    return {
        {"name", name_},
        {"status", toString(status_)},
        {"capabilities", caps},
        {"capability_details", details},
        {"max_concurrent_tasks", maxConcurrent_},
        {"current_tasks", current_.size()},
        {"queued_tasks", intake_.size()},
        {"completed_tasks", metrics_.tasksCompleted},
        {"metrics", {
            {"tasks_completed", metrics_.tasksCompleted},
            {"tasks_failed", metrics_.tasksFailed},
            {"total_execution_time", metrics_.totalExecutionSeconds},
            {"last_activity", metrics_.lastActivity ? nlohmann::json(toIso8601(*metrics_.lastActivity))
                                                    : nlohmann::json(nullptr)}
        }}
    };
}

}
