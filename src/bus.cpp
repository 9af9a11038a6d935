/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/bus.hpp"
#include "orchestra/logger.hpp"
#include <algorithm>

namespace orchestra {

nlohmann::json BusStats::toJson() const {
    return {
        {"messages_sent", sent},
        {"messages_delivered", delivered},
        {"messages_failed", failed},
        {"queue_size", queueSize},
        {"history_size", historySize},
        {"subscribers", subscribers}
    };
}

MessageBus::MessageBus(std::size_t historyCapacity, std::chrono::milliseconds pollInterval)
    : historyCapacity_(historyCapacity), pollInterval_(pollInterval) {
}

MessageBus::~MessageBus() {
    stop();
}

bool MessageBus::start() {
    if (running_.load()) {
        LOG_WARN("Message bus already running");
        return false;
    }

    running_.store(true);
    try {
        deliveryThread_ = std::thread(&MessageBus::deliveryLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start message bus: " + std::string(e.what()));
        running_.store(false);
        return false;
    }

    LOG_DEBUG("Message bus started");
    return true;
}

void MessageBus::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }

    messageAvailable_.notify_all();
    if (deliveryThread_.joinable()) {
        deliveryThread_.join();
    }
    LOG_DEBUG("Message bus stopped");
}

SubscriptionId MessageBus::subscribe(const std::string& recipient, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    SubscriptionId id = nextSubscription_++;
    subscribers_[recipient].emplace_back(id, std::move(handler));
    LOG_DEBUG("Subscribed handler " + std::to_string(id) + " for: " + recipient);
    return id;
}

bool MessageBus::unsubscribe(const std::string& recipient, SubscriptionId id) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto it = subscribers_.find(recipient);
    if (it == subscribers_.end()) {
        return false;
    }

    auto& handlers = it->second;
    auto before = handlers.size();
    handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
        [id](const std::pair<SubscriptionId, MessageHandler>& entry) { return entry.first == id; }),
        handlers.end());
    bool removed = handlers.size() != before;
    if (handlers.empty()) {
        subscribers_.erase(it);
    }
    return removed;
}

void MessageBus::send(Message message) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        inbound_.push_back(std::move(message));
    }
    sent_.fetch_add(1);
    messageAvailable_.notify_one();
}

std::vector<Message> MessageBus::messagesFor(const std::string& recipient,
                                             std::optional<TimePoint> since) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    std::vector<Message> messages;
    for (const auto& message : history_) {
        if (message.recipient != recipient) {
            continue;
        }
        if (since && message.timestamp < *since) {
            continue;
        }
        messages.push_back(message);
    }
    return messages;
}

BusStats MessageBus::stats() const {
    BusStats stats;
    stats.sent = sent_.load();
    stats.delivered = delivered_.load();
    stats.failed = failed_.load();
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stats.queueSize = inbound_.size();
    }
    std::lock_guard<std::mutex> lock(stateMutex_);
    stats.historySize = history_.size();
    for (const auto& entry : subscribers_) {
        stats.subscribers[entry.first] = entry.second.size();
    }
    return stats;
}

void MessageBus::deliveryLoop() {
    setThreadName("MessageBus");
    LOG_DEBUG("Message delivery loop started");

    while (running_.load()) {
        try {
            Message message;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                messageAvailable_.wait_for(lock, pollInterval_, [this] {
                    return !inbound_.empty() || !running_.load();
                });
                if (!running_.load() || inbound_.empty()) {
                    continue;
                }
                message = std::move(inbound_.front());
                inbound_.pop_front();
            }

            deliver(message);
        } catch (const std::exception& e) {
            LOG_ERROR("Message bus loop error: " + std::string(e.what()));
            failed_.fetch_add(1);
        } catch (...) {
            LOG_ERROR("Unknown message bus loop error");
            failed_.fetch_add(1);
        }
    }

    LOG_DEBUG("Message delivery loop stopped");
    clearThreadName();
}

void MessageBus::deliver(const Message& message) {
    std::vector<MessageHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        history_.push_back(message);
        while (history_.size() > historyCapacity_) {
            history_.pop_front();
        }

        auto it = subscribers_.find(message.recipient);
        if (it != subscribers_.end()) {
            for (const auto& entry : it->second) {
                handlers.push_back(entry.second);
            }
        }
    }

    if (handlers.empty()) {
        LOG_DEBUG("No subscribers found for " + message.recipient);
        failed_.fetch_add(1);
        return;
    }

    for (const auto& handler : handlers) {
        try {
            handler(message);
            delivered_.fetch_add(1);
        } catch (const std::exception& e) {
            LOG_WARN("Error delivering message to " + message.recipient + ": " + std::string(e.what()));
            failed_.fetch_add(1);
        } catch (...) {
            LOG_WARN("Unknown error delivering message to " + message.recipient);
            failed_.fetch_add(1);
        }
    }
}

}
