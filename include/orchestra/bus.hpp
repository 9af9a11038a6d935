/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestra/clock.hpp"
#include "orchestra/message.hpp"

namespace orchestra {

using SubscriptionId = std::uint64_t;

struct BusStats {
    std::uint64_t sent = 0;
    std::uint64_t delivered = 0;
    std::uint64_t failed = 0;
    std::size_t queueSize = 0;
    std::size_t historySize = 0;
    std::map<std::string, std::size_t> subscribers;

    [[nodiscard]] nlohmann::json toJson() const;
};

// Asynchronous delivery of messages to handlers subscribed under a
// recipient name. Any thread may send; one delivery thread consumes.
class MessageBus final {
public:
    explicit MessageBus(std::size_t historyCapacity = 1000,
                        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;
    MessageBus(MessageBus&&) = delete;
    MessageBus& operator=(MessageBus&&) = delete;

    bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    SubscriptionId subscribe(const std::string& recipient, MessageHandler handler);
    bool unsubscribe(const std::string& recipient, SubscriptionId id);

    // Queued for delivery; accepted even before start().
    void send(Message message);

    [[nodiscard]] std::vector<Message> messagesFor(const std::string& recipient,
                                                   std::optional<TimePoint> since = std::nullopt) const;
    [[nodiscard]] BusStats stats() const;
    [[nodiscard]] std::size_t historyCapacity() const noexcept { return historyCapacity_; }

private:
    void deliveryLoop();
    void deliver(const Message& message);

    std::size_t historyCapacity_;
    std::chrono::milliseconds pollInterval_;

    mutable std::mutex queueMutex_;
    std::condition_variable messageAvailable_;
    std::deque<Message> inbound_;

    mutable std::mutex stateMutex_;
    std::unordered_map<std::string, std::vector<std::pair<SubscriptionId, MessageHandler>>> subscribers_;
    std::deque<Message> history_;
    SubscriptionId nextSubscription_ = 1;

    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> failed_{0};

    std::atomic<bool> running_{false};
    std::thread deliveryThread_;
};

}
