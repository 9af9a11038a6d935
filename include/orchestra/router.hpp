/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "orchestra/message.hpp"

namespace orchestra {

class MessageBus;

// Returns the recipient a message should go to, or nullopt to pass.
using RoutingRule = std::function<std::optional<std::string>(const Message&)>;

class Router final {
public:
    explicit Router(MessageBus& bus) noexcept : bus_(bus) {}

    void addRule(RoutingRule rule);

    // First rule with an answer rewrites the recipient; with no answer the
    // message goes to its original recipient.
    void route(Message message);

private:
    MessageBus& bus_;
    mutable std::mutex mutex_;
    std::vector<RoutingRule> rules_;
};

}
