/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/router.hpp"
#include "orchestra/bus.hpp"
#include "orchestra/logger.hpp"

namespace orchestra {

void Router::addRule(RoutingRule rule) {
    if (!rule) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.push_back(std::move(rule));
}

void Router::route(Message message) {
    std::vector<RoutingRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules = rules_;
    }

    for (const auto& rule : rules) {
        try {
            if (auto target = rule(message)) {
                LOG_TRACE("Routing message " + message.id + ": " + message.recipient + " -> " + *target);
                message.recipient = *target;
                break;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Error applying routing rule: " + std::string(e.what()));
        } catch (...) {
            LOG_WARN("Unknown error applying routing rule");
        }
    }

    bus_.send(std::move(message));
}

}
