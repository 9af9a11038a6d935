/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "orchestra/clock.hpp"
#include "orchestra/types.hpp"

namespace orchestra {

struct Message {
    MessageId id;
    std::string sender;
    std::string recipient;
    MessageType type = MessageType::Info;
    nlohmann::json content;
    TimePoint timestamp;
    std::optional<MessageId> replyTo;
    nlohmann::json metadata = nlohmann::json::object();

    // Fresh message with a generated id and the current timestamp.
    [[nodiscard]] static Message create(const std::string& sender, const std::string& recipient,
                                        MessageType type, nlohmann::json content);

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static Message fromJson(const nlohmann::json& data);
};

using MessageHandler = std::function<void(const Message&)>;

}
