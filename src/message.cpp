/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/message.hpp"
#include <stdexcept>

namespace orchestra {

Message Message::create(const std::string& sender, const std::string& recipient,
                        MessageType type, nlohmann::json content) {
    Message message;
    message.id = generateId();
    message.sender = sender;
    message.recipient = recipient;
    message.type = type;
    message.content = std::move(content);
    message.timestamp = Clock::now();
    return message;
}

nlohmann::json Message::toJson() const {
    return {
        {"id", id},
        {"sender", sender},
        {"recipient", recipient},
        {"message_type", toString(type)},
        {"content", content},
        {"timestamp", toIso8601(timestamp)},
        {"reply_to", replyTo ? nlohmann::json(*replyTo) : nlohmann::json(nullptr)},
        {"metadata", metadata}
    };
}

Message Message::fromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("Message record must be a JSON object");
    }

    Message message;
    message.id = data.at("id").get<std::string>();
    message.sender = data.at("sender").get<std::string>();
    message.recipient = data.at("recipient").get<std::string>();
    message.type = parseMessageType(data.at("message_type").get<std::string>());
    message.content = data.value("content", nlohmann::json(nullptr));
    message.timestamp = parseIso8601(data.at("timestamp").get<std::string>());

    auto replyIt = data.find("reply_to");
    if (replyIt != data.end() && !replyIt->is_null()) {
        message.replyTo = replyIt->get<std::string>();
    }
    message.metadata = data.value("metadata", nlohmann::json::object());
    return message;
}

}
