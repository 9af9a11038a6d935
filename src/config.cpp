/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/config.hpp"
#include "orchestra/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace orchestra {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    // Zero, negative and partly numeric values all fall back
    long long parsed = 0;
    std::size_t pos = 0;
    try {
        parsed = std::stoll(val, &pos);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Ignoring invalid value for ") + name + ": " + val + " (" + e.what() + ")");
        return defv;
    }
    if (val[pos] != '\0' || parsed <= 0) {
        LOG_WARN(std::string("Ignoring invalid value for ") + name + ": " + val);
        return defv;
    }
    return static_cast<std::size_t>(parsed);
}

std::chrono::milliseconds env_ms(const char* name, std::chrono::milliseconds defv) {
    return std::chrono::milliseconds(env_size(name, static_cast<std::size_t>(defv.count())));
}
}

AgentConfig AgentConfig::fromEnv() {
    AgentConfig config;
    config.intakePollInterval = env_ms("ORCHESTRA_AGENT_POLL_MS", config.intakePollInterval);
    return config;
}

SystemConfig SystemConfig::fromEnv() {
    SystemConfig config;
    if (const char* name = std::getenv("ORCHESTRA_SYSTEM_NAME")) {
        if (*name) config.name = name;
    }
    config.tickInterval = env_ms("ORCHESTRA_TICK_MS", config.tickInterval);
    config.resultPollInterval = env_ms("ORCHESTRA_RESULT_POLL_MS", config.resultPollInterval);
    config.busPollInterval = env_ms("ORCHESTRA_BUS_POLL_MS", config.busPollInterval);
    config.historyCapacity = env_size("ORCHESTRA_HISTORY_CAPACITY", config.historyCapacity);
    return config;
}

}
