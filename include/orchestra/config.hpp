/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace orchestra {

struct AgentConfig {
    // How often the intake loop looks for queued tasks it can start.
    std::chrono::milliseconds intakePollInterval{10};

    // ORCHESTRA_AGENT_POLL_MS
    [[nodiscard]] static AgentConfig fromEnv();
};

struct SystemConfig {
    std::string name = "system";
    std::chrono::milliseconds tickInterval{1000};
    std::chrono::milliseconds resultPollInterval{100};
    std::chrono::milliseconds busPollInterval{100};
    std::size_t historyCapacity = 1000;

    // ORCHESTRA_SYSTEM_NAME, ORCHESTRA_TICK_MS, ORCHESTRA_RESULT_POLL_MS,
    // ORCHESTRA_BUS_POLL_MS, ORCHESTRA_HISTORY_CAPACITY
    [[nodiscard]] static SystemConfig fromEnv();
};

}
