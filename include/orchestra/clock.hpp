/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>

namespace orchestra {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ISO-8601 UTC with microseconds, e.g. "2025-03-01T12:30:05.123456Z".
[[nodiscard]] std::string toIso8601(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fraction and optional 'Z'.
// Throws std::invalid_argument on malformed input.
[[nodiscard]] TimePoint parseIso8601(const std::string& text);

}
