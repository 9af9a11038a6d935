/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/clock.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace orchestra {

std::string toIso8601(TimePoint tp) {
    auto time = Clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()) % 1000000;
    if (micros.count() < 0) {
        micros += std::chrono::seconds(1);
        --time;
    }

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << micros.count() << "Z";
    return ss.str();
}

TimePoint parseIso8601(const std::string& text) {
    std::tm utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }

    long micros = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (std::isdigit(ss.peek())) {
            char c = static_cast<char>(ss.get());
            if (digits < 6) {
                micros = micros * 10 + (c - '0');
                ++digits;
            }
        }
        if (digits == 0) {
            throw std::invalid_argument("Invalid ISO-8601 fraction: " + text);
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }
    if (ss.peek() == 'Z') {
        ss.get();
    }
    if (ss.peek() != std::char_traits<char>::eof()) {
        throw std::invalid_argument("Trailing characters in timestamp: " + text);
    }

    std::time_t seconds = timegm(&utc);
    return Clock::from_time_t(seconds) + std::chrono::microseconds(micros);
}

}
