/*
 * orchestra - In-process Task Orchestration
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace orchestra {

class Task;

struct ExecResult {
    bool ok = false;
    nlohmann::json output;
    std::string error;
};

// The domain work an agent performs. Implementations may block; they run on
// the owning agent's execution threads. Throwing is treated as failure.
class Executor {
public:
    virtual ~Executor() = default;
    [[nodiscard]] virtual ExecResult execute(const Task& task) = 0;
};

using ExecuteFn = std::function<ExecResult(const Task&)>;

class FunctionExecutor final : public Executor {
public:
    explicit FunctionExecutor(ExecuteFn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] ExecResult execute(const Task& task) override { return fn_(task); }

private:
    ExecuteFn fn_;
};

[[nodiscard]] inline std::shared_ptr<Executor> makeExecutor(ExecuteFn fn) {
    return std::make_shared<FunctionExecutor>(std::move(fn));
}

}
