/*
 * orchestra - Demonstration daemon (orchestrad)
 * Copyright (c) 2025 The orchestra authors
 * SPDX-License-Identifier: MIT
 */

#include "orchestra/system.hpp"
#include "orchestra/logger.hpp"
#include <chrono>
#include <csignal>
#include <exception>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace orchestra;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage() {
    std::cout << "usage: orchestrad [options]\n"
              << "\n"
              << "  -a, --agents <n>       worker agents (default 2)\n"
              << "  -c, --concurrency <n>  tasks per agent at once (default 2)\n"
              << "  -n, --tasks <n>        tasks to submit (default 8)\n"
              << "  -d, --duration <ms>    simulated work per task (default 200)\n"
              << "  -t, --timeout <ms>     per-task timeout, 0 = none (default 0)\n"
              << "  -l, --log-level <lvl>  error, warn, info, debug or trace\n"
              << "  -q, --quiet            only print the final status\n"
              << "  -v, --version          print version\n"
              << "\n"
              << "  Environment: ORCHESTRA_LOG_LEVEL, ORCHESTRA_TICK_MS, ORCHESTRA_RESULT_POLL_MS,\n"
              << "               ORCHESTRA_BUS_POLL_MS, ORCHESTRA_HISTORY_CAPACITY, ORCHESTRA_AGENT_POLL_MS\n";
}

// Sleeps for parameters.duration_ms; fails when parameters.fail is set.
ExecResult simulateWork(const Task& task) {
    const auto& params = task.parameters();
    int durationMs = params.value("duration_ms", 100);
    std::this_thread::sleep_for(std::chrono::milliseconds(durationMs));

    if (params.value("fail", false)) {
        return {false, nullptr, "Simulated failure for: " + task.description()};
    }
    return {true, {{"description", task.description()}, {"duration_ms", durationMs}}, ""};
}

int main(int argc, char* argv[]) {
    int agents = 2;
    int concurrency = 2;
    int tasks = 8;
    int durationMs = 200;
    int timeoutMs = 0;
    bool quiet = false;
    std::optional<LogLevel> logLevel;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto nextInt = [&](int& out) -> bool {
            if (i + 1 >= argc) return false;
            try {
                out = std::stoi(argv[++i]);
                return out >= 0;
            } catch (const std::exception&) {
                return false;
            }
        };

        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            logLevel = parseLogLevel(argv[++i]);
            if (!logLevel) {
                std::cerr << "Error: Unknown log level: " << argv[i] << "\n";
                return 1;
            }
        } else if ((arg == "-a" || arg == "--agents") && nextInt(agents)) {
        } else if ((arg == "-c" || arg == "--concurrency") && nextInt(concurrency)) {
        } else if ((arg == "-n" || arg == "--tasks") && nextInt(tasks)) {
        } else if ((arg == "-d" || arg == "--duration") && nextInt(durationMs)) {
        } else if ((arg == "-t" || arg == "--timeout") && nextInt(timeoutMs)) {
        } else {
            std::cerr << "Error: Invalid argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (logLevel) {
        Logger::setLevel(*logLevel);
    } else if (quiet && !std::getenv("ORCHESTRA_LOG_LEVEL")) {
        Logger::setLevel(LogLevel::ERROR);
    } else {
        Logger::initFromEnv();
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    SystemConfig config = SystemConfig::fromEnv();
    AgentConfig agentConfig = AgentConfig::fromEnv();
    AgentSystem system(config);

    auto executor = makeExecutor(simulateWork);
    for (int i = 0; i < agents; ++i) {
        system.registerAgent(std::make_shared<Agent>(
            "worker-" + std::to_string(i), CapabilitySet{"compute"}, executor, concurrency, agentConfig));
    }
    system.registerAgent(std::make_shared<Agent>(
        "reporter", CapabilitySet{"compute", "report"}, executor, 1, agentConfig));

    if (!system.start()) {
        std::cerr << "Error: Failed to start agent system\n";
        return 1;
    }

    std::optional<std::chrono::milliseconds> timeout;
    if (timeoutMs > 0) {
        timeout = std::chrono::milliseconds(timeoutMs);
    }

    static const TaskPriority priorities[] = {
        TaskPriority::Low, TaskPriority::Medium, TaskPriority::High, TaskPriority::Critical
    };

    std::vector<TaskPtr> submitted;
    std::vector<TaskId> ids;
    for (int i = 0; i < tasks; ++i) {
        auto task = std::make_shared<Task>(
            "compute-" + std::to_string(i), CapabilitySet{"compute"}, priorities[i % 4],
            nlohmann::json{{"duration_ms", durationMs}}, timeout);
        ids.push_back(system.submit(task));
        submitted.push_back(task);
    }

    auto report = std::make_shared<Task>(
        "final report", CapabilitySet{"report"}, TaskPriority::Critical,
        nlohmann::json{{"duration_ms", durationMs}}, timeout, ids);
    system.submit(report);
    submitted.push_back(report);

    std::size_t finished = 0;
    while (!g_shutdown_requested && finished < submitted.size()) {
        // The report can never run once one of its inputs has failed
        if (report->status() == TaskStatus::Pending) {
            for (const auto& id : ids) {
                auto done = system.scheduler().findTerminal(id);
                if (done && done->status() == TaskStatus::Failed && report->cancel()) {
                    system.scheduler().update(report);
                    LOG_WARN("Report cancelled, input task failed: " + id);
                    break;
                }
            }
        }

        finished = 0;
        for (const auto& task : submitted) {
            if (isTerminal(task->status())) {
                ++finished;
            }
        }
        std::this_thread::sleep_for(config.resultPollInterval);
    }

    if (g_shutdown_requested) {
        LOG_INFO("Shutdown requested, stopping with " + std::to_string(submitted.size() - finished) +
                 " task(s) outstanding");
    }

    if (!quiet) {
        for (const auto& task : submitted) {
            std::cout << task->toJson().dump() << "\n";
        }
    }

    system.shutdown();
    std::cout << system.status().dump(2) << std::endl;
    return g_shutdown_requested ? 130 : 0;
}
