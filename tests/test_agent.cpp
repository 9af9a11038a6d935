#include "orchestra/agent.hpp"
#include "test_util.hpp"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace orchestra;
using namespace std::chrono_literals;

static AgentConfig fastConfig() {
    AgentConfig config;
    config.intakePollInterval = 5ms;
    return config;
}

// Sleeps for parameters.sleep_ms, throws when parameters.fail is set.
static std::shared_ptr<Executor> sleepingExecutor() {
    return makeExecutor([](const Task& task) -> ExecResult {
        std::this_thread::sleep_for(std::chrono::milliseconds(task.parameters().value("sleep_ms", 20)));
        if (task.parameters().value("fail", false)) {
            throw std::runtime_error("executor exploded");
        }
        return {true, "Test result for " + task.description(), ""};
    });
}

static TaskPtr makeTask(const std::string& description, CapabilitySet caps,
                        nlohmann::json params = nlohmann::json::object()) {
    return std::make_shared<Task>(description, std::move(caps), TaskPriority::Medium, std::move(params));
}

static void test_creation() {
    Agent agent("test_agent", {"test_capability"}, sleepingExecutor());
    assert(agent.name() == "test_agent");
    assert(agent.status() == AgentStatus::Idle);
    assert(agent.hasCapability("test_capability"));
    assert(!agent.hasCapability("nonexistent_capability"));

    agent.addCapability("extra");
    assert(agent.hasCapability("extra"));
    assert(agent.capabilities().size() == 2);
    assert(!agent.capabilityInfo("extra"));

    agent.addCapability("search", "Web search", {{"max_results", 10}});
    auto info = agent.capabilityInfo("search");
    assert(info);
    assert(info->description == "Web search");
    assert(info->parameters["max_results"] == 10);
    assert(agent.capabilities().size() == 3);

    auto status = agent.statusJson();
    assert(status["name"] == "test_agent");
    assert(status["status"] == "idle");
    assert(status["current_tasks"] == 0);
    assert(status["completed_tasks"] == 0);
    assert(status["metrics"]["last_activity"].is_null());
    assert(status["capability_details"]["search"]["description"] == "Web search");
    assert(!status["capability_details"].contains("extra"));

    bool threw = false;
    try {
        Agent broken("broken", {}, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_execution() {
    Agent agent("runner", {"test_capability"}, sleepingExecutor(), 1, fastConfig());
    assert(agent.start());

    auto task = makeTask("Test task", {"test_capability"}, {{"sleep_ms", 100}});
    assert(agent.assign(task));
    assert(task->status() == TaskStatus::Running);
    assert(task->assignedAgent().value() == "runner");
    assert(agent.status() == AgentStatus::Busy);

    assert(waitUntil([&] { return task->status() == TaskStatus::Completed; }));
    assert(task->result().value() == "Test result for Test task");
    assert(waitUntil([&] { return agent.status() == AgentStatus::Idle; }));

    auto metrics = agent.metrics();
    assert(metrics.tasksCompleted == 1);
    assert(metrics.tasksFailed == 0);
    assert(metrics.lastActivity);
    assert(metrics.totalExecutionSeconds > 0.0);

    agent.stop();
    assert(agent.status() == AgentStatus::Offline);
}

static void test_concurrency_cap() {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    auto executor = makeExecutor([&](const Task& task) -> ExecResult {
        int now = active.fetch_add(1) + 1;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(150ms);
        active.fetch_sub(1);
        return {true, task.description(), ""};
    });

    Agent agent("pair", {"work"}, executor, 2, fastConfig());
    assert(agent.start());

    std::vector<TaskPtr> tasks;
    for (int i = 0; i < 3; ++i) {
        tasks.push_back(makeTask("Task " + std::to_string(i), {"work"}));
    }
    assert(agent.assign(tasks[0]));
    assert(agent.assign(tasks[1]));
    assert(agent.assign(tasks[2]));  // accepted but queued

    assert(tasks[2]->status() == TaskStatus::Pending);
    assert(agent.runningCount() == 2);
    assert(agent.queuedCount() == 1);

    assert(waitUntil([&] {
        return std::all_of(tasks.begin(), tasks.end(),
            [](const TaskPtr& t) { return t->status() == TaskStatus::Completed; });
    }));
    assert(peak.load() == 2);
    assert(agent.metrics().tasksCompleted == 3);

    auto firstDone = std::min(tasks[0]->completedAt().value(), tasks[1]->completedAt().value());
    assert(tasks[2]->startedAt().value() >= firstDone);

    agent.stop();
}

static void test_rejection() {
    Agent agent("picky", {"test_capability"}, sleepingExecutor(), 1, fastConfig());
    assert(agent.start());

    auto task = makeTask("Unsupported task", {"unsupported_capability"});
    assert(!agent.canAccept(*task));
    assert(!agent.assign(task));
    assert(task->status() == TaskStatus::Pending);

    agent.stop();
    auto supported = makeTask("Supported task", {"test_capability"});
    assert(!agent.assign(supported));
    assert(supported->status() == TaskStatus::Pending);
}

static void test_failure_sets_error() {
    Agent agent("fragile", {"work"}, sleepingExecutor(), 2, fastConfig());
    assert(agent.start());

    auto slow = makeTask("slow", {"work"}, {{"sleep_ms", 300}});
    auto bad = makeTask("bad", {"work"}, {{"sleep_ms", 10}, {"fail", true}});
    assert(agent.assign(slow));
    assert(agent.assign(bad));

    assert(waitUntil([&] { return bad->status() == TaskStatus::Failed; }));
    assert(bad->error().value() == "executor exploded");
    assert(bad->completedAt());
    assert(waitUntil([&] { return agent.metrics().tasksFailed == 1; }));

    // Sticky while other work is in flight
    assert(agent.status() == AgentStatus::Error);

    assert(waitUntil([&] { return slow->status() == TaskStatus::Completed; }));
    assert(waitUntil([&] { return agent.status() == AgentStatus::Idle; }));

    agent.stop();
}

static void test_result_failure_without_throw() {
    auto executor = makeExecutor([](const Task&) -> ExecResult { return {false, nullptr, "no luck"}; });
    Agent agent("unlucky", {}, executor, 1, fastConfig());
    assert(agent.start());

    auto task = makeTask("attempt", {});
    assert(agent.assign(task));
    assert(waitUntil([&] { return task->status() == TaskStatus::Failed; }));
    assert(task->error().value() == "no luck");
    assert(waitUntil([&] { return agent.metrics().tasksFailed == 1; }));
    agent.stop();
}

static void test_notifications() {
    Agent agent("talker", {"work"}, sleepingExecutor(), 1, fastConfig());

    std::mutex mutex;
    std::vector<Message> received;
    agent.setMessageHandler([&](const Message& message) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(message);
    }, "coordinator");
    assert(agent.start());

    auto ok = makeTask("ok", {"work"});
    assert(agent.assign(ok));
    assert(waitUntil([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return received.size() == 1;
    }));

    auto bad = makeTask("bad", {"work"}, {{"fail", true}});
    assert(waitUntil([&] { return agent.status() == AgentStatus::Idle; }));
    assert(agent.assign(bad));
    assert(waitUntil([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return received.size() == 2;
    }));

    std::lock_guard<std::mutex> lock(mutex);
    assert(received[0].type == MessageType::TaskResponse);
    assert(received[0].sender == "talker");
    assert(received[0].recipient == "coordinator");
    assert(received[0].content["task_id"] == ok->id());
    assert(received[0].content["success"] == true);
    assert(received[0].content["result"] == "Test result for ok");
    assert(received[1].content["success"] == false);
    assert(received[1].content["error"] == "executor exploded");

    agent.stop();
}

static void test_queue_before_start() {
    Agent agent("late", {"work"}, sleepingExecutor(), 1, fastConfig());

    auto first = makeTask("first", {"work"});
    auto second = makeTask("second", {"work"});
    assert(agent.assign(first));
    assert(agent.assign(second));
    assert(first->status() == TaskStatus::Pending);
    assert(agent.queuedCount() == 2);

    auto taken = agent.takeQueued();
    assert(taken.size() == 2);
    assert(taken[0] == first);
    assert(agent.queuedCount() == 0);

    assert(agent.assign(first));
    assert(agent.start());
    assert(waitUntil([&] { return first->status() == TaskStatus::Completed; }));
    assert(second->status() == TaskStatus::Pending);
    agent.stop();
}

int main() {
    test_creation();
    test_execution();
    test_concurrency_cap();
    test_rejection();
    test_failure_sets_error();
    test_result_failure_without_throw();
    test_notifications();
    test_queue_before_start();
    std::cout << "Agent test PASSED\n";
    return 0;
}
