#include "orchestra/system.hpp"
#include "test_util.hpp"
#include <atomic>
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace orchestra;
using namespace std::chrono_literals;

static std::atomic<bool> gRelease{false};

static SystemConfig fastConfig() {
    SystemConfig config;
    config.tickInterval = 20ms;
    config.resultPollInterval = 10ms;
    config.busPollInterval = 10ms;
    return config;
}

// Sleeps for parameters.sleep_ms; parameters.block holds it until gRelease.
static std::shared_ptr<Executor> workExecutor() {
    return makeExecutor([](const Task& task) -> ExecResult {
        std::this_thread::sleep_for(std::chrono::milliseconds(task.parameters().value("sleep_ms", 10)));
        if (task.parameters().value("block", false)) {
            waitUntil([] { return gRelease.load(); }, 5000ms);
        }
        return {true, "done: " + task.description(), ""};
    });
}

static std::shared_ptr<Agent> makeAgent(const std::string& name, CapabilitySet caps, int maxConcurrent = 1) {
    AgentConfig config;
    config.intakePollInterval = 5ms;
    return std::make_shared<Agent>(name, std::move(caps), workExecutor(), maxConcurrent, config);
}

static TaskPtr makeTask(const std::string& description, CapabilitySet caps,
                        nlohmann::json params = nlohmann::json::object(),
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                        std::vector<TaskId> deps = {}) {
    return std::make_shared<Task>(description, std::move(caps), TaskPriority::Medium,
                                  std::move(params), timeout, std::move(deps));
}

static void test_end_to_end() {
    AgentSystem system(fastConfig());
    assert(system.registerAgent(makeAgent("worker", {"compute"})));
    assert(system.start());
    assert(system.isRunning());
    assert(system.agent("worker")->isRunning());

    auto task = makeTask("sum", {"compute"});
    TaskId id = system.submit(task);
    assert(id == task->id());

    TaskPtr result = system.waitForResult(id, 3000ms);
    assert(result);
    assert(result->status() == TaskStatus::Completed);
    assert(*result->result() == "done: sum");
    assert(result->assignedAgent().value_or("") == "worker");

    assert(waitUntil([&] { return system.agent("worker")->metrics().tasksCompleted == 1; }));
    auto stats = system.scheduler().stats();
    assert(stats.completed == 1);
    assert(stats.running == 0);
    assert(stats.pending == 0);

    system.shutdown();
    assert(!system.isRunning());
    assert(system.agent("worker")->status() == AgentStatus::Offline);
}

static void test_dependencies() {
    AgentSystem system(fastConfig());
    assert(system.registerAgent(makeAgent("worker", {"compute"}, 2)));
    assert(system.start());

    auto first = makeTask("first", {"compute"}, {{"sleep_ms", 50}});
    auto second = makeTask("second", {"compute"}, nlohmann::json::object(), std::nullopt, {first->id()});
    system.submit(second);
    system.submit(first);

    auto done = system.waitForResult(second->id(), 3000ms);
    assert(done);
    assert(done->status() == TaskStatus::Completed);
    assert(first->status() == TaskStatus::Completed);
    assert(*second->startedAt() >= *first->completedAt());
    system.shutdown();
}

static void test_timeout() {
    AgentSystem system(fastConfig());
    assert(system.registerAgent(makeAgent("slow", {"compute"})));
    assert(system.start());

    auto task = makeTask("stuck", {"compute"}, {{"sleep_ms", 400}}, 50ms);
    system.submit(task);

    auto result = system.waitForResult(task->id(), 3000ms);
    assert(result);
    assert(result->status() == TaskStatus::Failed);
    assert(result->error().value_or("") == "Task timeout exceeded");

    // The executor's late success does not overwrite the timeout
    assert(waitUntil([&] { return system.agent("slow")->runningCount() == 0; }));
    assert(task->status() == TaskStatus::Failed);
    assert(!task->result());
    assert(system.agent("slow")->metrics().tasksCompleted == 0);
    system.shutdown();
}

static void test_wait_without_result() {
    AgentSystem system(fastConfig());
    assert(system.registerAgent(makeAgent("worker", {"compute"})));
    assert(system.start());

    assert(!system.waitForResult("no-such-task", 50ms));

    auto orphan = makeTask("needs gpu", {"gpu"});
    system.submit(orphan);
    assert(!system.waitForResult(orphan->id(), 100ms));
    assert(orphan->status() == TaskStatus::Pending);
    assert(system.scheduler().stats().pending == 1);
    system.shutdown();
}

static void test_external_task_response() {
    gRelease.store(false);
    AgentSystem system(fastConfig());
    assert(system.registerAgent(makeAgent("worker", {"compute"})));
    assert(system.start());

    auto task = makeTask("held", {"compute"}, {{"block", true}});
    system.submit(task);
    assert(waitUntil([&] {
        return task->status() == TaskStatus::Running && system.scheduler().stats().running == 1;
    }));

    // Malformed responses are ignored
    system.sendMessage(Message::create("observer", "system", MessageType::TaskResponse, "garbage"));
    system.sendMessage(Message::create("observer", "system", MessageType::TaskResponse, {{"success", true}}));

    system.sendMessage(Message::create("observer", "system", MessageType::TaskResponse,
        {{"task_id", task->id()}, {"success", true}, {"result", "external"}}));

    auto result = system.waitForResult(task->id(), 3000ms);
    assert(result);
    assert(result->status() == TaskStatus::Completed);
    assert(*result->result() == "external");

    gRelease.store(true);
    assert(waitUntil([&] { return system.agent("worker")->runningCount() == 0; }));
    assert(*task->result() == "external");
    system.shutdown();
}

static void test_broadcast() {
    AgentSystem system(fastConfig());
    assert(system.registerAgent(makeAgent("a", {"compute"})));
    assert(system.registerAgent(makeAgent("b", {"compute"})));
    assert(system.registerAgent(makeAgent("c", {"report"})));
    assert(system.start());

    system.broadcast("a", MessageType::Coordination, {{"note", "sync"}});
    assert(waitUntil([&] {
        return system.bus().messagesFor("b").size() == 1 && system.bus().messagesFor("c").size() == 1;
    }));
    assert(system.bus().messagesFor("a").empty());
    auto received = system.bus().messagesFor("c");
    assert(received[0].sender == "a");
    assert(received[0].type == MessageType::Coordination);
    assert(received[0].content["note"] == "sync");
    system.shutdown();
}

static void test_registry() {
    AgentSystem system(fastConfig());
    assert(system.registerAgent(makeAgent("alpha", {"compute", "report"})));
    assert(system.registerAgent(makeAgent("beta", {"compute"})));
    assert(!system.registerAgent(makeAgent("alpha", {"other"})));
    assert(!system.registerAgent(nullptr));

    auto computes = system.findAgentsByCapability("compute");
    assert(computes.size() == 2);
    assert(computes[0] == "alpha");
    assert(computes[1] == "beta");
    auto reporters = system.findAgentsByCapability("report");
    assert(reporters.size() == 1 && reporters[0] == "alpha");
    assert(system.findAgentsByCapability("gpu").empty());

    auto status = system.status();
    assert(status["name"] == "system");
    assert(status["running"] == false);
    assert(status["agents"].size() == 2);
    assert(status["agents"]["alpha"]["status"] == "idle");
    assert(status["tasks"]["pending_tasks"] == 0);
    assert(status["message_bus"]["messages_sent"] == 0);
    assert(status["message_bus"]["subscribers"].contains("beta"));

    assert(!system.agent("alpha")->hasCapability("other"));
    assert(!system.unregisterAgent("gamma"));
    assert(system.unregisterAgent("beta"));
    assert(!system.agent("beta"));
    assert(system.findAgentsByCapability("compute").size() == 1);
}

static void test_unregister_recovers_queued() {
    AgentSystem system(fastConfig());
    auto agent = makeAgent("idle-hands", {"compute"});
    assert(system.registerAgent(agent));

    // Not started: the agent only queues
    auto task = makeTask("queued", {"compute"});
    assert(agent->assign(task));
    assert(agent->queuedCount() == 1);
    assert(system.scheduler().stats().pending == 0);

    assert(system.unregisterAgent("idle-hands"));
    assert(agent->queuedCount() == 0);
    assert(task->status() == TaskStatus::Pending);
    assert(system.scheduler().stats().pending == 1);
    assert(system.scheduler().next({"compute"}) == task);
}

static void test_config_from_env() {
    setenv("ORCHESTRA_SYSTEM_NAME", "hub", 1);
    setenv("ORCHESTRA_TICK_MS", "250", 1);
    setenv("ORCHESTRA_HISTORY_CAPACITY", "bogus", 1);
    setenv("ORCHESTRA_AGENT_POLL_MS", "0", 1);
    setenv("ORCHESTRA_BUS_POLL_MS", "-5", 1);
    setenv("ORCHESTRA_RESULT_POLL_MS", "20ms", 1);

    auto config = SystemConfig::fromEnv();
    assert(config.name == "hub");
    assert(config.tickInterval == 250ms);
    assert(config.resultPollInterval == 100ms);
    assert(config.busPollInterval == 100ms);
    assert(config.historyCapacity == 1000);
    assert(AgentConfig::fromEnv().intakePollInterval == 10ms);

    // Negative values must not wrap around
    setenv("ORCHESTRA_TICK_MS", "-5", 1);
    setenv("ORCHESTRA_HISTORY_CAPACITY", "-1", 1);
    auto negative = SystemConfig::fromEnv();
    assert(negative.tickInterval == 1000ms);
    assert(negative.historyCapacity == 1000);

    unsetenv("ORCHESTRA_SYSTEM_NAME");
    unsetenv("ORCHESTRA_TICK_MS");
    unsetenv("ORCHESTRA_HISTORY_CAPACITY");
    unsetenv("ORCHESTRA_AGENT_POLL_MS");
    unsetenv("ORCHESTRA_BUS_POLL_MS");
    unsetenv("ORCHESTRA_RESULT_POLL_MS");

    AgentSystem system(config);
    assert(system.status()["name"] == "hub");
    assert(system.bus().historyCapacity() == 1000);
}

int main() {
    test_end_to_end();
    test_dependencies();
    test_timeout();
    test_wait_without_result();
    test_external_task_response();
    test_broadcast();
    test_registry();
    test_unregister_recovers_queued();
    test_config_from_env();
    std::cout << "AgentSystem test PASSED\n";
    return 0;
}
