#include "orchestra/task.hpp"
#include "orchestra/message.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace orchestra;
using namespace std::chrono_literals;

// Records carry microsecond precision
static TimePoint micros(TimePoint tp) {
    return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
}

static void test_lifecycle() {
    Task task("lifecycle", {"a"});
    assert(task.status() == TaskStatus::Pending);
    assert(!task.startedAt());

    // Terminal writes need a running task
    assert(!task.complete("early"));
    assert(!task.fail("early"));
    assert(task.status() == TaskStatus::Pending);

    assert(task.markRunning("agent-1"));
    assert(task.status() == TaskStatus::Running);
    assert(task.assignedAgent().value() == "agent-1");
    assert(task.startedAt());
    assert(!task.markRunning("agent-2"));

    assert(task.complete(nlohmann::json{{"value", 42}}));
    assert(task.status() == TaskStatus::Completed);
    assert(task.completedAt());
    assert(task.result().value()["value"] == 42);

    // First terminal write wins
    assert(!task.fail("Task timeout exceeded"));
    assert(!task.cancel());
    assert(task.status() == TaskStatus::Completed);
    assert(!task.error());
}

static void test_failure_and_cancel() {
    Task failing("failing");
    assert(failing.markRunning("agent"));
    assert(failing.fail("boom"));
    assert(failing.status() == TaskStatus::Failed);
    assert(failing.error().value() == "boom");
    assert(!failing.complete("late"));

    Task pending("pending");
    assert(pending.cancel());
    assert(pending.status() == TaskStatus::Cancelled);
    assert(!pending.markRunning("agent"));

    Task running("running");
    assert(running.markRunning("agent"));
    assert(running.cancel());
    assert(running.status() == TaskStatus::Cancelled);
}

static void test_can_start() {
    Task task("dependent", {}, TaskPriority::Medium, nlohmann::json::object(), std::nullopt, {"x", "y"});
    assert(!task.canStart({}));
    assert(!task.canStart({"x"}));
    assert(task.canStart({"y", "x"}));
    assert(task.canStart({"x", "y", "z"}));

    Task free("free");
    assert(free.canStart({}));
}

static void test_expiry_boundary() {
    Task task("timed", {}, TaskPriority::Medium, nlohmann::json::object(), 500ms);
    auto t0 = Clock::now();
    assert(!task.isExpired(t0 + 10s));  // not started yet

    assert(task.markRunning("agent", t0));
    assert(!task.isExpired(t0 + 500ms - 1ms));
    assert(task.isExpired(t0 + 500ms + 1ms));

    Task untimed("untimed");
    assert(untimed.markRunning("agent", t0));
    assert(!untimed.isExpired(t0 + 1h));

    Task zero("zero", {}, TaskPriority::Medium, nlohmann::json::object(), 0ms);
    assert(!zero.timeout());
    assert(zero.markRunning("agent", t0));
    assert(!zero.isExpired(t0 + 1h));

    Task negative("negative", {}, TaskPriority::Medium, nlohmann::json::object(), -5ms);
    assert(!negative.timeout());

    auto record = zero.toJson();
    assert(record["timeout"].is_null());
    record["timeout"] = 0.0;
    auto restored = Task::fromJson(record);
    assert(!restored->timeout());
    assert(!restored->isExpired(t0 + 1h));
}

static void test_task_record() {
    Task task("record", {"search", "analysis"}, TaskPriority::High,
              nlohmann::json{{"query", "c++"}}, 1500ms, {"dep-1"});
    assert(task.markRunning("agent-7"));
    assert(task.fail("bad input"));

    auto record = task.toJson();
    assert(record["priority"] == 3);
    assert(record["status"] == "failed");
    assert(record["timeout"] == 1.5);
    assert(record["required_capabilities"] == nlohmann::json({"analysis", "search"}));
    assert(record["result"].is_null());
    assert(record["created_at"].get<std::string>().back() == 'Z');

    auto restored = Task::fromJson(record);
    assert(restored->id() == task.id());
    assert(restored->status() == TaskStatus::Failed);
    assert(restored->priority() == TaskPriority::High);
    assert(restored->timeout().value() == 1500ms);
    assert(restored->requiredCapabilities().count("search") == 1);
    assert(restored->dependencies() == std::vector<TaskId>{"dep-1"});
    assert(restored->error().value() == "bad input");
    assert(restored->assignedAgent().value() == "agent-7");
    assert(restored->createdAt() == micros(task.createdAt()));
    assert(restored->startedAt().value() == micros(task.startedAt().value()));

    bool threw = false;
    try {
        record["priority"] = 9;
        (void)Task::fromJson(record);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void test_message_record() {
    auto message = Message::create("agent-1", "system", MessageType::TaskResponse,
                                   {{"task_id", "t1"}, {"success", true}});
    message.replyTo = "m0";
    message.metadata["trace"] = "abc";

    auto record = message.toJson();
    assert(record["message_type"] == "task_response");
    assert(record["reply_to"] == "m0");

    auto restored = Message::fromJson(record);
    assert(restored.id == message.id);
    assert(restored.type == MessageType::TaskResponse);
    assert(restored.content["task_id"] == "t1");
    assert(restored.metadata["trace"] == "abc");
    assert(restored.timestamp == micros(message.timestamp));

    assert(parseIso8601("2025-03-01T12:30:05Z") == parseIso8601("2025-03-01T12:30:05.000000"));
    assert(toIso8601(parseIso8601("2025-03-01T12:30:05.25Z")) == "2025-03-01T12:30:05.250000Z");
}

int main() {
    test_lifecycle();
    test_failure_and_cancel();
    test_can_start();
    test_expiry_boundary();
    test_task_record();
    test_message_record();
    std::cout << "Task test PASSED\n";
    return 0;
}
