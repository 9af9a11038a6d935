#pragma once
#include <cstdint>
#include <string>
#include <unordered_set>

namespace orchestra {

// Task lifecycle states.
enum class TaskStatus : std::uint8_t { Pending, Running, Completed, Failed, Cancelled };

enum class TaskPriority : std::uint8_t { Low = 1, Medium = 2, High = 3, Critical = 4 };

enum class AgentStatus : std::uint8_t { Idle, Busy, Error, Offline };

enum class MessageType : std::uint8_t {
    TaskRequest,
    TaskResponse,
    StatusUpdate,
    Coordination,
    Error,
    Info
};

// Opaque identifiers (string-based, generated by generateId()).
using TaskId = std::string;
using MessageId = std::string;

using CapabilitySet = std::unordered_set<std::string>;

[[nodiscard]] const char* toString(TaskStatus status) noexcept;
[[nodiscard]] const char* toString(AgentStatus status) noexcept;
[[nodiscard]] const char* toString(MessageType type) noexcept;

// Parse the lowercase symbolic names produced by toString(); throw
// std::invalid_argument on unknown input.
[[nodiscard]] TaskStatus parseTaskStatus(const std::string& name);
[[nodiscard]] MessageType parseMessageType(const std::string& name);
[[nodiscard]] TaskPriority priorityFromInt(int value);

[[nodiscard]] inline bool isTerminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

// Unique id: microsecond clock, process id and a process-wide counter.
[[nodiscard]] std::string generateId();

} // namespace orchestra
