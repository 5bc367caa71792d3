#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace turnloop {

using json = nlohmann::json;

// Forward declarations
class Message;

class ConversationHistory;

// Type aliases
using SessionId = std::string;
using MessageId = std::string;
using ToolCallId = std::string;
using TurnNumber = uint64_t;

using Timestamp = std::chrono::system_clock::time_point;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// Failure categories surfaced by the runtime
enum class ErrorKind {
  PolicyDenied,          // Tool blocked by configuration
  ResourceExhausted,     // Session tool cap reached
  ProviderTransient,     // Retryable provider failure
  ProviderFailure,       // Provider failed after all recovery paths
  ContextOverflow,       // Provider rejected the request size
  ToolExecutionFailure,  // Tool ran and failed (or timed out)
  SnapshotFailure,       // Snapshot could not be written or verified
  NotFound,              // Requested item does not exist
  ConfigurationError,    // Invalid configuration at session start
  Cancelled              // User interrupt
};

std::string to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::ProviderFailure;
  std::string message;
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  ErrorKind kind() const {
    return error ? error->kind : ErrorKind::ProviderFailure;
  }

  const std::string& message() const {
    static const std::string empty;
    return error ? error->message : empty;
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(ErrorKind kind, std::string err) {
    return Result{std::nullopt, Error{kind, std::move(err)}};
  }
};

// Outcome of an operation with no value
struct Status {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  static Status success() {
    return Status{};
  }

  static Status failure(ErrorKind kind, std::string err) {
    return Status{Error{kind, std::move(err)}};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage& operator+=(const TokenUsage& other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    return *this;
  }
};

// Finish reason for LLM responses
enum class FinishReason {
  Stop,       // Natural completion
  ToolCalls,  // Needs tool execution
  Length,     // Token limit reached
  Error,      // Error occurred
  Cancelled   // User cancelled
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string& str);

// Importance of a message when the history has to shrink
enum class Priority { Low, Normal, High, Critical };

std::string to_string(Priority priority);

Priority priority_from_string(const std::string& str);

// Kind of entry recorded in the conversation
enum class MessageType { UserMessage, AssistantMessage, ToolResult, SystemNote };

std::string to_string(MessageType type);

MessageType message_type_from_string(const std::string& str);

// Tool policy decision
enum class Decision {
  Allow,
  Prompt,  // Ask the user before running
  Deny
};

std::string to_string(Decision decision);

// Empty for unknown names
std::optional<Decision> decision_from_string(const std::string& str);

// Session-wide permission mode, chosen at session start
enum class PermissionMode {
  Standard,     // Consult the tool policy table
  Unrestricted  // Every tool is allowed (automation runs)
};

std::string to_string(PermissionMode mode);

std::optional<PermissionMode> permission_mode_from_string(const std::string& str);

// Coarse request complexity used to pick a model tier
enum class TaskClass { Simple, Standard, Complex, CodegenHeavy, RetrievalHeavy };

std::string to_string(TaskClass task_class);

std::optional<TaskClass> task_class_from_string(const std::string& str);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string& input);

// Lowercase ASCII copy
std::string to_lower(std::string text);

// Epoch seconds helpers for persisted timestamps
int64_t to_epoch_seconds(const Timestamp& ts);

Timestamp from_epoch_seconds(int64_t epoch);

}  // namespace turnloop
