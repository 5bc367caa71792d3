#include "turnloop/core/types.hpp"

#include <algorithm>
#include <cctype>

namespace turnloop {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PolicyDenied:
      return "policy_denied";
    case ErrorKind::ResourceExhausted:
      return "resource_exhausted";
    case ErrorKind::ProviderTransient:
      return "provider_transient";
    case ErrorKind::ProviderFailure:
      return "provider_failure";
    case ErrorKind::ContextOverflow:
      return "context_overflow";
    case ErrorKind::ToolExecutionFailure:
      return "tool_execution_failure";
    case ErrorKind::SnapshotFailure:
      return "snapshot_failure";
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::ConfigurationError:
      return "configuration_error";
    case ErrorKind::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string& str) {
  if (str == "stop" || str == "end_turn") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool_use") return FinishReason::ToolCalls;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "error") return FinishReason::Error;
  if (str == "cancelled") return FinishReason::Cancelled;
  return FinishReason::Stop;
}

std::string to_string(Priority priority) {
  switch (priority) {
    case Priority::Low:
      return "low";
    case Priority::Normal:
      return "normal";
    case Priority::High:
      return "high";
    case Priority::Critical:
      return "critical";
  }
  return "normal";
}

Priority priority_from_string(const std::string& str) {
  if (str == "low") return Priority::Low;
  if (str == "high") return Priority::High;
  if (str == "critical") return Priority::Critical;
  return Priority::Normal;
}

std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::UserMessage:
      return "user_message";
    case MessageType::AssistantMessage:
      return "assistant_message";
    case MessageType::ToolResult:
      return "tool_result";
    case MessageType::SystemNote:
      return "system_note";
  }
  return "user_message";
}

MessageType message_type_from_string(const std::string& str) {
  if (str == "assistant_message") return MessageType::AssistantMessage;
  if (str == "tool_result") return MessageType::ToolResult;
  if (str == "system_note") return MessageType::SystemNote;
  return MessageType::UserMessage;
}

std::string to_string(Decision decision) {
  switch (decision) {
    case Decision::Allow:
      return "allow";
    case Decision::Prompt:
      return "prompt";
    case Decision::Deny:
      return "deny";
  }
  return "prompt";
}

std::optional<Decision> decision_from_string(const std::string& str) {
  auto lower = to_lower(str);
  if (lower == "allow") return Decision::Allow;
  if (lower == "prompt") return Decision::Prompt;
  if (lower == "deny") return Decision::Deny;
  return std::nullopt;
}

std::string to_string(PermissionMode mode) {
  return mode == PermissionMode::Unrestricted ? "unrestricted" : "standard";
}

std::optional<PermissionMode> permission_mode_from_string(const std::string& str) {
  auto lower = to_lower(str);
  if (lower == "standard") return PermissionMode::Standard;
  if (lower == "unrestricted" || lower == "allow_all") return PermissionMode::Unrestricted;
  return std::nullopt;
}

std::string to_string(TaskClass task_class) {
  switch (task_class) {
    case TaskClass::Simple:
      return "simple";
    case TaskClass::Standard:
      return "standard";
    case TaskClass::Complex:
      return "complex";
    case TaskClass::CodegenHeavy:
      return "codegen_heavy";
    case TaskClass::RetrievalHeavy:
      return "retrieval_heavy";
  }
  return "standard";
}

std::optional<TaskClass> task_class_from_string(const std::string& str) {
  if (str == "simple") return TaskClass::Simple;
  if (str == "standard") return TaskClass::Standard;
  if (str == "complex") return TaskClass::Complex;
  if (str == "codegen_heavy") return TaskClass::CodegenHeavy;
  if (str == "retrieval_heavy") return TaskClass::RetrievalHeavy;
  return std::nullopt;
}

namespace {

// Length of a well-formed UTF-8 sequence at `i`, or 0 if malformed
size_t valid_sequence_length(const std::string& input, size_t i) {
  auto byte = [&input](size_t pos) {
    return static_cast<unsigned char>(input[pos]);
  };
  auto continuation = [&](size_t pos) {
    return pos < input.size() && (byte(pos) & 0xC0) == 0x80;
  };

  unsigned char c = byte(i);
  if (c <= 0x7F) return 1;

  if ((c & 0xE0) == 0xC0) {
    if (!continuation(i + 1)) return 0;
    uint32_t cp = ((c & 0x1F) << 6) | (byte(i + 1) & 0x3F);
    return cp >= 0x80 ? 2 : 0;
  }

  if ((c & 0xF0) == 0xE0) {
    if (!continuation(i + 1) || !continuation(i + 2)) return 0;
    uint32_t cp = ((c & 0x0F) << 12) | ((byte(i + 1) & 0x3F) << 6) | (byte(i + 2) & 0x3F);
    return (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) ? 3 : 0;
  }

  if ((c & 0xF8) == 0xF0) {
    if (!continuation(i + 1) || !continuation(i + 2) || !continuation(i + 3)) return 0;
    uint32_t cp = ((c & 0x07) << 18) | ((byte(i + 1) & 0x3F) << 12) | ((byte(i + 2) & 0x3F) << 6) | (byte(i + 3) & 0x3F);
    return (cp >= 0x10000 && cp <= 0x10FFFF) ? 4 : 0;
  }

  return 0;
}

}  // namespace

std::string sanitize_utf8(const std::string& input) {
  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    size_t len = valid_sequence_length(input, i);
    if (len == 0) {
      output.append("\xEF\xBF\xBD");  // U+FFFD
      i++;
      continue;
    }
    output.append(input, i, len);
    i += len;
  }

  return output;
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

int64_t to_epoch_seconds(const Timestamp& ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(int64_t epoch) {
  return Timestamp(std::chrono::seconds(epoch));
}

}  // namespace turnloop
