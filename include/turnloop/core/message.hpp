#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "turnloop/core/types.hpp"
#include "turnloop/core/uuid.hpp"

namespace turnloop {

// Message part types
struct TextPart {
  std::string text;
};

struct ToolCallPart {
  ToolCallId id;
  std::string name;
  json arguments;
};

struct ToolResultPart {
  ToolCallId tool_call_id;
  std::string tool_name;
  std::string output;
  bool is_error = false;
};

// Placeholder for messages removed by compaction
struct SummaryPart {
  size_t compacted_count = 0;
  std::string description;
  size_t represented_bytes = 0;  // Payload bytes of the messages it replaces
};

using MessagePart = std::variant<TextPart, ToolCallPart, ToolResultPart, SummaryPart>;

// Message role
enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);
Role role_from_string(const std::string& str);

// Immutable conversation entry. Built through the factories; the history owns copies.
class Message {
 public:
  static Message system(const std::string& content);
  static Message user(const std::string& content);
  static Message assistant(const std::string& content, std::vector<ToolCallPart> tool_calls = {});
  static Message tool_result(const ToolCallId& call_id, const std::string& tool_name, const std::string& output, bool is_error = false);
  static Message summary(size_t compacted_count, const std::string& description, size_t represented_bytes);

  // Copy of this message carrying a new type and priority (used when a message enters the history)
  Message classified(MessageType type, Priority priority) const;

  // Copy of an assistant message carrying completion details
  Message with_completion(FinishReason reason, const TokenUsage& usage) const;

  const MessageId& id() const { return id_; }
  Role role() const { return role_; }
  MessageType type() const { return type_; }
  Priority priority() const { return priority_; }
  const std::vector<MessagePart>& parts() const { return parts_; }
  Timestamp created_at() const { return created_at_; }
  size_t byte_size() const { return byte_size_; }

  FinishReason finish_reason() const { return finish_reason_; }
  const TokenUsage& usage() const { return usage_; }

  bool is_summary() const;
  const SummaryPart* summary_part() const;

  // Concatenated text content
  std::string text() const;

  // Text, tool calls and tool results flattened for keyword analysis and summaries
  std::string content_text() const;

  std::vector<const ToolCallPart*> tool_calls() const;
  std::vector<const ToolResultPart*> tool_results() const;

  json to_json() const;
  static Message from_json(const json& j);

 private:
  Message(Role role, MessageType type, Priority priority, std::vector<MessagePart> parts);

  static size_t compute_byte_size(const std::vector<MessagePart>& parts);

  MessageId id_ = UUID::generate();
  Role role_ = Role::User;
  MessageType type_ = MessageType::UserMessage;
  Priority priority_ = Priority::Normal;
  std::vector<MessagePart> parts_;

  FinishReason finish_reason_ = FinishReason::Stop;
  TokenUsage usage_;

  Timestamp created_at_ = std::chrono::system_clock::now();
  size_t byte_size_ = 0;
};

}  // namespace turnloop
