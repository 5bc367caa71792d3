#include "turnloop/core/message.hpp"

#include <algorithm>

namespace turnloop {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

Role role_from_string(const std::string& str) {
  if (str == "system") return Role::System;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return Role::User;
}

Message::Message(Role role, MessageType type, Priority priority, std::vector<MessagePart> parts)
    : role_(role), type_(type), priority_(priority), parts_(std::move(parts)) {
  byte_size_ = compute_byte_size(parts_);
}

Message Message::system(const std::string& content) {
  return Message(Role::System, MessageType::SystemNote, Priority::Critical, {TextPart{sanitize_utf8(content)}});
}

Message Message::user(const std::string& content) {
  return Message(Role::User, MessageType::UserMessage, Priority::Normal, {TextPart{sanitize_utf8(content)}});
}

Message Message::assistant(const std::string& content, std::vector<ToolCallPart> tool_calls) {
  std::vector<MessagePart> parts;
  if (!content.empty()) {
    parts.push_back(TextPart{sanitize_utf8(content)});
  }
  for (auto& call : tool_calls) {
    parts.push_back(std::move(call));
  }
  Message msg(Role::Assistant, MessageType::AssistantMessage, Priority::Normal, std::move(parts));
  msg.finish_reason_ = msg.tool_calls().empty() ? FinishReason::Stop : FinishReason::ToolCalls;
  return msg;
}

Message Message::tool_result(const ToolCallId& call_id, const std::string& tool_name, const std::string& output, bool is_error) {
  return Message(Role::Tool, MessageType::ToolResult, Priority::Low, {ToolResultPart{call_id, tool_name, sanitize_utf8(output), is_error}});
}

Message Message::summary(size_t compacted_count, const std::string& description, size_t represented_bytes) {
  return Message(Role::System, MessageType::SystemNote, Priority::Critical, {SummaryPart{compacted_count, description, represented_bytes}});
}

Message Message::classified(MessageType type, Priority priority) const {
  Message copy = *this;
  copy.type_ = type;
  copy.priority_ = priority;
  return copy;
}

Message Message::with_completion(FinishReason reason, const TokenUsage& usage) const {
  Message copy = *this;
  copy.finish_reason_ = reason;
  copy.usage_ = usage;
  return copy;
}

size_t Message::compute_byte_size(const std::vector<MessagePart>& parts) {
  size_t total = 0;
  for (const auto& part : parts) {
    if (auto* text = std::get_if<TextPart>(&part)) {
      total += text->text.size();
    } else if (auto* tc = std::get_if<ToolCallPart>(&part)) {
      total += tc->name.size() + tc->arguments.dump().size();
    } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      total += tr->output.size();
    } else if (auto* summary = std::get_if<SummaryPart>(&part)) {
      // Never account more than the content it stands in for
      total += std::min(summary->description.size(), summary->represented_bytes);
    }
  }
  return total;
}

bool Message::is_summary() const {
  return summary_part() != nullptr;
}

const SummaryPart* Message::summary_part() const {
  for (const auto& part : parts_) {
    if (auto* summary = std::get_if<SummaryPart>(&part)) {
      return summary;
    }
  }
  return nullptr;
}

std::string Message::text() const {
  std::string result;
  for (const auto& part : parts_) {
    if (auto* text = std::get_if<TextPart>(&part)) {
      if (!result.empty()) result += "\n";
      result += text->text;
    } else if (auto* summary = std::get_if<SummaryPart>(&part)) {
      if (!result.empty()) result += "\n";
      result += summary->description;
    }
  }
  return result;
}

std::string Message::content_text() const {
  std::string result = text();
  for (const auto* tc : tool_calls()) {
    if (!result.empty()) result += "\n";
    result += tc->name + " " + tc->arguments.dump();
  }
  for (const auto* tr : tool_results()) {
    if (!result.empty()) result += "\n";
    result += tr->output;
  }
  return result;
}

std::vector<const ToolCallPart*> Message::tool_calls() const {
  std::vector<const ToolCallPart*> result;
  for (const auto& part : parts_) {
    if (auto* tc = std::get_if<ToolCallPart>(&part)) {
      result.push_back(tc);
    }
  }
  return result;
}

std::vector<const ToolResultPart*> Message::tool_results() const {
  std::vector<const ToolResultPart*> result;
  for (const auto& part : parts_) {
    if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      result.push_back(tr);
    }
  }
  return result;
}

json Message::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["type"] = to_string(type_);
  j["priority"] = to_string(priority_);
  j["finish_reason"] = to_string(finish_reason_);
  j["created_at"] = to_epoch_seconds(created_at_);

  json parts_json = json::array();
  for (const auto& part : parts_) {
    json part_json;
    if (auto* text = std::get_if<TextPart>(&part)) {
      part_json["type"] = "text";
      part_json["text"] = text->text;
    } else if (auto* tc = std::get_if<ToolCallPart>(&part)) {
      part_json["type"] = "tool_call";
      part_json["id"] = tc->id;
      part_json["name"] = tc->name;
      part_json["arguments"] = tc->arguments;
    } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      part_json["type"] = "tool_result";
      part_json["tool_call_id"] = tr->tool_call_id;
      part_json["tool_name"] = tr->tool_name;
      part_json["output"] = tr->output;
      part_json["is_error"] = tr->is_error;
    } else if (auto* summary = std::get_if<SummaryPart>(&part)) {
      part_json["type"] = "summary";
      part_json["compacted_count"] = summary->compacted_count;
      part_json["description"] = summary->description;
      part_json["represented_bytes"] = summary->represented_bytes;
    }
    parts_json.push_back(part_json);
  }
  j["parts"] = parts_json;

  j["usage"] = {{"input_tokens", usage_.input_tokens}, {"output_tokens", usage_.output_tokens}};

  return j;
}

Message Message::from_json(const json& j) {
  std::vector<MessagePart> parts;
  if (j.contains("parts")) {
    for (const auto& part_json : j["parts"]) {
      std::string type = part_json.value("type", "");
      if (type == "text") {
        parts.push_back(TextPart{part_json.value("text", "")});
      } else if (type == "tool_call") {
        parts.push_back(ToolCallPart{part_json.value("id", ""), part_json.value("name", ""), part_json.value("arguments", json::object())});
      } else if (type == "tool_result") {
        parts.push_back(ToolResultPart{part_json.value("tool_call_id", ""), part_json.value("tool_name", ""), part_json.value("output", ""),
                                       part_json.value("is_error", false)});
      } else if (type == "summary") {
        parts.push_back(SummaryPart{part_json.value("compacted_count", size_t(0)), part_json.value("description", ""),
                                    part_json.value("represented_bytes", size_t(0))});
      }
    }
  }

  Message msg(role_from_string(j.value("role", "user")), message_type_from_string(j.value("type", "user_message")),
              priority_from_string(j.value("priority", "normal")), std::move(parts));
  msg.id_ = j.value("id", UUID::generate());
  msg.finish_reason_ = finish_reason_from_string(j.value("finish_reason", "stop"));
  msg.created_at_ = from_epoch_seconds(j.value("created_at", to_epoch_seconds(msg.created_at_)));

  if (j.contains("usage")) {
    const auto& u = j["usage"];
    msg.usage_.input_tokens = u.value("input_tokens", int64_t(0));
    msg.usage_.output_tokens = u.value("output_tokens", int64_t(0));
  }

  return msg;
}

}  // namespace turnloop
