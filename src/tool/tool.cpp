#include "turnloop/tool/tool.hpp"

#include <spdlog/spdlog.h>

namespace turnloop {

json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  return schema;
}

json Tool::to_json_schema() const {
  json schema;
  schema["name"] = id();
  schema["description"] = description();

  json properties = json::object();
  json required_props = json::array();

  for (const auto &param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  schema["input_schema"] = {{"type", "object"}, {"properties", properties}, {"required", required_props}};

  return schema;
}

Result<json> Tool::validate_args(const json &args) const {
  if (!args.is_object()) {
    return Result<json>::failure(ErrorKind::ToolExecutionFailure, "Arguments must be a JSON object");
  }

  for (const auto &param : parameters()) {
    if (param.required && !args.contains(param.name)) {
      return Result<json>::failure(ErrorKind::ToolExecutionFailure, "Missing required parameter: " + param.name);
    }
  }

  return Result<json>::success(args);
}

SimpleTool::SimpleTool(std::string id, std::string description) : id_(std::move(id)), description_(std::move(description)) {}

ToolRegistry::ToolRegistry(size_t max_sessions) : guard_(max_sessions) {}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool, bool session_based) {
  std::lock_guard lock(mutex_);
  auto id = tool->id();
  spdlog::debug("[ToolRegistry] Registered {}{}", id, session_based ? " (session-based)" : "");
  tools_[id] = Registration{std::move(tool), session_based};
}

void ToolRegistry::unregister_tool(const std::string &id) {
  std::lock_guard lock(mutex_);
  tools_.erase(id);
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &id) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(id);
  if (it != tools_.end()) {
    return it->second.tool;
  }
  return nullptr;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto &[id, reg] : tools_) {
    result.push_back(reg.tool);
  }
  return result;
}

bool ToolRegistry::is_session_based(const std::string &id) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(id);
  return it != tools_.end() && it->second.session_based;
}

namespace Truncate {

TruncateResult output(const std::string &text, size_t max_lines, size_t max_bytes) {
  TruncateResult result;

  // Provider payloads and snapshots are JSON, which rejects invalid UTF-8
  std::string safe_text = sanitize_utf8(text);

  if (safe_text.size() > max_bytes) {
    // Do not split a multi-byte sequence
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(safe_text[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    result.truncated = true;
    result.content = safe_text.substr(0, cut);
    result.content += "\n... [Output truncated. " + std::to_string(safe_text.size() - cut) + " bytes omitted]";
    return result;
  }

  size_t line_count = 0;
  size_t pos = 0;
  while ((pos = safe_text.find('\n', pos)) != std::string::npos) {
    line_count++;
    if (line_count >= max_lines) {
      result.truncated = true;
      result.content = safe_text.substr(0, pos);

      size_t remaining = 0;
      size_t start = pos + 1;
      while (start < safe_text.size()) {
        remaining++;
        size_t next = safe_text.find('\n', start);
        if (next == std::string::npos) {
          break;
        }
        start = next + 1;
      }

      result.content += "\n... [" + std::to_string(remaining) + " lines truncated]";
      return result;
    }
    pos++;
  }

  result.content = safe_text;
  return result;
}

}  // namespace Truncate

}  // namespace turnloop
