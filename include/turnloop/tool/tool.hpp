#pragma once

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "turnloop/core/types.hpp"
#include "turnloop/tool/policy.hpp"

namespace turnloop {

// Tool execution context
struct ToolContext {
  SessionId session_id;
  ToolCallId call_id;
  std::string working_dir;

  // Set on user interrupt for the whole session
  std::shared_ptr<std::atomic<bool>> abort_signal;

  // Set when this call alone is abandoned (timeout)
  std::shared_ptr<std::atomic<bool>> call_abort;

  bool aborted() const {
    return (abort_signal && abort_signal->load()) || (call_abort && call_abort->load());
  }
};

// Tool execution result
struct ToolResult {
  std::string output;
  bool is_error = false;

  // The tool already changed external state; the result survives a cancel
  bool committed_side_effect = false;

  static ToolResult success(const std::string& output) {
    return ToolResult{output, false, false};
  }

  static ToolResult error(const std::string& message) {
    return ToolResult{message, true, false};
  }

  static ToolResult committed(const std::string& output) {
    return ToolResult{output, false, true};
  }
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;

  json to_json_schema() const;
};

// Tool definition
class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string id() const = 0;

  virtual std::string description() const = 0;

  virtual std::vector<ParameterSchema> parameters() const = 0;

  virtual std::future<ToolResult> execute(const json& args, const ToolContext& ctx) = 0;

  json to_json_schema() const;

  Result<json> validate_args(const json& args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string id, std::string description);

  std::string id() const override {
    return id_;
  }

  std::string description() const override {
    return description_;
  }

 protected:
  std::string id_;
  std::string description_;
};

// Tools available to one session, plus the cap on its session-based tools
class ToolRegistry {
 public:
  explicit ToolRegistry(size_t max_sessions = 10);

  // session_based: the tool holds a long-lived resource (e.g. a terminal) and takes a guard slot
  void register_tool(std::shared_ptr<Tool> tool, bool session_based = false);

  void unregister_tool(const std::string& id);

  std::shared_ptr<Tool> get(const std::string& id) const;

  std::vector<std::shared_ptr<Tool>> all() const;

  bool is_session_based(const std::string& id) const;

  SessionConcurrencyGuard& guard() {
    return guard_;
  }

  const SessionConcurrencyGuard& guard() const {
    return guard_;
  }

 private:
  struct Registration {
    std::shared_ptr<Tool> tool;
    bool session_based = false;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Registration> tools_;
  SessionConcurrencyGuard guard_;
};

// Truncation helper
namespace Truncate {
struct TruncateResult {
  std::string content;
  bool truncated = false;
};

// Sanitizes UTF-8 and cuts output past max_bytes or max_lines
TruncateResult output(const std::string& text, size_t max_lines = 2000, size_t max_bytes = 51200);
}  // namespace Truncate

}  // namespace turnloop
