#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "turnloop/core/types.hpp"

namespace turnloop {

// History compaction thresholds
struct CompactionConfig {
  size_t max_uncompressed_messages = 50;
  Seconds max_message_age{3600};
  size_t max_memory_bytes = 100 * 1000 * 1000;  // 100 MB
  Seconds compaction_interval{300};
  double min_context_confidence = 0.3;
  Seconds max_context_age{7200};
  bool auto_compaction_enabled = true;
};

// Per-tool decisions, unlisted tools fall back to the default
struct ToolPolicyConfig {
  Decision default_decision = Decision::Prompt;
  std::map<std::string, Decision> tools;
};

// Cap on concurrently open session-based tools (terminal sessions etc.)
struct SessionToolsConfig {
  size_t max_sessions = 10;
  std::vector<std::string> tools;  // Tool ids registered as session-based
};

struct RouterConfig {
  bool enabled = false;
  std::map<TaskClass, std::string> models;
  std::map<TaskClass, int> budgets;  // max_tokens per class
};

struct RetryConfig {
  int max_attempts = 3;
  Milliseconds initial_delay{500};
  Milliseconds max_delay{30000};
  double backoff_multiplier = 2.0;
  double jitter_ratio = 0.0;  // 0 disables jitter
  std::vector<std::string> retryable_errors = {"timeout",      "timed out", "connection", "rate_limit",
                                               "rate limit",   "server_error", "network",  "temporarily unavailable"};
  // Tried once after the primary model's attempts run out
  std::optional<std::string> fallback_model;
};

struct SnapshotConfig {
  bool enabled = true;
  std::filesystem::path directory;  // Empty = keep snapshots in memory
  size_t max_snapshots = 50;
  bool auto_cleanup = true;
};

// Session configuration
struct Config {
  std::string default_model = "claude-sonnet-4-20250514";

  CompactionConfig compaction;
  ToolPolicyConfig tool_policy;
  SessionToolsConfig session_tools;
  RouterConfig router;
  RetryConfig retry;
  SnapshotConfig snapshots;

  // Tool output limits
  struct ContextSettings {
    size_t truncate_max_lines = 2000;
    size_t truncate_max_bytes = 51200;
  } context;

  int max_tool_loops = 100;
  Milliseconds tool_timeout{120000};
  PermissionMode permission_mode = PermissionMode::Standard;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Missing file yields defaults; malformed JSON or bad values yield ConfigurationError
  static Result<Config> load(const std::filesystem::path& path);
  static Result<Config> load_default();
  static Result<Config> from_json(const json& j);

  json to_json() const;
  Status save(const std::filesystem::path& path) const;

  // Reject values the runtime cannot work with
  Status validate() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();
std::filesystem::path config_dir();
std::filesystem::path default_config_file();
std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace turnloop
