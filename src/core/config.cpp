#include "turnloop/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace turnloop {

namespace fs = std::filesystem;

namespace {

constexpr size_t kBytesPerMb = 1000 * 1000;

// Unknown enum names are rejected rather than defaulted
template <typename T>
T require_known(std::optional<T> value, const std::string& what, const std::string& name) {
  if (!value) {
    throw std::invalid_argument("Unknown " + what + " '" + name + "'");
  }
  return *value;
}

void load_compaction(const json& c, CompactionConfig& out) {
  out.max_uncompressed_messages = c.value("max_uncompressed_messages", out.max_uncompressed_messages);
  out.max_message_age = Seconds(c.value("max_message_age", static_cast<int64_t>(out.max_message_age.count())));
  if (c.contains("max_memory_mb")) {
    out.max_memory_bytes = c["max_memory_mb"].get<size_t>() * kBytesPerMb;
  }
  out.compaction_interval = Seconds(c.value("compaction_interval", static_cast<int64_t>(out.compaction_interval.count())));
  out.min_context_confidence = c.value("min_context_confidence", out.min_context_confidence);
  out.max_context_age = Seconds(c.value("max_context_age", static_cast<int64_t>(out.max_context_age.count())));
  out.auto_compaction_enabled = c.value("auto_compaction_enabled", out.auto_compaction_enabled);
}

void load_router(const json& r, RouterConfig& out) {
  out.enabled = r.value("enabled", out.enabled);
  if (r.contains("models")) {
    for (auto& [cls, model] : r["models"].items()) {
      out.models[require_known(task_class_from_string(cls), "router task class", cls)] = model.get<std::string>();
    }
  }
  if (r.contains("budgets")) {
    for (auto& [cls, budget] : r["budgets"].items()) {
      out.budgets[require_known(task_class_from_string(cls), "router task class", cls)] = budget.get<int>();
    }
  }
}

void load_retry(const json& r, RetryConfig& out) {
  out.max_attempts = r.value("max_attempts", out.max_attempts);
  out.initial_delay = Milliseconds(r.value("initial_delay_ms", static_cast<int64_t>(out.initial_delay.count())));
  out.max_delay = Milliseconds(r.value("max_delay_ms", static_cast<int64_t>(out.max_delay.count())));
  out.backoff_multiplier = r.value("backoff_multiplier", out.backoff_multiplier);
  out.jitter_ratio = r.value("jitter_ratio", out.jitter_ratio);
  if (r.contains("retryable_errors")) {
    out.retryable_errors = r["retryable_errors"].get<std::vector<std::string>>();
  }
  auto fallback = r.value("fallback_model", std::string());
  if (!fallback.empty()) {
    out.fallback_model = fallback;
  }
}

}  // namespace

Result<Config> Config::from_json(const json& j) {
  Config config;

  try {
    config.default_model = j.value("default_model", config.default_model);

    if (j.contains("compaction")) {
      load_compaction(j["compaction"], config.compaction);
    }

    if (j.contains("tool_policy")) {
      const auto& tp = j["tool_policy"];
      auto default_name = tp.value("default", std::string("prompt"));
      config.tool_policy.default_decision = require_known(decision_from_string(default_name), "default tool decision", default_name);
      if (tp.contains("tools")) {
        for (auto& [tool_id, decision] : tp["tools"].items()) {
          auto name = decision.get<std::string>();
          config.tool_policy.tools[tool_id] = require_known(decision_from_string(name), "decision for tool " + tool_id, name);
        }
      }
    }

    if (j.contains("session_tools")) {
      const auto& st = j["session_tools"];
      config.session_tools.max_sessions = st.value("max_sessions", config.session_tools.max_sessions);
      if (st.contains("tools")) {
        config.session_tools.tools = st["tools"].get<std::vector<std::string>>();
      }
    }

    if (j.contains("router")) {
      load_router(j["router"], config.router);
    }

    if (j.contains("retry")) {
      load_retry(j["retry"], config.retry);
    }

    if (j.contains("snapshots")) {
      const auto& s = j["snapshots"];
      config.snapshots.enabled = s.value("enabled", config.snapshots.enabled);
      config.snapshots.directory = s.value("directory", std::string());
      config.snapshots.max_snapshots = s.value("max_snapshots", config.snapshots.max_snapshots);
      config.snapshots.auto_cleanup = s.value("auto_cleanup", config.snapshots.auto_cleanup);
    }

    if (j.contains("context")) {
      const auto& ctx = j["context"];
      config.context.truncate_max_lines = ctx.value("truncate_max_lines", config.context.truncate_max_lines);
      config.context.truncate_max_bytes = ctx.value("truncate_max_bytes", config.context.truncate_max_bytes);
    }

    config.max_tool_loops = j.value("max_tool_loops", config.max_tool_loops);
    config.tool_timeout = Milliseconds(j.value("tool_timeout_ms", static_cast<int64_t>(config.tool_timeout.count())));
    auto mode_name = j.value("permission_mode", std::string("standard"));
    config.permission_mode = require_known(permission_mode_from_string(mode_name), "permission mode", mode_name);

    config.log_level = j.value("log_level", config.log_level);
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::exception& e) {
    return Result<Config>::failure(ErrorKind::ConfigurationError, std::string("Invalid config value: ") + e.what());
  } catch (const std::invalid_argument& e) {
    return Result<Config>::failure(ErrorKind::ConfigurationError, e.what());
  }

  auto status = config.validate();
  if (!status.ok()) {
    return Result<Config>::failure(ErrorKind::ConfigurationError, status.error->message);
  }

  return Result<Config>::success(std::move(config));
}

Result<Config> Config::load(const fs::path& path) {
  if (!fs::exists(path)) {
    spdlog::debug("[Config] {} not found, using defaults", path.string());
    return Result<Config>::success(Config{});
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<Config>::failure(ErrorKind::ConfigurationError, "Cannot open config file: " + path.string());
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error& e) {
    spdlog::error("[Config] Failed to parse {}: {}", path.string(), e.what());
    return Result<Config>::failure(ErrorKind::ConfigurationError, "Malformed config file " + path.string() + ": " + e.what());
  }

  if (!j.is_object()) {
    return Result<Config>::failure(ErrorKind::ConfigurationError, "Config root must be an object: " + path.string());
  }

  return from_json(j);
}

Result<Config> Config::load_default() {
  // Project config wins over the global one
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Result<Config>::success(Config{});
}

Status Config::validate() const {
  if (compaction.max_uncompressed_messages < 2) {
    return Status::failure(ErrorKind::ConfigurationError, "compaction.max_uncompressed_messages must be at least 2");
  }
  if (compaction.max_memory_bytes == 0) {
    return Status::failure(ErrorKind::ConfigurationError, "compaction.max_memory_mb must be positive");
  }
  if (compaction.min_context_confidence < 0.0 || compaction.min_context_confidence > 1.0) {
    return Status::failure(ErrorKind::ConfigurationError, "compaction.min_context_confidence must be within [0, 1]");
  }
  if (session_tools.max_sessions == 0) {
    return Status::failure(ErrorKind::ConfigurationError, "session_tools.max_sessions must be positive");
  }
  if (retry.max_attempts < 1) {
    return Status::failure(ErrorKind::ConfigurationError, "retry.max_attempts must be at least 1");
  }
  if (retry.backoff_multiplier < 1.0) {
    return Status::failure(ErrorKind::ConfigurationError, "retry.backoff_multiplier must be at least 1.0");
  }
  if (retry.initial_delay.count() < 0 || retry.max_delay < retry.initial_delay) {
    return Status::failure(ErrorKind::ConfigurationError, "retry delays must satisfy 0 <= initial_delay <= max_delay");
  }
  if (retry.jitter_ratio < 0.0 || retry.jitter_ratio > 1.0) {
    return Status::failure(ErrorKind::ConfigurationError, "retry.jitter_ratio must be within [0, 1]");
  }
  if (snapshots.enabled && snapshots.max_snapshots == 0) {
    return Status::failure(ErrorKind::ConfigurationError, "snapshots.max_snapshots must be positive");
  }
  if (max_tool_loops < 1) {
    return Status::failure(ErrorKind::ConfigurationError, "max_tool_loops must be at least 1");
  }
  if (tool_timeout.count() <= 0) {
    return Status::failure(ErrorKind::ConfigurationError, "tool_timeout_ms must be positive");
  }
  return Status::success();
}

json Config::to_json() const {
  json j;
  j["default_model"] = default_model;

  j["compaction"] = {{"max_uncompressed_messages", compaction.max_uncompressed_messages},
                     {"max_message_age", compaction.max_message_age.count()},
                     {"max_memory_mb", compaction.max_memory_bytes / kBytesPerMb},
                     {"compaction_interval", compaction.compaction_interval.count()},
                     {"min_context_confidence", compaction.min_context_confidence},
                     {"max_context_age", compaction.max_context_age.count()},
                     {"auto_compaction_enabled", compaction.auto_compaction_enabled}};

  json tools_json = json::object();
  for (const auto& [tool_id, decision] : tool_policy.tools) {
    tools_json[tool_id] = to_string(decision);
  }
  j["tool_policy"] = {{"default", to_string(tool_policy.default_decision)}, {"tools", tools_json}};

  j["session_tools"] = {{"max_sessions", session_tools.max_sessions}, {"tools", session_tools.tools}};

  json models_json = json::object();
  for (const auto& [cls, model] : router.models) {
    models_json[to_string(cls)] = model;
  }
  json budgets_json = json::object();
  for (const auto& [cls, budget] : router.budgets) {
    budgets_json[to_string(cls)] = budget;
  }
  j["router"] = {{"enabled", router.enabled}, {"models", models_json}, {"budgets", budgets_json}};

  j["retry"] = {{"max_attempts", retry.max_attempts},
                {"initial_delay_ms", retry.initial_delay.count()},
                {"max_delay_ms", retry.max_delay.count()},
                {"backoff_multiplier", retry.backoff_multiplier},
                {"jitter_ratio", retry.jitter_ratio},
                {"retryable_errors", retry.retryable_errors}};
  if (retry.fallback_model) {
    j["retry"]["fallback_model"] = *retry.fallback_model;
  }

  j["snapshots"] = {{"enabled", snapshots.enabled},
                    {"directory", snapshots.directory.string()},
                    {"max_snapshots", snapshots.max_snapshots},
                    {"auto_cleanup", snapshots.auto_cleanup}};

  j["context"] = {{"truncate_max_lines", context.truncate_max_lines}, {"truncate_max_bytes", context.truncate_max_bytes}};

  j["max_tool_loops"] = max_tool_loops;
  j["tool_timeout_ms"] = tool_timeout.count();
  j["permission_mode"] = to_string(permission_mode);

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  return j;
}

Status Config::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    return Status::failure(ErrorKind::ConfigurationError, "Cannot write config file: " + path.string());
  }
  file << to_json().dump(2);
  return Status::success();
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "turnloop";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".turnloop" / "config.json";
}

}  // namespace config_paths

}  // namespace turnloop
