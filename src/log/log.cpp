#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "turnloop/core/config.hpp"

namespace turnloop {

namespace fs = std::filesystem;

namespace {

fs::path rotated_name(const fs::path& dir, const std::string& stem, size_t index) {
  return dir / (stem + "." + std::to_string(index) + ".log");
}

// turnloop.log -> turnloop.0.log -> ... -> turnloop.{max_files-1}.log (dropped)
void rotate_on_startup(const fs::path& current_log, size_t max_files) {
  if (max_files == 0 || !fs::exists(current_log)) {
    return;
  }

  const auto dir = current_log.parent_path();
  const auto stem = current_log.stem().string();
  std::error_code ec;

  fs::remove(rotated_name(dir, stem, max_files - 1), ec);
  for (size_t i = max_files - 1; i > 0; --i) {
    auto from = rotated_name(dir, stem, i - 1);
    if (fs::exists(from)) {
      fs::rename(from, rotated_name(dir, stem, i), ec);
    }
  }
  fs::rename(current_log, rotated_name(dir, stem, 0), ec);
  if (ec) {
    std::cerr << "Failed to rotate log " << current_log << ": " << ec.message() << "\n";
  }
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  fs::path path = log_path.empty() ? config_paths::config_dir() / "log" / "turnloop.log" : fs::path(log_path);

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      return;
    }
  }

  rotate_on_startup(path, max_files);

  try {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("turnloop", file_sink);

    logger->set_level(spdlog::level::from_str(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("turnloop");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== turnloop started (log: {}) ===", path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace turnloop
