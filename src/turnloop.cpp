#include "turnloop/turnloop.hpp"

#include <spdlog/spdlog.h>

#include "log/log.h"

#ifndef TURNLOOP_VERSION_STRING
#define TURNLOOP_VERSION_STRING "0.0.0"
#endif

namespace turnloop {

void init(const Config& config) {
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
  spdlog::info("turnloop {} (default model {})", version(), config.default_model);
}

void shutdown() {
  spdlog::shutdown();
}

std::string version() {
  return TURNLOOP_VERSION_STRING;
}

}  // namespace turnloop
