#include "turnloop/tool/policy.hpp"

#include <spdlog/spdlog.h>

namespace turnloop {

ToolPolicyGuard::ToolPolicyGuard(ToolPolicyConfig policy, PermissionMode mode) : policy_(std::move(policy)), mode_(mode) {}

Decision ToolPolicyGuard::authorize(const std::string& tool_name) const {
  if (mode_ == PermissionMode::Unrestricted) {
    return Decision::Allow;
  }

  auto it = policy_.tools.find(tool_name);
  if (it != policy_.tools.end()) {
    return it->second;
  }
  return policy_.default_decision;
}

SessionConcurrencyGuard::SessionConcurrencyGuard(size_t max_allowed) : max_allowed_(max_allowed) {}

Status SessionConcurrencyGuard::acquire() {
  size_t current = active_.load();
  while (true) {
    if (current >= max_allowed_) {
      spdlog::warn("[Guard] Session limit reached ({}/{})", current, max_allowed_);
      return Status::failure(ErrorKind::ResourceExhausted,
                             "Maximum concurrent tool sessions reached (" + std::to_string(max_allowed_) + ")");
    }
    if (active_.compare_exchange_weak(current, current + 1)) {
      return Status::success();
    }
  }
}

void SessionConcurrencyGuard::release() {
  size_t current = active_.load();
  while (current > 0) {
    if (active_.compare_exchange_weak(current, current - 1)) {
      return;
    }
  }
}

}  // namespace turnloop
