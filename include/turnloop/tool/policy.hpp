#pragma once

#include <atomic>
#include <string>

#include "turnloop/core/config.hpp"
#include "turnloop/core/types.hpp"

namespace turnloop {

// Decides whether a tool may run. Pure per call.
class ToolPolicyGuard {
 public:
  ToolPolicyGuard(ToolPolicyConfig policy, PermissionMode mode);

  // Explicit per-tool decision, else the default; Unrestricted mode always allows
  Decision authorize(const std::string& tool_name) const;

  PermissionMode mode() const {
    return mode_;
  }

  const ToolPolicyConfig& policy() const {
    return policy_;
  }

 private:
  ToolPolicyConfig policy_;
  PermissionMode mode_;
};

// Lock-free cap on concurrently open session-based tools
class SessionConcurrencyGuard {
 public:
  explicit SessionConcurrencyGuard(size_t max_allowed = 10);

  // ResourceExhausted when all slots are taken
  Status acquire();

  // No-op when nothing is held
  void release();

  size_t current_active() const {
    return active_.load();
  }

  size_t max_allowed() const {
    return max_allowed_;
  }

 private:
  std::atomic<size_t> active_{0};
  const size_t max_allowed_;
};

}  // namespace turnloop
