#pragma once

#include <optional>
#include <string>

#include "turnloop/core/config.hpp"
#include "turnloop/core/types.hpp"

namespace turnloop::llm {

struct RouteDecision {
  TaskClass task_class = TaskClass::Simple;
  std::string model;
  std::optional<int> max_tokens;
};

// Picks a model tier for an outgoing request. Stateless and deterministic.
class Router {
 public:
  // Code fences and patch markers mean code generation, everything else is simple
  static TaskClass classify_heuristic(const std::string& text);

  static RouteDecision route(const RouterConfig& config, TaskClass task_class, const std::string& current_model);

  // classify_heuristic + route
  static RouteDecision route_request(const RouterConfig& config, const std::string& text, const std::string& current_model);
};

}  // namespace turnloop::llm
