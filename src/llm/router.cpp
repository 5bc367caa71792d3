#include "turnloop/llm/router.hpp"

#include <spdlog/spdlog.h>

namespace turnloop::llm {

namespace {

const char* const kCodegenMarkers[] = {"```", "diff --git", "+++ ", "--- ", "@@ ", "apply_patch", "*** begin patch"};

}  // namespace

TaskClass Router::classify_heuristic(const std::string& text) {
  auto lower = to_lower(text);
  for (const char* marker : kCodegenMarkers) {
    if (lower.find(marker) != std::string::npos) {
      return TaskClass::CodegenHeavy;
    }
  }
  return TaskClass::Simple;
}

RouteDecision Router::route(const RouterConfig& config, TaskClass task_class, const std::string& current_model) {
  RouteDecision decision;
  decision.task_class = task_class;
  decision.model = current_model;

  if (!config.enabled) {
    return decision;
  }

  auto model_it = config.models.find(task_class);
  if (model_it != config.models.end() && !model_it->second.empty()) {
    decision.model = model_it->second;
  }

  auto budget_it = config.budgets.find(task_class);
  if (budget_it != config.budgets.end() && budget_it->second > 0) {
    decision.max_tokens = budget_it->second;
  }

  return decision;
}

RouteDecision Router::route_request(const RouterConfig& config, const std::string& text, const std::string& current_model) {
  auto decision = route(config, classify_heuristic(text), current_model);
  spdlog::debug("[Router] class={} model={}", to_string(decision.task_class), decision.model);
  return decision;
}

}  // namespace turnloop::llm
