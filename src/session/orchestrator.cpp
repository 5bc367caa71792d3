#include "turnloop/session/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace turnloop {

namespace {

constexpr auto kAbortPollInterval = std::chrono::milliseconds(20);
constexpr size_t kDoomLoopThreshold = 3;

}  // namespace

std::string to_string(TurnState state) {
  switch (state) {
    case TurnState::Idle:
      return "idle";
    case TurnState::Routing:
      return "routing";
    case TurnState::AwaitingProvider:
      return "awaiting_provider";
    case TurnState::InterpretingResponse:
      return "interpreting_response";
    case TurnState::ExecutingTools:
      return "executing_tools";
    case TurnState::Compacting:
      return "compacting";
    case TurnState::Snapshotting:
      return "snapshotting";
    case TurnState::Terminated:
      return "terminated";
    case TurnState::Fatal:
      return "fatal";
  }
  return "unknown";
}

Orchestrator::Orchestrator(asio::io_context& io_ctx, const Config& config, OrchestratorOptions options)
    : config_(config),
      id_(UUID::generate()),
      abort_signal_(std::make_shared<std::atomic<bool>>(false)),
      provider_(std::move(options.provider)),
      system_prompt_(std::move(options.system_prompt)),
      working_dir_(std::move(options.working_dir)),
      compaction_(config.compaction),
      tools_(config.session_tools.max_sessions),
      policy_(config.tool_policy, config.permission_mode),
      retry_(config.retry, options.retry_sleeper ? options.retry_sleeper : llm::timer_sleeper(io_ctx)) {
  if (config_.snapshots.enabled) {
    auto store = options.snapshot_store ? options.snapshot_store : SnapshotManager::make_store(config_.snapshots);
    snapshots_ = std::make_unique<SnapshotManager>(config_.snapshots, std::move(store));
  }

  if (!system_prompt_.empty()) {
    append(Message::system(system_prompt_));
  }
}

Orchestrator::~Orchestrator() {
  cancel();
}

Result<std::shared_ptr<Orchestrator>> Orchestrator::create(asio::io_context& io_ctx, const Config& config, OrchestratorOptions options) {
  auto status = config.validate();
  if (!status.ok()) {
    spdlog::error("[Orchestrator] Invalid configuration: {}", status.error->message);
    return Result<std::shared_ptr<Orchestrator>>::failure(ErrorKind::ConfigurationError, status.error->message);
  }
  if (!options.provider) {
    return Result<std::shared_ptr<Orchestrator>>::failure(ErrorKind::ConfigurationError, "No LLM provider configured");
  }

  auto orchestrator = std::shared_ptr<Orchestrator>(new Orchestrator(io_ctx, config, std::move(options)));
  spdlog::info("[Orchestrator {}] Created (model={}, mode={}, snapshots={})", orchestrator->id_, config.default_model,
               to_string(config.permission_mode), orchestrator->snapshots_ ? "on" : "off");
  return Result<std::shared_ptr<Orchestrator>>::success(std::move(orchestrator));
}

TokenUsage Orchestrator::total_usage() const {
  std::lock_guard lock(usage_mutex_);
  return total_usage_;
}

void Orchestrator::register_tool(std::shared_ptr<Tool> tool, bool session_based) {
  const auto& listed = config_.session_tools.tools;
  bool listed_as_session = std::find(listed.begin(), listed.end(), tool->id()) != listed.end();
  tools_.register_tool(std::move(tool), session_based || listed_as_session);
}

void Orchestrator::set_state(TurnState state) {
  // Terminated is final
  auto previous = state_.load();
  do {
    if (previous == state || previous == TurnState::Terminated) return;
  } while (!state_.compare_exchange_weak(previous, state));

  spdlog::debug("[Orchestrator {}] {} -> {}", id_, to_string(previous), to_string(state));
  if (on_state_change_) {
    on_state_change_(previous, state);
  }
}

bool Orchestrator::aborted() const {
  return abort_signal_->load();
}

void Orchestrator::report_error(ErrorKind kind, const std::string& message) {
  if (on_error_) {
    on_error_(Error{kind, message});
  }
}

Message Orchestrator::append(const Message& message) {
  auto stored = compaction_.add_message(history_, message);
  if (on_message_) {
    on_message_(stored);
  }
  return stored;
}

Result<TurnOutcome> Orchestrator::run_turn(const std::string& text) {
  std::lock_guard turn_lock(turn_mutex_);

  auto current = state_.load();
  if (current == TurnState::Terminated) {
    return Result<TurnOutcome>::failure(ErrorKind::Cancelled, "Session has been terminated");
  }
  if (current == TurnState::Fatal) {
    return Result<TurnOutcome>::failure(ErrorKind::ProviderFailure, "Session is in a fatal state");
  }

  abort_signal_->store(false);
  reap_abandoned();

  TurnOutcome outcome;
  outcome.turn = ++turn_number_;
  spdlog::info("[Orchestrator {}] Turn {} started", id_, outcome.turn);

  append(Message::user(text));

  set_state(TurnState::Routing);
  outcome.route = llm::Router::route_request(config_.router, text, config_.default_model);

  while (true) {
    if (aborted()) {
      return finish_cancelled(std::move(outcome));
    }

    auto response = request_completion(outcome.route);
    if (response.failed()) {
      if (response.kind() == ErrorKind::Cancelled) {
        return finish_cancelled(std::move(outcome));
      }
      set_state(TurnState::Fatal);
      spdlog::error("[Orchestrator {}] Turn {} failed: {}", id_, outcome.turn, response.message());
      report_error(response.kind(), response.message());
      return Result<TurnOutcome>::failure(response.kind(), response.message());
    }

    set_state(TurnState::InterpretingResponse);
    auto& reply = *response.value;
    {
      std::lock_guard lock(usage_mutex_);
      total_usage_ += reply.usage;
    }
    outcome.usage += reply.usage;
    outcome.text = reply.text;
    outcome.finish_reason = reply.finish_reason;

    append(Message::assistant(reply.text, reply.tool_calls).with_completion(reply.finish_reason, reply.usage));

    if (reply.tool_calls.empty()) {
      break;
    }

    set_state(TurnState::ExecutingTools);
    outcome.tool_calls += reply.tool_calls.size();
    if (!execute_tool_calls(reply.tool_calls)) {
      return finish_cancelled(std::move(outcome));
    }

    maybe_compact();

    if (++outcome.tool_loops >= config_.max_tool_loops) {
      spdlog::warn("[Orchestrator {}] Tool loop limit ({}) reached in turn {}", id_, config_.max_tool_loops, outcome.turn);
      outcome.loop_limit_reached = true;
      outcome.text = "Stopped after " + std::to_string(config_.max_tool_loops) +
                     " rounds of tool calls in one turn. Send another message to continue.";
      outcome.finish_reason = FinishReason::Length;
      append(Message::assistant(outcome.text));
      break;
    }
  }

  maybe_compact();
  outcome.snapshot = take_snapshot(outcome);

  set_state(TurnState::Idle);
  spdlog::info("[Orchestrator {}] Turn {} finished ({} tool loop(s), {} tokens)", id_, outcome.turn, outcome.tool_loops, outcome.usage.total());
  return Result<TurnOutcome>::success(std::move(outcome));
}

llm::LlmRequest Orchestrator::build_request(const llm::RouteDecision& route) const {
  llm::LlmRequest request;
  request.model = route.model;
  request.system_prompt = system_prompt_;
  request.messages = history_.messages();
  request.tools = tools_.all();
  request.max_tokens = route.max_tokens;
  return request;
}

Result<llm::LlmResponse> Orchestrator::request_completion(const llm::RouteDecision& route) {
  set_state(TurnState::AwaitingProvider);

  auto call = [this](const llm::LlmRequest& request) {
    auto provider = provider_;
    auto attempts_before = retry_.stats().total_attempts;
    auto response = retry_.call_with_fallback(
        request.model,
        [provider, request](const std::string& model) {
          auto routed = request;
          routed.model = model;
          return provider->complete(routed);
        },
        abort_signal_.get());
    auto attempts = retry_.stats().total_attempts - attempts_before;
    if (response.ok() && attempts > 1) {
      report_error(ErrorKind::ProviderTransient, "Provider recovered after " + std::to_string(attempts) + " attempts");
    }
    return response;
  };

  auto request = build_request(route);
  spdlog::debug("[Orchestrator {}] LLM request: model={}, messages={}, tools={}", id_, request.model, request.messages.size(),
                request.tools.size());
  auto response = call(request);

  if (aborted()) {
    return Result<llm::LlmResponse>::failure(ErrorKind::Cancelled, "Turn cancelled");
  }

  if (!response.ok() && llm::is_context_overflow_error(*response.error)) {
    spdlog::warn("[Orchestrator {}] Context overflow ({}), compacting and retrying once", id_, *response.error);
    report_error(ErrorKind::ContextOverflow, *response.error);

    set_state(TurnState::Compacting);
    compaction_.compact_to(history_, history_.size() / 2);

    set_state(TurnState::AwaitingProvider);
    response = call(build_request(route));
    if (aborted()) {
      return Result<llm::LlmResponse>::failure(ErrorKind::Cancelled, "Turn cancelled");
    }
    if (!response.ok()) {
      return Result<llm::LlmResponse>::failure(ErrorKind::ProviderFailure, "Provider failed after context compaction: " + *response.error);
    }
  }

  if (!response.ok()) {
    return Result<llm::LlmResponse>::failure(ErrorKind::ProviderFailure, *response.error);
  }
  return Result<llm::LlmResponse>::success(std::move(response));
}

bool Orchestrator::execute_tool_calls(const std::vector<ToolCallPart>& calls) {
  spdlog::debug("[Orchestrator {}] Executing {} tool call(s)", id_, calls.size());

  // Authorize and launch in request order; authorized calls run concurrently
  std::vector<PendingCall> pending;
  pending.reserve(calls.size());
  for (const auto& call : calls) {
    pending.push_back(prepare_call(call));
  }

  for (auto& p : pending) {
    await_call(p);
  }

  if (aborted()) {
    size_t kept = 0;
    for (auto& p : pending) {
      if (p.result && p.result->committed_side_effect) {
        record_result(p);
        kept++;
      }
    }
    spdlog::info("[Orchestrator {}] Tool batch cancelled, kept {} committed result(s)", id_, kept);
    return false;
  }

  for (auto& p : pending) {
    record_result(p);
  }
  return true;
}

Orchestrator::PendingCall Orchestrator::prepare_call(const ToolCallPart& call) {
  PendingCall p;
  p.call = call;

  if (on_tool_call_) {
    on_tool_call_(call.name, call.arguments);
  }

  if (detect_doom_loop(call.name, call.arguments)) {
    spdlog::warn("[Orchestrator {}] Potential doom loop: {} called {} times with identical arguments", id_, call.name, kDoomLoopThreshold);
  }

  p.tool = tools_.get(call.name);
  if (!p.tool) {
    spdlog::error("[Orchestrator {}] Tool not found: {}", id_, call.name);
    p.result = ToolResult::error("Tool not found: " + call.name);
    return p;
  }

  switch (policy_.authorize(call.name)) {
    case Decision::Deny:
      spdlog::info("[Orchestrator {}] Policy denied tool: {}", id_, call.name);
      p.result = ToolResult::error("Permission denied: tool '" + call.name + "' is blocked by the tool policy");
      report_error(ErrorKind::PolicyDenied, p.result->output);
      return p;
    case Decision::Prompt: {
      bool approved = false;
      if (confirmation_handler_) {
        try {
          approved = confirmation_handler_(call.name, "Tool '" + call.name + "' requires permission to execute").get();
        } catch (const std::exception& e) {
          spdlog::warn("[Orchestrator {}] Confirmation handler error for tool {}: {}", id_, call.name, e.what());
        }
      }
      if (!approved) {
        spdlog::info("[Orchestrator {}] User rejected tool: {}", id_, call.name);
        p.result = ToolResult::error("Permission denied: user rejected tool '" + call.name + "'");
        return p;
      }
      break;
    }
    case Decision::Allow:
      break;
  }

  auto args = p.tool->validate_args(call.arguments);
  if (args.failed()) {
    p.result = ToolResult::error("Invalid arguments for " + call.name + ": " + args.message());
    return p;
  }

  if (tools_.is_session_based(call.name)) {
    auto slot = tools_.guard().acquire();
    if (!slot.ok()) {
      p.result = ToolResult::error(slot.error->message);
      report_error(ErrorKind::ResourceExhausted, slot.error->message);
      return p;
    }
    p.holds_slot = true;
  }

  ToolContext ctx;
  ctx.session_id = id_;
  ctx.call_id = call.id;
  ctx.working_dir = working_dir_;
  ctx.abort_signal = abort_signal_;
  ctx.call_abort = std::make_shared<std::atomic<bool>>(false);
  p.call_abort = ctx.call_abort;

  try {
    spdlog::debug("[Orchestrator {}] Calling tool: {} with args: {}", id_, call.name, call.arguments.dump());
    p.future = p.tool->execute(*args.value, ctx);
    p.deadline = std::chrono::steady_clock::now() + config_.tool_timeout;
  } catch (const std::exception& e) {
    spdlog::error("[Orchestrator {}] Tool {} failed to start: {}", id_, call.name, e.what());
    p.result = ToolResult::error(std::string("Error: ") + e.what());
    if (p.holds_slot) {
      tools_.guard().release();
      p.holds_slot = false;
    }
  }
  return p;
}

void Orchestrator::await_call(PendingCall& p) {
  if (p.result || !p.future.valid()) {
    return;
  }

  bool ready = false;
  while (!aborted()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= p.deadline) break;
    auto wait = std::min<std::chrono::steady_clock::duration>(p.deadline - now, kAbortPollInterval);
    if (p.future.wait_for(wait) == std::future_status::ready) {
      ready = true;
      break;
    }
  }

  // A cancelled tool may still have finished in time
  if (!ready && aborted()) {
    ready = p.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  }

  if (!ready) {
    p.call_abort->store(true);
    if (!aborted()) {
      spdlog::warn("[Orchestrator {}] Tool {} timed out after {}ms", id_, p.call.name, config_.tool_timeout.count());
      p.result = ToolResult::error("Tool '" + p.call.name + "' timed out after " + std::to_string(config_.tool_timeout.count()) + "ms");
      report_error(ErrorKind::ToolExecutionFailure, p.result->output);
    }
    // The slot stays taken until the tool really stops
    abandoned_.push_back(AbandonedCall{std::move(p.future), p.holds_slot});
    p.holds_slot = false;
    return;
  }

  try {
    p.result = p.future.get();
    spdlog::debug("[Orchestrator {}] Tool {} completed, is_error={}, output length={}", id_, p.call.name, p.result->is_error,
                  p.result->output.size());
  } catch (const std::exception& e) {
    spdlog::error("[Orchestrator {}] Tool {} exception: {}", id_, p.call.name, e.what());
    p.result = ToolResult::error(std::string("Error: ") + e.what());
  }

  if (p.holds_slot) {
    tools_.guard().release();
    p.holds_slot = false;
  }
}

void Orchestrator::record_result(const PendingCall& p) {
  const auto& result = *p.result;
  auto truncated = Truncate::output(result.output, config_.context.truncate_max_lines, config_.context.truncate_max_bytes);

  append(Message::tool_result(p.call.id, p.call.name, truncated.content, result.is_error));

  if (on_tool_result_) {
    on_tool_result_(p.call.id, p.call.name, truncated.content, result.is_error);
  }
}

void Orchestrator::reap_abandoned() {
  auto it = abandoned_.begin();
  while (it != abandoned_.end()) {
    if (it->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++it;
      continue;
    }
    if (it->holds_slot) {
      tools_.guard().release();
    }
    it = abandoned_.erase(it);
  }
}

bool Orchestrator::detect_doom_loop(const std::string& tool_name, const json& args) {
  recent_tool_calls_.push_back({tool_name, args.dump()});
  if (recent_tool_calls_.size() > 10) {
    recent_tool_calls_.pop_front();
  }

  if (recent_tool_calls_.size() < kDoomLoopThreshold) return false;

  const auto& last = recent_tool_calls_.back();
  return std::all_of(recent_tool_calls_.end() - kDoomLoopThreshold, recent_tool_calls_.end(), [&last](const ToolCallRecord& r) {
    return r.tool_name == last.tool_name && r.args_hash == last.args_hash;
  });
}

void Orchestrator::maybe_compact() {
  if (!config_.compaction.auto_compaction_enabled || !compaction_.should_compact(history_)) {
    return;
  }
  set_state(TurnState::Compacting);
  compaction_.compact_messages_intelligently(history_);
}

json Orchestrator::session_state() const {
  auto usage = total_usage();
  json state;
  state["session_id"] = id_;
  state["turn"] = turn_number_.load();
  state["history"] = history_.to_json();
  state["usage"] = {{"input_tokens", usage.input_tokens}, {"output_tokens", usage.output_tokens}};
  return state;
}

std::optional<Snapshot> Orchestrator::take_snapshot(const TurnOutcome& outcome) {
  if (!snapshots_) {
    return std::nullopt;
  }

  set_state(TurnState::Snapshotting);
  json metadata = {{"model", outcome.route.model},
                   {"task_class", to_string(outcome.route.task_class)},
                   {"messages", history_.size()},
                   {"tool_calls", outcome.tool_calls}};

  auto saved = snapshots_->save(outcome.turn, session_state(), metadata);
  if (saved.failed()) {
    spdlog::warn("[Orchestrator {}] Snapshot for turn {} failed: {}", id_, outcome.turn, saved.message());
    report_error(ErrorKind::SnapshotFailure, saved.message());
    return std::nullopt;
  }
  return saved.value;
}

Result<TurnOutcome> Orchestrator::finish_cancelled(TurnOutcome outcome) {
  spdlog::info("[Orchestrator {}] Turn {} cancelled", id_, outcome.turn);
  if (state_.load() != TurnState::Terminated) {
    set_state(TurnState::Idle);
  }
  return Result<TurnOutcome>::failure(ErrorKind::Cancelled, "Turn " + std::to_string(outcome.turn) + " cancelled");
}

void Orchestrator::cancel() {
  abort_signal_->store(true);
  if (provider_) {
    provider_->cancel();
  }
}

void Orchestrator::terminate() {
  cancel();
  set_state(TurnState::Terminated);
  spdlog::info("[Orchestrator {}] Terminated", id_);
}

Status Orchestrator::rollback(TurnNumber turn) {
  std::lock_guard turn_lock(turn_mutex_);

  if (state_.load() == TurnState::Terminated) {
    return Status::failure(ErrorKind::Cancelled, "Session has been terminated");
  }
  if (!snapshots_) {
    return Status::failure(ErrorKind::NotFound, "Snapshots are disabled");
  }

  auto state = snapshots_->load(turn);
  if (state.failed()) {
    spdlog::warn("[Orchestrator {}] Rollback to turn {} failed: {}", id_, turn, state.message());
    return Status::failure(state.kind(), state.message());
  }

  const auto& s = *state.value;
  if (!s.contains("history")) {
    return Status::failure(ErrorKind::SnapshotFailure, "Snapshot for turn " + std::to_string(turn) + " has no history");
  }
  auto restored = history_.restore(s["history"]);
  if (!restored.ok()) {
    return restored;
  }

  turn_number_ = turn;
  if (s.contains("usage")) {
    std::lock_guard lock(usage_mutex_);
    total_usage_.input_tokens = s["usage"].value("input_tokens", int64_t(0));
    total_usage_.output_tokens = s["usage"].value("output_tokens", int64_t(0));
  }
  set_state(TurnState::Idle);
  spdlog::info("[Orchestrator {}] Rolled back to turn {} ({} messages)", id_, turn, history_.size());
  return Status::success();
}

}  // namespace turnloop
