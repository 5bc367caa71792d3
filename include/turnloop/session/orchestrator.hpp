#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>

#include "turnloop/context/compaction.hpp"
#include "turnloop/context/history.hpp"
#include "turnloop/core/config.hpp"
#include "turnloop/core/message.hpp"
#include "turnloop/core/types.hpp"
#include "turnloop/llm/provider.hpp"
#include "turnloop/llm/retry.hpp"
#include "turnloop/llm/router.hpp"
#include "turnloop/snapshot/snapshot.hpp"
#include "turnloop/tool/policy.hpp"
#include "turnloop/tool/tool.hpp"

namespace turnloop {

enum class TurnState {
  Idle,
  Routing,
  AwaitingProvider,
  InterpretingResponse,
  ExecutingTools,
  Compacting,
  Snapshotting,
  Terminated,  // terminate() was called
  Fatal        // Provider failed after every recovery path
};

std::string to_string(TurnState state);

// Summary of one completed turn
struct TurnOutcome {
  TurnNumber turn = 0;
  std::string text;  // Last assistant text
  FinishReason finish_reason = FinishReason::Stop;
  llm::RouteDecision route;
  int tool_loops = 0;
  size_t tool_calls = 0;
  bool loop_limit_reached = false;
  TokenUsage usage;
  std::optional<Snapshot> snapshot;
};

// Collaborators handed to the orchestrator at creation
struct OrchestratorOptions {
  std::shared_ptr<llm::Provider> provider;

  // Overrides the store chosen from the snapshot config
  std::shared_ptr<SnapshotStore> snapshot_store;

  // Overrides the asio timer used between retries
  llm::Sleeper retry_sleeper;

  std::string system_prompt;
  std::string working_dir;
};

// Drives one conversation: routes each request, calls the provider through the retry
// manager, gates and runs tools, compacts the history and checkpoints every turn
class Orchestrator : public std::enable_shared_from_this<Orchestrator> {
 public:
  static Result<std::shared_ptr<Orchestrator>> create(asio::io_context& io_ctx, const Config& config, OrchestratorOptions options);

  ~Orchestrator();

  const SessionId& id() const {
    return id_;
  }

  TurnState state() const {
    return state_.load();
  }

  TurnNumber turn_number() const {
    return turn_number_.load();
  }

  const ConversationHistory& history() const {
    return history_;
  }

  const Config& config() const {
    return config_;
  }

  TokenUsage total_usage() const;

  // Registers a tool for this session; tools named in session_tools are session-based as well
  void register_tool(std::shared_ptr<Tool> tool, bool session_based = false);

  ToolRegistry& tools() {
    return tools_;
  }

  const ToolPolicyGuard& policy() const {
    return policy_;
  }

  const CompactionEngine& compaction() const {
    return compaction_;
  }

  const llm::RetryManager& retry() const {
    return retry_;
  }

  // Null when snapshots are disabled
  SnapshotManager* snapshots() {
    return snapshots_.get();
  }

  // Runs one user turn to completion. Fails immediately in a terminal state.
  Result<TurnOutcome> run_turn(const std::string& text);

  // User interrupt: aborts the provider call and running tools of the current turn
  void cancel();

  // Ends the session; every later turn fails
  void terminate();

  // Restores the history saved after the given turn
  Status rollback(TurnNumber turn);

  // Event callbacks
  using OnStateChangeCallback = std::function<void(TurnState from, TurnState to)>;
  using OnMessageCallback = std::function<void(const Message&)>;
  using OnToolCallCallback = std::function<void(const std::string& tool, const json& args)>;
  using OnToolResultCallback = std::function<void(const std::string& call_id, const std::string& tool, const std::string& result, bool is_error)>;
  using OnErrorCallback = std::function<void(const Error& error)>;

  void on_state_change(OnStateChangeCallback cb) {
    on_state_change_ = std::move(cb);
  }
  void on_message(OnMessageCallback cb) {
    on_message_ = std::move(cb);
  }
  void on_tool_call(OnToolCallCallback cb) {
    on_tool_call_ = std::move(cb);
  }
  void on_tool_result(OnToolResultCallback cb) {
    on_tool_result_ = std::move(cb);
  }
  void on_error(OnErrorCallback cb) {
    on_error_ = std::move(cb);
  }

  // Asked synchronously for tools whose policy is Prompt; without a handler they are rejected
  using ConfirmationHandler = std::function<std::future<bool>(const std::string& tool, const std::string& description)>;
  void set_confirmation_handler(ConfirmationHandler handler) {
    confirmation_handler_ = std::move(handler);
  }

 private:
  Orchestrator(asio::io_context& io_ctx, const Config& config, OrchestratorOptions options);

  struct PendingCall {
    ToolCallPart call;
    std::shared_ptr<Tool> tool;
    std::optional<ToolResult> result;  // Set when the call was refused or has finished
    std::future<ToolResult> future;
    std::shared_ptr<std::atomic<bool>> call_abort;
    std::chrono::steady_clock::time_point deadline;
    bool holds_slot = false;
  };

  struct AbandonedCall {
    std::future<ToolResult> future;
    bool holds_slot = false;
  };

  void set_state(TurnState state);
  bool aborted() const;
  void report_error(ErrorKind kind, const std::string& message);

  Message append(const Message& message);

  llm::LlmRequest build_request(const llm::RouteDecision& route) const;
  Result<llm::LlmResponse> request_completion(const llm::RouteDecision& route);

  // Returns false when the batch was interrupted by cancel()
  bool execute_tool_calls(const std::vector<ToolCallPart>& calls);
  PendingCall prepare_call(const ToolCallPart& call);
  void await_call(PendingCall& pending);
  void record_result(const PendingCall& pending);
  void reap_abandoned();

  bool detect_doom_loop(const std::string& tool_name, const json& args);

  void maybe_compact();
  std::optional<Snapshot> take_snapshot(const TurnOutcome& outcome);
  json session_state() const;

  Result<TurnOutcome> finish_cancelled(TurnOutcome outcome);

  Config config_;
  SessionId id_;

  std::atomic<TurnState> state_{TurnState::Idle};
  std::atomic<TurnNumber> turn_number_{0};
  std::shared_ptr<std::atomic<bool>> abort_signal_;
  std::mutex turn_mutex_;  // One active turn at a time

  std::shared_ptr<llm::Provider> provider_;
  std::string system_prompt_;
  std::string working_dir_;

  ConversationHistory history_;
  CompactionEngine compaction_;
  ToolRegistry tools_;
  ToolPolicyGuard policy_;
  llm::RetryManager retry_;
  std::unique_ptr<SnapshotManager> snapshots_;

  mutable std::mutex usage_mutex_;
  TokenUsage total_usage_;

  std::vector<AbandonedCall> abandoned_;

  // Callbacks
  OnStateChangeCallback on_state_change_;
  OnMessageCallback on_message_;
  OnToolCallCallback on_tool_call_;
  OnToolResultCallback on_tool_result_;
  OnErrorCallback on_error_;
  ConfirmationHandler confirmation_handler_;

  // Doom loop tracking
  struct ToolCallRecord {
    std::string tool_name;
    std::string args_hash;
  };
  std::deque<ToolCallRecord> recent_tool_calls_;
};

}  // namespace turnloop
