#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <string>

#include <asio.hpp>

#include "turnloop/core/config.hpp"
#include "turnloop/llm/provider.hpp"

namespace turnloop::llm {

struct RetryStats {
  uint64_t total_attempts = 0;
  uint64_t successful_retries = 0;  // Calls that succeeded after at least one retry
  uint64_t failed_retries = 0;      // Calls that retried and still failed
  uint64_t fallback_activations = 0;
  Milliseconds total_backoff_time{0};
};

// Blocks the calling thread for the given delay
using Sleeper = std::function<void(Milliseconds)>;

// Sleeper waiting on an asio steady timer bound to io_ctx
Sleeper timer_sleeper(asio::io_context& io_ctx);

// Re-drives a provider call with exponential backoff on transient failures
class RetryManager {
 public:
  // Backoff waits on an asio steady timer bound to io_ctx
  RetryManager(RetryConfig config, asio::io_context& io_ctx);

  RetryManager(RetryConfig config, Sleeper sleeper);

  // Runs operation until it succeeds, fails terminally, or attempts run out.
  // A set abort flag stops further attempts.
  LlmResponse call(const std::function<std::future<LlmResponse>()>& operation, const std::atomic<bool>* abort_signal = nullptr);

  // Like call() on `model`; if that fails, makes a single attempt on the configured fallback model.
  // Context overflow and cancellation never fall back.
  LlmResponse call_with_fallback(const std::string& model, const std::function<std::future<LlmResponse>(const std::string&)>& operation,
                                 const std::atomic<bool>* abort_signal = nullptr);

  bool is_retryable(const LlmResponse& response) const;
  bool is_retryable_error(const std::string& message) const;

  // Delay before retry number `retry` (1-based), jitter excluded
  Milliseconds backoff_delay(int retry) const;

  RetryStats stats() const;
  void reset_stats();

  const RetryConfig& config() const {
    return config_;
  }

 private:
  Milliseconds apply_jitter(Milliseconds delay) const;
  LlmResponse attempt_once(const std::function<std::future<LlmResponse>()>& operation);

  RetryConfig config_;
  Sleeper sleeper_;

  mutable std::mutex stats_mutex_;
  RetryStats stats_;
};

// Provider errors meaning the request no longer fits the model's context
bool is_context_overflow_error(const std::string& message);

}  // namespace turnloop::llm
