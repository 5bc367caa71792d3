#include "turnloop/llm/retry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace turnloop::llm {

Sleeper timer_sleeper(asio::io_context& io_ctx) {
  return [&io_ctx](Milliseconds delay) {
    asio::steady_timer timer(io_ctx, delay);
    asio::error_code ec;
    timer.wait(ec);
  };
}

RetryManager::RetryManager(RetryConfig config, asio::io_context& io_ctx) : config_(std::move(config)), sleeper_(timer_sleeper(io_ctx)) {}

RetryManager::RetryManager(RetryConfig config, Sleeper sleeper) : config_(std::move(config)), sleeper_(std::move(sleeper)) {}

LlmResponse RetryManager::call(const std::function<std::future<LlmResponse>()>& operation, const std::atomic<bool>* abort_signal) {
  LlmResponse response;
  int attempt = 0;

  while (true) {
    ++attempt;
    response = attempt_once(operation);

    if (response.ok()) {
      if (attempt > 1) {
        std::lock_guard lock(stats_mutex_);
        stats_.successful_retries++;
        spdlog::info("[Retry] Succeeded on attempt {}", attempt);
      }
      return response;
    }

    bool retryable = is_retryable(response);
    bool aborted = abort_signal && abort_signal->load();
    if (!retryable || aborted || attempt >= config_.max_attempts) {
      if (attempt > 1) {
        std::lock_guard lock(stats_mutex_);
        stats_.failed_retries++;
      }
      spdlog::warn("[Retry] Giving up after {} attempt(s) ({}): {}", attempt, retryable ? "exhausted" : "not retryable", *response.error);
      return response;
    }

    auto delay = apply_jitter(backoff_delay(attempt));
    spdlog::debug("[Retry] Attempt {} failed ({}), retrying in {}ms", attempt, *response.error, delay.count());
    {
      std::lock_guard lock(stats_mutex_);
      stats_.total_backoff_time += delay;
    }
    sleeper_(delay);

    if (abort_signal && abort_signal->load()) {
      return LlmResponse::failure("Cancelled", true);
    }
  }
}

LlmResponse RetryManager::call_with_fallback(const std::string& model,
                                             const std::function<std::future<LlmResponse>(const std::string&)>& operation,
                                             const std::atomic<bool>* abort_signal) {
  auto response = call([&operation, &model]() { return operation(model); }, abort_signal);
  if (response.ok() || !config_.fallback_model || *config_.fallback_model == model) {
    return response;
  }
  if ((abort_signal && abort_signal->load()) || is_context_overflow_error(*response.error)) {
    return response;
  }

  const auto& fallback = *config_.fallback_model;
  spdlog::warn("[Retry] Model {} failed ({}), trying fallback model {}", model, *response.error, fallback);
  {
    std::lock_guard lock(stats_mutex_);
    stats_.fallback_activations++;
  }

  auto fallback_response = attempt_once([&operation, &fallback]() { return operation(fallback); });
  if (fallback_response.ok()) {
    spdlog::info("[Retry] Fallback model {} succeeded", fallback);
  } else {
    spdlog::warn("[Retry] Fallback model {} also failed: {}", fallback, *fallback_response.error);
  }
  return fallback_response;
}

LlmResponse RetryManager::attempt_once(const std::function<std::future<LlmResponse>()>& operation) {
  {
    std::lock_guard lock(stats_mutex_);
    stats_.total_attempts++;
  }
  try {
    return operation().get();
  } catch (const std::exception& e) {
    return LlmResponse::failure(e.what());
  }
}

bool RetryManager::is_retryable(const LlmResponse& response) const {
  if (response.ok() || response.terminal) {
    return false;
  }
  return is_retryable_error(*response.error);
}

bool RetryManager::is_retryable_error(const std::string& message) const {
  auto lower = to_lower(message);
  return std::any_of(config_.retryable_errors.begin(), config_.retryable_errors.end(), [&lower](const std::string& pattern) {
    return !pattern.empty() && lower.find(to_lower(pattern)) != std::string::npos;
  });
}

Milliseconds RetryManager::backoff_delay(int retry) const {
  double delay = static_cast<double>(config_.initial_delay.count()) * std::pow(config_.backoff_multiplier, std::max(retry - 1, 0));
  double capped = std::min(delay, static_cast<double>(config_.max_delay.count()));
  return Milliseconds(static_cast<int64_t>(capped));
}

Milliseconds RetryManager::apply_jitter(Milliseconds delay) const {
  if (config_.jitter_ratio <= 0.0) {
    return delay;
  }
  thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, config_.jitter_ratio);
  // Jitter only shortens the wait, so the cap still holds
  return Milliseconds(static_cast<int64_t>(static_cast<double>(delay.count()) * (1.0 - dist(engine))));
}

RetryStats RetryManager::stats() const {
  std::lock_guard lock(stats_mutex_);
  return stats_;
}

void RetryManager::reset_stats() {
  std::lock_guard lock(stats_mutex_);
  stats_ = RetryStats{};
}

bool is_context_overflow_error(const std::string& message) {
  static const char* kPhrases[] = {"context length", "context window", "maximum context", "model is overloaded",
                                   "reduce the amount", "token limit",   "503"};
  auto lower = to_lower(message);
  for (const char* phrase : kPhrases) {
    if (lower.find(phrase) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace turnloop::llm
