#include <gtest/gtest.h>

#include <vector>

#include "turnloop/llm/retry.hpp"

using namespace turnloop;
using namespace turnloop::llm;

namespace {

std::future<LlmResponse> ready(LlmResponse response) {
  std::promise<LlmResponse> promise;
  promise.set_value(std::move(response));
  return promise.get_future();
}

LlmResponse ok_response(const std::string& text) {
  LlmResponse response;
  response.text = text;
  return response;
}

}  // namespace

class RetryTest : public ::testing::Test {
 protected:
  RetryManager make(RetryConfig config = RetryConfig{}) {
    return RetryManager(std::move(config), [this](Milliseconds delay) { delays_.push_back(delay); });
  }

  std::vector<Milliseconds> delays_;
};

TEST_F(RetryTest, ExponentialDelaysUntilAttemptsRunOut) {
  auto retry = make();
  int calls = 0;

  auto response = retry.call([&calls]() {
    calls++;
    return ready(LlmResponse::failure("Connection reset by peer"));
  });

  EXPECT_FALSE(response.ok());
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(delays_.size(), 2u);
  EXPECT_EQ(delays_[0], Milliseconds(500));
  EXPECT_EQ(delays_[1], Milliseconds(1000));

  auto stats = retry.stats();
  EXPECT_EQ(stats.total_attempts, 3u);
  EXPECT_EQ(stats.failed_retries, 1u);
  EXPECT_EQ(stats.successful_retries, 0u);
  EXPECT_EQ(stats.total_backoff_time, Milliseconds(1500));
}

TEST_F(RetryTest, SucceedsAfterTransientFailure) {
  auto retry = make();
  int calls = 0;

  auto response = retry.call([&calls]() {
    return ++calls == 1 ? ready(LlmResponse::failure("rate limit exceeded")) : ready(ok_response("hello"));
  });

  ASSERT_TRUE(response.ok());
  EXPECT_EQ(response.text, "hello");
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(retry.stats().successful_retries, 1u);
}

TEST_F(RetryTest, NonRetryableErrorFailsImmediately) {
  auto retry = make();
  int calls = 0;

  auto response = retry.call([&calls]() {
    calls++;
    return ready(LlmResponse::failure("invalid api key"));
  });

  EXPECT_FALSE(response.ok());
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(delays_.empty());
}

TEST_F(RetryTest, TerminalFlagStopsRetries) {
  auto retry = make();
  int calls = 0;

  retry.call([&calls]() {
    calls++;
    return ready(LlmResponse::failure("timeout while streaming", true));
  });

  EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, ClassificationIsCaseInsensitive) {
  auto retry = make();
  EXPECT_TRUE(retry.is_retryable_error("Request TIMED OUT"));
  EXPECT_TRUE(retry.is_retryable_error("Service Temporarily Unavailable"));
  EXPECT_FALSE(retry.is_retryable_error("bad request"));
}

TEST_F(RetryTest, DelayIsCapped) {
  RetryConfig config;
  config.max_attempts = 6;
  config.initial_delay = Milliseconds(1000);
  config.max_delay = Milliseconds(3000);
  auto retry = make(config);

  retry.call([]() { return ready(LlmResponse::failure("network down")); });

  ASSERT_EQ(delays_.size(), 5u);
  EXPECT_EQ(delays_[0], Milliseconds(1000));
  EXPECT_EQ(delays_[1], Milliseconds(2000));
  EXPECT_EQ(delays_[2], Milliseconds(3000));
  EXPECT_EQ(delays_[4], Milliseconds(3000));
}

TEST_F(RetryTest, JitterOnlyShortensDelay) {
  RetryConfig config;
  config.max_attempts = 4;
  config.jitter_ratio = 0.5;
  auto retry = make(config);

  retry.call([]() { return ready(LlmResponse::failure("server_error")); });

  ASSERT_EQ(delays_.size(), 3u);
  for (size_t i = 0; i < delays_.size(); ++i) {
    auto nominal = retry.backoff_delay(static_cast<int>(i) + 1);
    EXPECT_LE(delays_[i], nominal);
    EXPECT_GE(delays_[i], nominal / 2);
  }
}

TEST_F(RetryTest, ExceptionBecomesErrorResponse) {
  auto retry = make();
  auto response = retry.call([]() -> std::future<LlmResponse> { throw std::runtime_error("connection refused"); });

  EXPECT_FALSE(response.ok());
  EXPECT_EQ(retry.stats().total_attempts, 3u);
}

TEST_F(RetryTest, AbortStopsFurtherAttempts) {
  auto retry = make();
  std::atomic<bool> abort{false};
  int calls = 0;

  auto response = retry.call(
      [&]() {
        calls++;
        abort = true;
        return ready(LlmResponse::failure("timeout"));
      },
      &abort);

  EXPECT_FALSE(response.ok());
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, FallbackModelAfterAttemptsRunOut) {
  RetryConfig config;
  config.fallback_model = "backup-model";
  auto retry = make(config);
  std::vector<std::string> models;

  auto response = retry.call_with_fallback("main-model", [&models](const std::string& model) {
    models.push_back(model);
    return ready(model == "backup-model" ? ok_response("from backup") : LlmResponse::failure("request timed out"));
  });

  ASSERT_TRUE(response.ok());
  EXPECT_EQ(response.text, "from backup");
  EXPECT_EQ(models, (std::vector<std::string>{"main-model", "main-model", "main-model", "backup-model"}));
  EXPECT_EQ(delays_.size(), 2u);

  auto stats = retry.stats();
  EXPECT_EQ(stats.fallback_activations, 1u);
  EXPECT_EQ(stats.total_attempts, 4u);
}

TEST_F(RetryTest, FallbackSkippedWhenNotNeeded) {
  RetryConfig config;
  config.fallback_model = "backup-model";
  auto retry = make(config);
  std::vector<std::string> models;
  auto record = [&models](LlmResponse response) {
    return [&models, response](const std::string& model) {
      models.push_back(model);
      return ready(response);
    };
  };

  EXPECT_TRUE(retry.call_with_fallback("main-model", record(ok_response("fine"))).ok());
  EXPECT_FALSE(retry.call_with_fallback("main-model", record(LlmResponse::failure("maximum context length exceeded"))).ok());
  EXPECT_FALSE(retry.call_with_fallback("backup-model", record(LlmResponse::failure("invalid api key", true))).ok());

  std::atomic<bool> abort{true};
  EXPECT_FALSE(retry.call_with_fallback("main-model", record(LlmResponse::failure("invalid api key", true)), &abort).ok());

  EXPECT_EQ(models, (std::vector<std::string>{"main-model", "main-model", "backup-model", "main-model"}));
  EXPECT_EQ(retry.stats().fallback_activations, 0u);

  // Without a fallback model configured the primary failure is returned as is
  auto plain = make();
  auto response = plain.call_with_fallback("main-model", record(LlmResponse::failure("invalid api key", true)));
  ASSERT_FALSE(response.ok());
  EXPECT_EQ(*response.error, "invalid api key");
  EXPECT_EQ(plain.stats().fallback_activations, 0u);
}

TEST_F(RetryTest, FailedFallbackReturnsItsError) {
  RetryConfig config;
  config.max_attempts = 1;
  config.fallback_model = "backup-model";
  auto retry = make(config);

  auto response = retry.call_with_fallback("main-model", [](const std::string& model) {
    return ready(LlmResponse::failure(model + " unavailable", true));
  });

  ASSERT_FALSE(response.ok());
  EXPECT_EQ(*response.error, "backup-model unavailable");
  EXPECT_EQ(retry.stats().fallback_activations, 1u);
}

TEST_F(RetryTest, AsioTimerSleeperWaits) {
  asio::io_context io_ctx;
  RetryConfig config;
  config.initial_delay = Milliseconds(5);
  config.max_delay = Milliseconds(5);
  RetryManager retry(config, io_ctx);

  auto start = std::chrono::steady_clock::now();
  retry.call([]() { return ready(LlmResponse::failure("timeout")); });
  EXPECT_GE(std::chrono::steady_clock::now() - start, Milliseconds(10));
}

TEST(ContextOverflowTest, DetectsKnownPhrases) {
  EXPECT_TRUE(is_context_overflow_error("This model's maximum context length is 8192 tokens"));
  EXPECT_TRUE(is_context_overflow_error("Please reduce the amount of input"));
  EXPECT_TRUE(is_context_overflow_error("HTTP 503 Service Unavailable"));
  EXPECT_TRUE(is_context_overflow_error("Token limit exceeded"));
  EXPECT_FALSE(is_context_overflow_error("invalid api key"));
}
