#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "turnloop/core/message.hpp"
#include "turnloop/core/types.hpp"
#include "turnloop/tool/tool.hpp"

namespace turnloop::llm {

// LLM request
struct LlmRequest {
  std::string model;
  std::vector<Message> messages;
  std::string system_prompt;

  // Tools the model may call
  std::vector<std::shared_ptr<Tool>> tools;

  std::optional<double> temperature;
  std::optional<int> max_tokens;  // Filled from the router's per-class budget
};

// LLM response (non-streaming)
struct LlmResponse {
  std::string text;
  std::vector<ToolCallPart> tool_calls;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;

  std::optional<std::string> error;
  bool terminal = false;  // Provider says retrying cannot help

  bool ok() const {
    return !error.has_value();
  }

  static LlmResponse failure(std::string message, bool terminal = false) {
    LlmResponse response;
    response.error = std::move(message);
    response.finish_reason = FinishReason::Error;
    response.terminal = terminal;
    return response;
  }
};

// Abstract LLM provider interface; wire formats live in the implementations
class Provider {
 public:
  virtual ~Provider() = default;

  virtual std::string name() const = 0;

  virtual std::future<LlmResponse> complete(const LlmRequest& request) = 0;

  // Abort the in-flight request, if any
  virtual void cancel() = 0;
};

}  // namespace turnloop::llm
