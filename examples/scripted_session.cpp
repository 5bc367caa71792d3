#include <algorithm>
#include <asio.hpp>
#include <atomic>
#include <csignal>
#include <ctime>
#include <iostream>
#include <string>

#include "spdlog/cfg/env.h"
#include "turnloop/turnloop.hpp"

using namespace turnloop;

// Offline provider: asks for the clock tool when the user mentions the time, echoes otherwise
class EchoProvider : public llm::Provider {
 public:
  std::string name() const override {
    return "echo";
  }

  std::future<llm::LlmResponse> complete(const llm::LlmRequest& request) override {
    std::promise<llm::LlmResponse> promise;
    llm::LlmResponse response;
    response.usage = TokenUsage{static_cast<int64_t>(request.messages.size()) * 10, 8};

    const auto& last = request.messages.back();
    if (last.role() == Role::Tool) {
      auto results = last.tool_results();
      response.text = "The clock says " + (results.empty() ? std::string("nothing") : results.front()->output) + ".";
    } else if (to_lower(last.text()).find("time") != std::string::npos) {
      response.tool_calls.push_back(ToolCallPart{"call_" + std::to_string(++calls_), "clock", json::object()});
      response.finish_reason = FinishReason::ToolCalls;
    } else {
      response.text = "[" + request.model + "] You said: " + last.text();
    }

    promise.set_value(std::move(response));
    return promise.get_future();
  }

  void cancel() override {}

 private:
  int calls_ = 0;
};

class ClockTool : public SimpleTool {
 public:
  ClockTool() : SimpleTool("clock", "Current local time") {}

  std::vector<ParameterSchema> parameters() const override {
    return {};
  }

  std::future<ToolResult> execute(const json&, const ToolContext&) override {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);

    std::promise<ToolResult> promise;
    promise.set_value(ToolResult::success(buf));
    return promise.get_future();
  }
};

static std::shared_ptr<Orchestrator> g_session;

static void sigint_handler(int) {
  if (g_session) {
    g_session->cancel();
  }
}

int main(int argc, char* argv[]) {
  spdlog::cfg::load_env_levels();

  auto loaded = argc > 1 ? Config::load(argv[1]) : Config::load_default();
  if (loaded.failed()) {
    std::cerr << "Config error: " << loaded.message() << "\n";
    return 1;
  }
  Config config = *loaded.value;
  config.tool_policy.tools["clock"] = Decision::Allow;

  turnloop::init(config);

  asio::io_context io_ctx;
  OrchestratorOptions options;
  options.provider = std::make_shared<EchoProvider>();
  options.system_prompt = "You are a helpful assistant.";

  auto created = Orchestrator::create(io_ctx, config, std::move(options));
  if (created.failed()) {
    std::cerr << "Cannot start session: " << created.message() << "\n";
    return 1;
  }
  g_session = *created.value;
  g_session->register_tool(std::make_shared<ClockTool>());

  g_session->on_tool_call([](const std::string& tool, const json& args) {
    std::cout << "[Calling tool: " << tool << " " << args.dump() << "]\n";
  });
  g_session->on_error([](const Error& error) {
    std::cerr << "[" << to_string(error.kind) << ": " << error.message << "]\n";
  });

  std::signal(SIGINT, sigint_handler);

  std::cout << "turnloop " << version() << " (session " << g_session->id() << ")\n";
  std::cout << "Commands: /undo <turn>, /stats, /q\n\n> " << std::flush;

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line == "/q" || line == "/quit") {
      break;
    }

    if (line == "/stats") {
      auto stats = g_session->compaction().get_statistics(g_session->history());
      std::cout << "messages: " << stats.total_messages << ", bytes: " << stats.total_memory_usage
                << ", tokens: " << g_session->total_usage().total() << "\n";
    } else if (line.rfind("/undo ", 0) == 0) {
      auto arg = line.substr(6);
      if (arg.empty() || !std::all_of(arg.begin(), arg.end(), ::isdigit)) {
        std::cout << "Usage: /undo <turn>\n";
        std::cout << "\n> " << std::flush;
        continue;
      }
      auto status = g_session->rollback(std::stoull(arg));
      std::cout << (status.ok() ? "Rolled back.\n" : "Rollback failed: " + status.error->message + "\n");
    } else if (!line.empty()) {
      auto outcome = g_session->run_turn(line);
      if (outcome.ok()) {
        std::cout << outcome.value->text << "\n";
      } else if (outcome.kind() == ErrorKind::Cancelled) {
        std::cout << "[Interrupted]\n";
      } else if (g_session->state() == TurnState::Fatal) {
        std::cout << "Session failed; use /undo <turn> to recover.\n";
      }
    }

    std::cout << "\n> " << std::flush;
  }

  g_session->terminate();
  g_session.reset();
  turnloop::shutdown();
  return 0;
}
