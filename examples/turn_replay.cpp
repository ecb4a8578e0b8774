// Replay a recorded model stream through the turn processor and print
// every part update as it is published.
//
//   coderun_replay <script.json> [--idle-timeout ms] [--store dir] [--continue-on-deny]
//
// Script format:
//   {"model": {"id": "...", "provider_id": "...", "limit": {...}, "cost": {...}},
//    "attempts": [[{"after_ms": 10, "event": {"type": "text-start", "id": "t1"}}, ...]]}
#include <asio.hpp>
#include <csignal>
#include <cstring>
#include <fstream>
#include <future>
#include <iostream>
#include <string>
#include <thread>

#include "coderun/coderun.hpp"
#include "core/version.hpp"
#include "spdlog/cfg/env.h"

using namespace coderun;

static void print_usage(const char* argv0) {
  std::cerr << "coderun " << CODERUN_VERSION_STRING << "\n"
            << "Usage: " << argv0 << " <script.json> [--idle-timeout ms] [--store dir] [--continue-on-deny]\n";
}

static void print_part(const events::PartUpdated& event) {
  const auto& part = event.part;
  if (event.delta) {
    std::cout << *event.delta << std::flush;
    return;
  }

  if (auto* tool = std::get_if<ToolPart>(&part)) {
    std::cout << "\n[tool " << tool->tool << " " << to_string(tool->status()) << "]";
    if (auto* done = std::get_if<ToolStateCompleted>(&tool->state)) {
      std::cout << " " << done->output;
    } else if (auto* failed = std::get_if<ToolStateError>(&tool->state)) {
      std::cout << " " << failed->error;
    }
    std::cout << "\n";
  } else if (auto* text = std::get_if<TextPart>(&part)) {
    if (text->time && text->time->end) {
      std::cout << "\n[text done: " << text->text.size() << " chars]\n";
    }
  } else if (auto* finish = std::get_if<StepFinishPart>(&part)) {
    std::cout << "\n[step finished: " << finish->reason << ", " << finish->tokens.total() << " tokens, $" << finish->cost << "]\n";
  } else if (auto* patch = std::get_if<PatchPart>(&part)) {
    std::cout << "\n[patch " << patch->hash << ": " << patch->files.size() << " files]\n";
  }
}

int main(int argc, char* argv[]) {
  spdlog::cfg::load_env_levels();

  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  std::string script_path = argv[1];
  auto config = Config::from_env();
  std::optional<std::filesystem::path> store_dir;

  for (int i = 2; i < argc; ++i) {
    if (std::strcmp(argv[i], "--idle-timeout") == 0 && i + 1 < argc) {
      config.experimental.stream_idle_timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
    } else if (std::strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
      store_dir = argv[++i];
    } else if (std::strcmp(argv[i], "--continue-on-deny") == 0) {
      config.experimental.continue_loop_on_deny = true;
    } else {
      print_usage(argv[0]);
      return 1;
    }
  }
  config.snapshot = false;

  init(config);

  json script;
  try {
    std::ifstream file(script_path);
    if (!file) {
      std::cerr << "Cannot open " << script_path << "\n";
      return 1;
    }
    script = json::parse(file);
  } catch (const std::exception& e) {
    std::cerr << "Invalid script: " << e.what() << "\n";
    return 1;
  }

  asio::io_context io_ctx;
  auto work_guard = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx] {
    io_ctx.run();
  });

  auto provider = llm::ProviderFactory::instance().create("scripted", script, io_ctx);
  auto model = ModelInfo::from_json(script.value("model", json{{"id", "replay"}, {"provider_id", "scripted"}}));

  std::shared_ptr<SessionStore> store;
  if (store_dir) {
    store = std::make_shared<JsonSessionStore>(*store_dir);
  } else {
    store = std::make_shared<InMemorySessionStore>();
  }

  auto permission = std::make_shared<PermissionNext>();
  permission->set_handler([](const PermissionRequest& request) {
    std::cout << "\n[approval needed: " << request.permission << "] approve? (y/n) " << std::flush;
    std::string answer;
    std::getline(std::cin, answer);
    std::promise<PermissionReply> promise;
    promise.set_value(answer == "y" || answer == "yes" ? PermissionReply::Once : PermissionReply::Reject);
    return promise.get_future();
  });

  TurnDependencies deps;
  deps.provider = provider;
  deps.store = store;
  deps.permission = permission;

  AssistantMessage message(Identifier::ascending("ses"), Identifier::ascending("msg"));
  message.set_model(model.provider_id, model.id);
  TurnProcessor turn(message, model, deps, config);

  // Ctrl+C aborts the turn
  asio::signal_set signals(io_ctx, SIGINT);
  signals.async_wait([&turn](const asio::error_code& ec, int) {
    if (!ec) {
      turn.abort_signal()->abort();
    }
  });

  ScopedSubscription parts(Bus::instance().subscribe<events::PartUpdated>(print_part));
  ScopedSubscription failures(Bus::instance().subscribe<events::SessionError>([](const events::SessionError& event) {
    std::cerr << "\n[error " << event.error.name << "] " << event.error.message << "\n";
  }));
  ScopedSubscription statuses(Bus::instance().subscribe<events::SessionStatusChanged>([](const events::SessionStatusChanged& event) {
    if (event.type == "retry") {
      std::cout << "\n[retry " << event.attempt << "] " << event.message << "\n";
    }
  }));

  int exit_code = 0;
  try {
    llm::StreamRequest request;
    request.model = model;
    auto result = turn.process(request);

    const auto& done = turn.message();
    std::cout << "\n\nResult: " << to_string(result) << "\n";
    std::cout << "Tokens: " << done.tokens().total() << ", cost: $" << done.cost() << "\n";
    if (done.error()) {
      std::cout << "Error: " << done.error()->name << ": " << done.error()->message << "\n";
    }
    exit_code = result == TurnResult::Stop ? 2 : 0;
  } catch (const std::exception& e) {
    std::cerr << "Turn failed: " << e.what() << "\n";
    exit_code = 1;
  }

  signals.cancel();
  work_guard.reset();
  io_ctx.stop();
  io_thread.join();

  shutdown();
  return exit_code;
}
