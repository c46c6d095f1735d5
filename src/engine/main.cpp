#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/batch/cancellation.hpp"
#include "core/common/config/config_manager.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/string_utils.hpp"
#include "engine/engine_core.hpp"

namespace {

namespace logging = netbatch::core::common::log;
namespace json = netbatch::core::common::json;

constexpr int kExitOk = 0;
constexpr int kExitDeviceFailures = 1;
constexpr int kExitUsage = 2;

netbatch::core::batch::CancellationToken* g_token = nullptr;

void HandleSignal(int) {
  if (g_token != nullptr) g_token->RequestStop();
}

struct Args {
  std::string config_yaml;
  std::optional<std::string> inventory;
  std::string scope;
  std::vector<std::string> commands;
  std::vector<std::string> intents;
  std::string category;
  std::optional<std::string> results_dir;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<std::int64_t> max_concurrency;
  std::optional<std::int64_t> timeout_ms;

  bool plan = false;
  bool list = false;
  bool help = false;
};

void PrintUsage(std::ostream& os) {
  os << "usage: netbatch --inventory FILE --scope EXPR (--cmd CMD... | --intent NAME...)\n"
        "                [--config FILE] [--category NAME] [--results-dir DIR]\n"
        "                [--max-concurrency N] [--timeout-ms MS]\n"
        "                [--log-file FILE] [--log-level LEVEL] [--plan] [--list]\n";
}

bool ParseArgs(int argc, char** argv, Args& out, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];

    auto take_value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      ++i;
      return std::string(argv[i]);
    };
    auto take_int = [&](std::optional<std::int64_t>& dst) -> bool {
      const auto v = take_value();
      std::int64_t n = 0;
      if (!v || !netbatch::core::common::str::ParseInt64(*v, n) || n <= 0) return false;
      dst = n;
      return true;
    };

    bool ok = true;
    if (a == "--config") {
      const auto v = take_value();
      ok = v.has_value();
      if (ok) out.config_yaml = *v;
    } else if (a == "--inventory") {
      out.inventory = take_value();
      ok = out.inventory.has_value();
    } else if (a == "--scope") {
      const auto v = take_value();
      ok = v.has_value();
      if (ok) out.scope = *v;
    } else if (a == "--cmd") {
      const auto v = take_value();
      ok = v.has_value();
      if (ok) out.commands.push_back(*v);
    } else if (a == "--intent") {
      const auto v = take_value();
      ok = v.has_value();
      if (ok) out.intents.push_back(*v);
    } else if (a == "--category") {
      const auto v = take_value();
      ok = v.has_value();
      if (ok) out.category = *v;
    } else if (a == "--results-dir") {
      out.results_dir = take_value();
      ok = out.results_dir.has_value();
    } else if (a == "--log-file") {
      out.log_file = take_value();
      ok = out.log_file.has_value();
    } else if (a == "--log-level") {
      out.log_level = take_value();
      ok = out.log_level.has_value();
    } else if (a == "--max-concurrency") {
      ok = take_int(out.max_concurrency);
    } else if (a == "--timeout-ms") {
      ok = take_int(out.timeout_ms);
    } else if (a == "--plan") {
      out.plan = true;
    } else if (a == "--list") {
      out.list = true;
    } else if (a == "--help" || a == "-h") {
      out.help = true;
    } else {
      err = "unknown argument: " + std::string(a);
      return false;
    }
    if (!ok) {
      err = "missing or invalid value for " + std::string(a);
      return false;
    }
  }
  return true;
}

int Fail(const netbatch::core::common::Error& e) {
  std::cerr << json::Object({
                   {"error", json::Quote(netbatch::core::common::ToString(e.code))},
                   {"message", json::Quote(e.message)},
                   {"subject", json::Quote(e.subject)},
               })
            << "\n";
  return kExitUsage;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  std::string arg_err;
  if (!ParseArgs(argc, argv, args, arg_err)) {
    std::cerr << arg_err << "\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (args.help) {
    PrintUsage(std::cout);
    return kExitOk;
  }

  netbatch::core::common::config::ConfigManager cfg;
  if (!args.config_yaml.empty() && !cfg.LoadYamlFile(args.config_yaml)) {
    return Fail({netbatch::core::common::ErrorCode::Config, cfg.LastError(), args.config_yaml});
  }

  netbatch::engine::EngineSettings settings;
  netbatch::core::common::Error err;
  if (!netbatch::engine::EngineSettings::FromConfig(cfg, settings, err)) return Fail(err);

  if (args.inventory) {
    settings.inventory_file = *args.inventory;
  } else {
    const auto missing = netbatch::core::common::config::ValidateRequiredKeys(cfg, {"inventory.file"});
    if (!missing.empty()) {
      std::cerr << missing.front() << " (or pass --inventory)\n";
      PrintUsage(std::cerr);
      return kExitUsage;
    }
  }
  if (args.results_dir) settings.results_dir = *args.results_dir;
  if (args.log_file) settings.log_file = *args.log_file;
  if (args.log_level) settings.log_level = *args.log_level;
  if (args.max_concurrency) settings.batch.max_concurrency = static_cast<std::size_t>(*args.max_concurrency);
  if (args.timeout_ms) settings.batch.per_command_timeout = std::chrono::milliseconds(*args.timeout_ms);

  std::shared_ptr<logging::Sink> sink;
  if (settings.log_file.empty()) {
    sink = std::make_shared<logging::StreamSink>(std::cerr);
  } else {
    sink = std::make_shared<logging::FileSink>(settings.log_file);
  }
  auto logger = std::make_shared<logging::Logger>(sink);
  const auto lvl = logging::ParseLevel(settings.log_level);
  if (!lvl) {
    return Fail({netbatch::core::common::ErrorCode::Config, "unknown log level", settings.log_level});
  }
  logger->SetLevel(*lvl);

  netbatch::core::batch::CancellationToken token;
  settings.batch.cancellation = token;
  g_token = &token;
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  std::unique_ptr<netbatch::engine::EngineCore> engine;
  if (!netbatch::engine::EngineCore::Create(settings, logger, engine, err)) {
    logger->Error("startup failed: " + err.ToString());
    return Fail(err);
  }

  if (args.list) {
    std::cout << engine->GetInventory().ToJsonList() << "\n";
    return kExitOk;
  }

  if (args.scope.empty()) {
    std::cerr << "--scope is required\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  if (args.plan) {
    const auto res = engine->ResolveScope(args.scope);
    std::cout << engine->Plan(args.scope, args.commands, args.intents) << "\n";
    return res.Ok() ? kExitOk : kExitUsage;
  }

  if (args.commands.empty() == args.intents.empty()) {
    std::cerr << "give either --cmd or --intent\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  logger->Info("run scope='" + args.scope + "' category='" + args.category + "'");

  std::shared_ptr<const netbatch::core::batch::BatchResult> result;
  const bool ok = args.commands.empty()
                      ? engine->CollectIntents(args.scope, args.intents, args.category, result, err)
                      : engine->Collect(args.scope, args.commands, args.category, result, err);

  if (result) std::cout << result->ToJson() << "\n";

  engine->Shutdown();
  g_token = nullptr;
  logger->Flush();

  if (!ok) return Fail(err);
  return result->devices_failed.empty() ? kExitOk : kExitDeviceFailures;
}
