#include "chronicle/app/CommandLineArgs.hpp"
#include "chronicle/app/DemoWorld.hpp"
#include "chronicle/core/Config.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"
#include "chronicle/sim/Engine.hpp"
#include "chronicle/world/UnitJson.hpp"

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <fmt/format.h>

namespace {

chronicle::sim::Engine* g_engine = nullptr;

extern "C" void on_signal(int) {
  if (g_engine) g_engine->request_stop();
}

chronicle::EngineConfig load_config(const chronicle::app::CommandLineArgs& args) {
  chronicle::EngineConfig cfg{};
  if (args.configPath) {
    cfg = chronicle::LoadConfigOrThrow(*args.configPath);
  } else {
    const std::filesystem::path data = args.dataDir ? std::filesystem::path(*args.dataDir) : cfg.dataDirectory;
    chronicle::LoadConfig(cfg, data / "config.json");
  }

  if (args.dataDir) cfg.dataDirectory = *args.dataDir;
  if (args.seed) cfg.seed = *args.seed;
  if (args.runIndefinitely) cfg.runIndefinitely = *args.runIndefinitely;
  if (args.logLevel) cfg.logging.level = *args.logLevel;
  if (args.quiet) cfg.logging.disable = true;
  return cfg;
}

// Units saved by a previous session take precedence over the demo cast.
void populate(chronicle::sim::Engine& engine) {
  const auto saved = engine.config().dataDirectory / "units.json";
  std::error_code ec;
  if (std::filesystem::exists(saved, ec)) {
    for (chronicle::world::Unit& u : chronicle::world::LoadUnits(saved)) engine.roster().add(std::move(u));
    chronicle::logsys::get("engine")->info("Loaded {} units from {}", engine.roster().size(), saved.string());
    return;
  }
  const int added = chronicle::app::PopulateDemoRoster(engine.roster());
  chronicle::logsys::get("engine")->info("Created {} demo units", added);
}

} // namespace

int main(int argc, char** argv) {
  const chronicle::app::CommandLineArgs args = chronicle::app::ParseCommandLineArgs(argc, argv);
  if (args.showHelp) {
    std::fputs(chronicle::app::BuildCommandLineHelpText().c_str(), stdout);
    return 0;
  }
  if (!args.unknown.empty()) {
    for (const std::string& u : args.unknown) fmt::print(stderr, "Unknown or invalid option: {}\n", u);
    std::fputs(chronicle::app::BuildCommandLineHelpText().c_str(), stderr);
    return 2;
  }

  try {
    const chronicle::EngineConfig cfg = load_config(args);
    chronicle::logsys::init(cfg.logging);

    chronicle::sim::Engine engine(cfg);
    chronicle::app::BuildDemoWorld(engine.world(), engine.gates());
    engine.initialize();
    populate(engine);

    engine.set_hooks(chronicle::sim::EngineHooks{
        {},
        {},
        [](int turn, const chronicle::sim::ExecutedAction& executed) {
          fmt::print("[turn {:>3}] {}\n", turn,
                     executed.action.description.empty() ? executed.action.type : executed.action.description);
        },
        {},
    });

    g_engine = &engine;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    const int taken = engine.run(args.turns);
    g_engine = nullptr;

    fmt::print("{} turns this session, {} diary entries.\n", taken, engine.diary().entries().size());
    return 0;
  } catch (const chronicle::ConfigError& e) {
    fmt::print(stderr, "Configuration error: {}\n", e.what());
    return 2;
  } catch (const chronicle::SchedulerError& e) {
    chronicle::logsys::get("engine")->critical("Scheduler invariant violated: {}", e.what());
    return 3;
  }
}
