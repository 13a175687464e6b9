#include "chronicle/core/Log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace chronicle::logsys {
namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v";

struct Registry {
  std::mutex mutex;
  std::vector<spdlog::sink_ptr> sinks;
  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
  spdlog::level::level_enum level{spdlog::level::info};
  bool enabled{true};
  bool initialized{false};
};

Registry& registry() {
  static Registry r;
  return r;
}

void install_default_sinks(Registry& r) {
  r.sinks.clear();
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  r.sinks.push_back(console);
  r.initialized = true;
}

spdlog::level::level_enum effective_level(const Registry& r) {
  return r.enabled ? r.level : spdlog::level::off;
}

} // namespace

void init(const LogConfig& cfg) {
  auto& r = registry();
  std::lock_guard<std::mutex> lock(r.mutex);

  install_default_sinks(r);
  if (!cfg.file.empty()) {
    const fs::path path{cfg.file};
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), 1 << 20, 4); // 1MB * 4
    r.sinks.push_back(file);
  }

  r.level = spdlog::level::from_str(cfg.level);
  r.enabled = !cfg.disable;

  for (auto& [name, logger] : r.loggers) {
    logger->sinks() = r.sinks;
    logger->set_pattern(kPattern);
    logger->set_level(effective_level(r));
  }
}

std::shared_ptr<spdlog::logger> get(std::string_view name) {
  auto& r = registry();
  std::lock_guard<std::mutex> lock(r.mutex);
  if (!r.initialized) install_default_sinks(r);

  const std::string key{name};
  const auto it = r.loggers.find(key);
  if (it != r.loggers.end()) return it->second;

  auto logger = std::make_shared<spdlog::logger>(key, r.sinks.begin(), r.sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(effective_level(r));
  r.loggers.emplace(key, logger);
  return logger;
}

void set_enabled(bool enabled) {
  auto& r = registry();
  std::lock_guard<std::mutex> lock(r.mutex);
  r.enabled = enabled;
  for (auto& [name, logger] : r.loggers) logger->set_level(effective_level(r));
}

bool enabled() noexcept {
  return registry().enabled;
}

} // namespace chronicle::logsys
