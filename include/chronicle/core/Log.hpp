#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace chronicle::logsys {

struct LogConfig {
  std::string level{"info"};     // trace|debug|info|warn|error|critical|off
  std::string file{};            // empty => console only
  bool disable{false};
};

// Installs the console sink (and a rotating file sink when cfg.file is set).
// Safe to call more than once; later calls replace the sinks.
void init(const LogConfig& cfg = {});

// Named subsystem logger ("story", "world", "turns", ...). Created lazily,
// sharing the sinks installed by init().
std::shared_ptr<spdlog::logger> get(std::string_view name);

// Silences (or restores) every logger created through this module.
void set_enabled(bool enabled);
[[nodiscard]] bool enabled() noexcept;

} // namespace chronicle::logsys
