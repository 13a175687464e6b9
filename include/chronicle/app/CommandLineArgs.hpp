#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::app {

// Parsed command-line arguments for chronicle_run.
//
// Notes:
//   - Option names are case-insensitive; values (paths) are kept verbatim.
//   - Both "--opt value" and "--opt=value" forms are supported.
struct CommandLineArgs {
  bool showHelp{false};                    // --help / -h
  bool quiet{false};                       // --quiet / -q (no log output, story lines only)
  std::optional<bool> runIndefinitely{};   // --forever / --bounded

  std::optional<std::string> configPath{}; // --config <file>
  std::optional<std::string> dataDir{};    // --data <dir>
  std::optional<std::string> logLevel{};   // --log-level <trace|debug|info|warn|error|off>
  std::optional<int> turns{};              // --turns <N>
  std::optional<std::uint64_t> seed{};     // --seed <N>

  // Unknown options and options with bad values, in the order seen.
  std::vector<std::string> unknown{};
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(std::span<const std::string_view> argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace chronicle::app
