#include "chronicle/app/CommandLineArgs.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <type_traits>

namespace chronicle::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

// Splits "--opt=value" into name and value; `value` is unset for bare options.
void SplitOption(std::string_view raw, std::string& name, std::optional<std::string_view>& value) {
  const auto eq = raw.find('=');
  if (eq == std::string_view::npos || !raw.starts_with("-")) {
    name = ToLower(raw);
    value.reset();
    return;
  }
  name = ToLower(raw.substr(0, eq));
  value = raw.substr(eq + 1);
}

template <class T>
[[nodiscard]] std::optional<T> ParseNumber(std::string_view s) {
  if (s.empty()) return std::nullopt;
  if (s.front() == '+') s.remove_prefix(1);
  T v{};
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgs(std::span<const std::string_view> argv) {
  CommandLineArgs out;

  for (std::size_t i = 1; i < argv.size(); ++i) {
    const std::string_view raw = argv[i];
    if (raw.empty()) continue;

    std::string arg;
    std::optional<std::string_view> inline_value;
    SplitOption(raw, arg, inline_value);

    // Help
    if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }

    // Simple flags
    if (arg == "--quiet" || arg == "-q") { out.quiet = true; continue; }
    if (arg == "--forever" || arg == "--run-indefinitely") { out.runIndefinitely = true; continue; }
    if (arg == "--bounded") { out.runIndefinitely = false; continue; }

    // Options with values
    const auto takeValue = [&]() -> std::optional<std::string_view> {
      if (inline_value) return inline_value;
      if (i + 1 >= argv.size()) return std::nullopt;
      return argv[++i];
    };

    const auto takeString = [&](std::optional<std::string>& dst) {
      const auto v = takeValue();
      if (!v || v->empty()) {
        out.unknown.emplace_back(raw);
        return;
      }
      dst = std::string(*v);
    };

    const auto takeNumber = [&](auto& dst) {
      using T = typename std::remove_reference_t<decltype(dst)>::value_type;
      const auto v = takeValue();
      const auto parsed = v ? ParseNumber<T>(*v) : std::nullopt;
      if (!parsed) {
        out.unknown.emplace_back(raw);
        return;
      }
      dst = *parsed;
    };

    if (arg == "--config" || arg == "-c") { takeString(out.configPath); continue; }
    if (arg == "--data" || arg == "--data-dir") { takeString(out.dataDir); continue; }
    if (arg == "--log-level") { takeString(out.logLevel); continue; }
    if (arg == "--turns" || arg == "-n") { takeNumber(out.turns); continue; }
    if (arg == "--seed") { takeNumber(out.seed); continue; }

    // Anything else is unknown.
    out.unknown.emplace_back(raw);
  }

  if (out.turns && *out.turns < 0) {
    out.unknown.emplace_back("--turns=" + std::to_string(*out.turns));
    out.turns.reset();
  }
  return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv) {
  std::vector<std::string_view> v;
  v.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
  for (int i = 0; i < argc; ++i) v.emplace_back(argv[i]);
  return ParseCommandLineArgs(std::span<const std::string_view>(v));
}

std::string BuildCommandLineHelpText() {
  std::ostringstream oss;
  oss << "chronicle_run - Command Line Options\n\n";
  oss << "Session\n";
  oss << "  --config, -c <file>      Engine config (default: <data>/config.json)\n";
  oss << "  --data <dir>             Data directory for catalogs, diary and units\n";
  oss << "  --turns, -n <N>          Actions to run this session\n";
  oss << "  --forever / --bounded    Ignore or honour the session turn limit\n";
  oss << "  --seed <N>               RNG seed (0 = clock)\n\n";

  oss << "Output\n";
  oss << "  --log-level <level>      trace|debug|info|warn|error|critical|off\n";
  oss << "  --quiet, -q              Print story lines only\n\n";

  oss << "Misc\n";
  oss << "  --help, -h               Show this help\n\n";

  oss << "Examples\n";
  oss << "  chronicle_run --turns 20 --seed 7\n";
  oss << "  chronicle_run --data ./campaign --log-level=debug\n";
  return oss.str();
}

} // namespace chronicle::app
