#pragma once

#include "chronicle/rules/Action.hpp"
#include "chronicle/rules/StatTracker.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace chronicle::sim {

inline constexpr std::string_view kSystemErrorType = "system_error";

struct DiaryEntry {
  int turn{0};
  std::string timestamp{};   // ISO-8601, UTC
  rules::Action action{};
  int round{0};
  int turnInRound{0};
  std::vector<std::string> turnOrder{};
  std::string actorId{};
  std::vector<rules::StatChange> statChanges{};
  std::vector<std::string> statChangesSummary{};
};

struct DiaryContext {
  int turn{0};
  int round{0};
  int turnInRound{0};
  std::vector<std::string> turnOrder{};
  std::string actorId{};
};

void to_json(nlohmann::json& j, const DiaryEntry& e);
void from_json(const nlohmann::json& j, DiaryEntry& e);

// In-memory campaign log. Written to disk only by save().
class Diary final {
public:
  const DiaryEntry& record(const rules::Action& action, const DiaryContext& ctx,
                           std::vector<rules::StatChange> changes);

  // Logs a failure as a "system_error" entry. Missing context falls back to
  // the previous entry; the actor defaults to "system".
  const DiaryEntry& record_system(std::string message, const DiaryContext* ctx = nullptr,
                                  std::string_view type = kSystemErrorType);

  [[nodiscard]] const std::vector<DiaryEntry>& entries() const noexcept { return entries_; }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  // Highest recorded turn, 0 when empty.
  [[nodiscard]] int last_turn() const noexcept;

  bool save(const std::filesystem::path& path) const;

  // Missing file => empty diary (returns false). Throws ConfigError when malformed.
  bool load(const std::filesystem::path& path);

  void clear() noexcept { entries_.clear(); }

private:
  std::vector<DiaryEntry> entries_{};
};

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string utc_timestamp();

} // namespace chronicle::sim
