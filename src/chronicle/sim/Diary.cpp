#include "chronicle/sim/Diary.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"
#include "chronicle/rules/ActionJson.hpp"
#include "chronicle/world/UnitJson.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace chronicle::sim {
using json = nlohmann::json;

namespace {

json change_to_json(const rules::StatChange& c) {
  return json::object({
      {"unitId", c.unitId},
      {"unitName", c.unitName},
      {"propertyName", c.propertyName},
      {"oldValue", world::property_value_to_json(c.oldValue)},
      {"newValue", world::property_value_to_json(c.newValue)},
  });
}

rules::StatChange change_from_json(const json& j) {
  rules::StatChange c{};
  c.unitId = j.value("unitId", std::string{});
  c.unitName = j.value("unitName", std::string{});
  c.propertyName = j.value("propertyName", std::string{});
  if (const auto it = j.find("oldValue"); it != j.end()) c.oldValue = world::property_value_from_json(*it);
  if (const auto it = j.find("newValue"); it != j.end()) c.newValue = world::property_value_from_json(*it);
  return c;
}

} // namespace

std::string utc_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &now);
#else
  gmtime_r(&now, &utc);
#endif
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z", utc);
}

void to_json(json& j, const DiaryEntry& e) {
  json changes = json::array();
  for (const rules::StatChange& c : e.statChanges) changes.push_back(change_to_json(c));

  j = json::object({
      {"turn", e.turn},
      {"timestamp", e.timestamp},
      {"action", e.action},
      {"round", e.round},
      {"turnInRound", e.turnInRound},
      {"turnOrder", e.turnOrder},
      {"actorId", e.actorId},
      {"statChanges", changes},
      {"statChangesSummary", e.statChangesSummary},
  });
}

void from_json(const json& j, DiaryEntry& e) {
  e = DiaryEntry{};
  e.turn = j.value("turn", 0);
  e.timestamp = j.value("timestamp", std::string{});
  if (const auto it = j.find("action"); it != j.end() && it->is_object()) e.action = it->get<rules::Action>();
  e.round = j.value("round", 0);
  e.turnInRound = j.value("turnInRound", 0);
  e.turnOrder = j.value("turnOrder", std::vector<std::string>{});
  e.actorId = j.value("actorId", e.action.player);
  if (const auto it = j.find("statChanges"); it != j.end() && it->is_array()) {
    for (const json& c : *it) e.statChanges.push_back(change_from_json(c));
  }
  e.statChangesSummary = j.value("statChangesSummary", std::vector<std::string>{});
}

const DiaryEntry& Diary::record(const rules::Action& action, const DiaryContext& ctx,
                                std::vector<rules::StatChange> changes) {
  DiaryEntry e{};
  e.turn = ctx.turn;
  e.timestamp = utc_timestamp();
  e.action = action;
  e.round = ctx.round;
  e.turnInRound = ctx.turnInRound;
  e.turnOrder = ctx.turnOrder;
  e.actorId = ctx.actorId.empty() ? action.player : ctx.actorId;
  e.statChangesSummary = rules::summarize(changes);
  e.statChanges = std::move(changes);
  entries_.push_back(std::move(e));
  return entries_.back();
}

const DiaryEntry& Diary::record_system(std::string message, const DiaryContext* ctx, std::string_view type) {
  const DiaryEntry* last = entries_.empty() ? nullptr : &entries_.back();

  DiaryEntry e{};
  e.timestamp = utc_timestamp();
  if (ctx) {
    e.turn = ctx->turn;
    e.round = ctx->round;
    e.turnInRound = ctx->turnInRound;
    e.turnOrder = ctx->turnOrder;
    e.actorId = ctx->actorId;
  } else if (last) {
    e.turn = last->turn;
    e.round = last->round;
    e.turnInRound = last->turnInRound;
    e.turnOrder = last->turnOrder;
  }
  if (e.actorId.empty()) e.actorId = "system";

  e.action.type = std::string(type);
  e.action.player = e.actorId;
  e.action.description = std::move(message);
  e.action.payload.emplace("severity", std::string("error"));

  entries_.push_back(std::move(e));
  return entries_.back();
}

int Diary::last_turn() const noexcept {
  int best = 0;
  for (const DiaryEntry& e : entries_) best = std::max(best, e.turn);
  return best;
}

bool Diary::save(const std::filesystem::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    logsys::get("engine")->error("Diary: failed to open {}", path.string());
    return false;
  }
  out << json(entries_).dump(2) << '\n';
  return static_cast<bool>(out);
}

bool Diary::load(const std::filesystem::path& path) {
  entries_.clear();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return false;

  std::ifstream in(path);
  if (!in.is_open()) throw ConfigError("Could not open " + path.string());

  try {
    const json j = json::parse(in);
    if (!j.is_array()) throw ConfigError(path.string() + ": diary must be an array");
    entries_ = j.get<std::vector<DiaryEntry>>();
  } catch (const json::exception& e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
  return true;
}

} // namespace chronicle::sim
