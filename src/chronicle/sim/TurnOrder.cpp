#include "chronicle/sim/TurnOrder.hpp"
#include "chronicle/core/Log.hpp"

#include <algorithm>
#include <cstdint>
#include <unordered_set>

namespace chronicle::sim {

namespace {

struct Ranked {
  const world::Unit* unit{nullptr};
  double experience{0.0};
  std::uint32_t key{0};
};

std::vector<std::string> rank(std::vector<const world::Unit*> units, Rng& rng) {
  std::vector<Ranked> ranked;
  ranked.reserve(units.size());
  for (const world::Unit* u : units) {
    ranked.push_back(Ranked{u, u->number(world::prop::kExperience).value_or(0.0), rng.next_u32()});
  }

  std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
    if (a.experience != b.experience) return a.experience > b.experience;
    if (a.key != b.key) return a.key < b.key;
    if (a.unit->name() != b.unit->name()) return a.unit->name() < b.unit->name();
    return a.unit->id() < b.unit->id();
  });

  std::vector<std::string> ids;
  ids.reserve(ranked.size());
  for (const Ranked& r : ranked) ids.push_back(r.unit->id());
  return ids;
}

} // namespace

std::vector<std::string> build_turn_order(world::UnitList units, Rng& rng) {
  std::vector<const world::Unit*> alive;
  for (const world::Unit* u : units) {
    if (u && world::is_alive(*u)) alive.push_back(u);
  }
  return rank(std::move(alive), rng);
}

const std::vector<std::string>& TurnOrder::refresh(world::UnitList units, Rng& rng) {
  if (order_.empty()) {
    order_ = build_turn_order(units, rng);
    logsys::get("turns")->info("Turn order established with {} units", order_.size());
    return order_;
  }

  std::unordered_set<std::string> alive;
  for (const world::Unit* u : units) {
    if (u && world::is_alive(*u)) alive.insert(u->id());
  }

  const auto before = order_.size();
  order_.erase(std::remove_if(order_.begin(), order_.end(),
                              [&](const std::string& id) { return alive.count(id) == 0; }),
               order_.end());
  if (order_.size() != before) {
    logsys::get("turns")->info("Removed {} unavailable units from the turn order", before - order_.size());
  }

  const std::unordered_set<std::string> known(order_.begin(), order_.end());
  std::vector<const world::Unit*> newcomers;
  for (const world::Unit* u : units) {
    if (u && alive.count(u->id()) != 0 && known.count(u->id()) == 0) newcomers.push_back(u);
  }

  for (std::string& id : rank(std::move(newcomers), rng)) {
    logsys::get("turns")->info("{} joins the end of the turn order", id);
    order_.push_back(std::move(id));
  }
  return order_;
}

} // namespace chronicle::sim
