#include "chronicle/world/World.hpp"
#include "chronicle/core/Errors.hpp"

namespace chronicle::world {

TileMap& World::add_map(TileMap map) {
  for (auto& existing : maps_) {
    if (existing->name() == map.name()) {
      *existing = std::move(map);
      return *existing;
    }
  }
  maps_.push_back(std::make_unique<TileMap>(std::move(map)));
  return *maps_.back();
}

const TileMap& World::get_map(std::string_view id) const {
  const TileMap* m = find_map(id);
  if (!m) throw MissingDataError("Map " + std::string(id) + " not found");
  return *m;
}

const TileMap* World::find_map(std::string_view id) const noexcept {
  for (const auto& m : maps_) {
    if (m->name() == id) return m.get();
  }
  return nullptr;
}

TileMap* World::find_map(std::string_view id) noexcept {
  for (auto& m : maps_) {
    if (m->name() == id) return m.get();
  }
  return nullptr;
}

std::vector<const TileMap*> World::all_maps() const {
  std::vector<const TileMap*> out;
  out.reserve(maps_.size());
  for (const auto& m : maps_) out.push_back(m.get());
  return out;
}

} // namespace chronicle::world
