#pragma once

#include "chronicle/world/TileMap.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::world {

// Owns the tile maps. Maps keep their insertion order and stable addresses.
class World final {
public:
  World() = default;

  World(const World&) = delete;
  World& operator=(const World&) = delete;
  World(World&&) noexcept = default;
  World& operator=(World&&) noexcept = default;

  // Replaces an existing map with the same name.
  TileMap& add_map(TileMap map);

  // Throws MissingDataError for unknown ids.
  [[nodiscard]] const TileMap& get_map(std::string_view id) const;
  [[nodiscard]] const TileMap* find_map(std::string_view id) const noexcept;
  [[nodiscard]] TileMap* find_map(std::string_view id) noexcept;

  [[nodiscard]] std::vector<const TileMap*> all_maps() const;
  [[nodiscard]] std::size_t size() const noexcept { return maps_.size(); }
  [[nodiscard]] bool empty() const noexcept { return maps_.empty(); }

private:
  std::vector<std::unique_ptr<TileMap>> maps_{};
};

} // namespace chronicle::world
