#pragma once

#include "chronicle/world/Geometry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::world {

enum class Terrain : std::uint8_t {
  Plains = 0,
  Grass,
  Road,
  Forest,
  Sand,
  Desert,
  Snow,
  Swamp,
  Water,
  Mountain,
  Wall,
};

[[nodiscard]] constexpr bool is_walkable(Terrain t) noexcept {
  return t != Terrain::Water && t != Terrain::Mountain && t != Terrain::Wall;
}

[[nodiscard]] std::string_view to_string(Terrain t) noexcept;
[[nodiscard]] std::optional<Terrain> terrain_from_string(std::string_view s) noexcept;

// Rectangular grid of terrain. Row-major storage.
class TileMap final {
public:
  TileMap(std::string name, int width, int height, Terrain fill = Terrain::Plains);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] int width() const noexcept { return width_; }
  [[nodiscard]] int height() const noexcept { return height_; }

  [[nodiscard]] bool in_bounds(int x, int y) const noexcept {
    return x >= 0 && y >= 0 && x < width_ && y < height_;
  }
  [[nodiscard]] bool in_bounds(GridPoint p) const noexcept { return in_bounds(p.x, p.y); }

  // Out-of-bounds reads return Wall.
  [[nodiscard]] Terrain terrain(int x, int y) const noexcept;
  void set_terrain(int x, int y, Terrain t) noexcept;
  void fill_rect(int x0, int y0, int x1, int y1, Terrain t) noexcept;

  [[nodiscard]] bool is_walkable(int x, int y) const noexcept {
    return in_bounds(x, y) && world::is_walkable(terrain(x, y));
  }
  [[nodiscard]] bool is_walkable(GridPoint p) const noexcept { return is_walkable(p.x, p.y); }

private:
  [[nodiscard]] std::size_t index(int x, int y) const noexcept {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
  }

  std::string name_{};
  int width_{0};
  int height_{0};
  std::vector<Terrain> tiles_{};
};

} // namespace chronicle::world
