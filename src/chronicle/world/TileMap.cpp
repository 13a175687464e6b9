#include "chronicle/world/TileMap.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace chronicle::world {

namespace {

constexpr std::array<std::pair<Terrain, std::string_view>, 11> kTerrainNames{{
    {Terrain::Plains, "plains"},
    {Terrain::Grass, "grass"},
    {Terrain::Road, "road"},
    {Terrain::Forest, "forest"},
    {Terrain::Sand, "sand"},
    {Terrain::Desert, "desert"},
    {Terrain::Snow, "snow"},
    {Terrain::Swamp, "swamp"},
    {Terrain::Water, "water"},
    {Terrain::Mountain, "mountain"},
    {Terrain::Wall, "wall"},
}};

} // namespace

std::string_view to_string(Terrain t) noexcept {
  for (const auto& [terrain, name] : kTerrainNames) {
    if (terrain == t) return name;
  }
  return "unknown";
}

std::optional<Terrain> terrain_from_string(std::string_view s) noexcept {
  for (const auto& [terrain, name] : kTerrainNames) {
    if (name == s) return terrain;
  }
  return std::nullopt;
}

TileMap::TileMap(std::string name, int width, int height, Terrain fill)
  : name_(std::move(name)),
    width_(std::max(0, width)),
    height_(std::max(0, height)),
    tiles_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), fill) {}

Terrain TileMap::terrain(int x, int y) const noexcept {
  if (!in_bounds(x, y)) return Terrain::Wall;
  return tiles_[index(x, y)];
}

void TileMap::set_terrain(int x, int y, Terrain t) noexcept {
  if (!in_bounds(x, y)) return;
  tiles_[index(x, y)] = t;
}

void TileMap::fill_rect(int x0, int y0, int x1, int y1, Terrain t) noexcept {
  if (x0 > x1) std::swap(x0, x1);
  if (y0 > y1) std::swap(y0, y1);
  x0 = std::max(0, x0);
  y0 = std::max(0, y0);
  x1 = std::min(width_ - 1, x1);
  y1 = std::min(height_ - 1, y1);
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) tiles_[index(x, y)] = t;
  }
}

} // namespace chronicle::world
