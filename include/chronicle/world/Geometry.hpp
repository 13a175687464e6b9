#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace chronicle::world {

// ----------------------------------------------------------------------------
// Tile coordinates
// ----------------------------------------------------------------------------
struct GridPoint {
  int x{0};
  int y{0};
  std::optional<int> z{};

  constexpr GridPoint() = default;
  constexpr GridPoint(int x_, int y_) : x(x_), y(y_) {}
  constexpr GridPoint(int x_, int y_, std::optional<int> z_) : x(x_), y(y_), z(z_) {}
};

// Planar equality: z is carried through moves but never compared.
[[nodiscard]] constexpr bool operator==(const GridPoint& a, const GridPoint& b) noexcept {
  return a.x == b.x && a.y == b.y;
}

struct MapPosition {
  std::string mapId{};
  GridPoint position{};
};

[[nodiscard]] inline bool operator==(const MapPosition& a, const MapPosition& b) noexcept {
  return a.mapId == b.mapId && a.position == b.position;
}

struct MapPositionHash {
  std::size_t operator()(const MapPosition& p) const noexcept {
    const std::size_t h = std::hash<std::string>{}(p.mapId);
    const std::size_t xy = (static_cast<std::size_t>(static_cast<std::uint32_t>(p.position.x)) << 32)
                         ^ static_cast<std::size_t>(static_cast<std::uint32_t>(p.position.y));
    return h ^ (xy + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2));
  }
};

// ----------------------------------------------------------------------------
// Distances and adjacency
// ----------------------------------------------------------------------------
inline constexpr double kUnreachable = std::numeric_limits<double>::infinity();

[[nodiscard]] constexpr int manhattan(GridPoint a, GridPoint b) noexcept {
  const int dx = a.x > b.x ? a.x - b.x : b.x - a.x;
  const int dy = a.y > b.y ? a.y - b.y : b.y - a.y;
  return dx + dy;
}

[[nodiscard]] inline double euclidean(GridPoint a, GridPoint b) noexcept {
  const double dx = static_cast<double>(a.x - b.x);
  const double dy = static_cast<double>(a.y - b.y);
  return std::sqrt(dx * dx + dy * dy);
}

// Infinite when the positions are on different maps.
[[nodiscard]] inline double distance(const MapPosition& a, const MapPosition& b,
                                     bool use_manhattan = true) noexcept {
  if (a.mapId != b.mapId) return kUnreachable;
  return use_manhattan ? static_cast<double>(manhattan(a.position, b.position))
                       : euclidean(a.position, b.position);
}

[[nodiscard]] constexpr bool adjacent(GridPoint a, GridPoint b, bool allow_diagonal = false) noexcept {
  const int dx = a.x > b.x ? a.x - b.x : b.x - a.x;
  const int dy = a.y > b.y ? a.y - b.y : b.y - a.y;
  if (dx == 0 && dy == 0) return false;
  if (allow_diagonal) return dx <= 1 && dy <= 1;
  return dx + dy == 1;
}

// Fixed visitation order (N, E, S, W); planners rely on it for deterministic ties.
inline constexpr std::array<GridPoint, 4> kCardinalOffsets{{
    {0, -1}, {1, 0}, {0, 1}, {-1, 0},
}};

inline constexpr std::array<GridPoint, 8> kCompassOffsets{{
    {0, -1}, {1, 0}, {0, 1}, {-1, 0},
    {1, -1}, {1, 1}, {-1, 1}, {-1, -1},
}};

} // namespace chronicle::world
