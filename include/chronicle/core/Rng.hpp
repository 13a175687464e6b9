#pragma once

#include <cstdint>
#include <span>

namespace chronicle {

// PCG32: small, fast, deterministic RNG shared by every simulation module.
// Reference algorithm: PCG family (O'Neill). This is a minimal implementation.
class Rng final {
public:
  constexpr Rng() = default;

  explicit constexpr Rng(std::uint64_t seed, std::uint64_t sequence = 0xDA3E39CB94B95BDBULL) noexcept {
    seed_rng(seed, sequence);
  }

  constexpr void seed_rng(std::uint64_t seed, std::uint64_t sequence = 0xDA3E39CB94B95BDBULL) noexcept {
    state_ = 0U;
    inc_ = (sequence << 1U) | 1U;
    (void)next_u32();
    state_ += seed;
    (void)next_u32();
  }

  [[nodiscard]] constexpr std::uint32_t next_u32() noexcept {
    const std::uint64_t oldstate = state_;
    state_ = oldstate * 6364136223846793005ULL + inc_;
    const std::uint32_t xorshifted =
        static_cast<std::uint32_t>(((oldstate >> 18U) ^ oldstate) >> 27U);
    const std::uint32_t rot = static_cast<std::uint32_t>(oldstate >> 59U);
    return (xorshifted >> rot) | (xorshifted << ((0U - rot) & 31U));
  }

  // Uniform in [0, bound) without modulo bias.
  [[nodiscard]] constexpr std::uint32_t uniform_u32(std::uint32_t bound) noexcept {
    if (bound == 0U) return 0U;

    const std::uint32_t threshold = static_cast<std::uint32_t>(0U - bound) % bound;
    for (;;) {
      const std::uint32_t r = next_u32();
      if (r >= threshold) return r % bound;
    }
  }

  // Inclusive integer range. Swaps the bounds when lo > hi.
  [[nodiscard]] constexpr int range(int lo, int hi) noexcept {
    if (lo > hi) {
      const int t = lo;
      lo = hi;
      hi = t;
    }
    const auto span = static_cast<std::uint32_t>(static_cast<std::int64_t>(hi) - lo + 1);
    if (span == 0U) return static_cast<int>(next_u32()); // full 32-bit range
    return static_cast<int>(static_cast<std::int64_t>(lo) + uniform_u32(span));
  }

  template <class T>
  [[nodiscard]] const T* pick(std::span<const T> items) noexcept {
    if (items.empty()) return nullptr;
    return &items[uniform_u32(static_cast<std::uint32_t>(items.size()))];
  }

private:
  std::uint64_t state_{0x853C49E6748FEA9BULL};
  std::uint64_t inc_{0xDA3E39CB94B95BDBULL};
};

} // namespace chronicle
