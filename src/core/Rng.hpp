#pragma once

#include <cstdint>

namespace antsim::core {

// 64-bit mixing (good for turning ids into well-scrambled seeds)
[[nodiscard]] constexpr std::uint64_t mix64(std::uint64_t x) noexcept {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

// PCG32: small, fast, deterministic RNG. Every random decision in the
// simulation goes through one instance so a seed reproduces a whole run.
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
    state_ += mix64(seed);
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

  // Float in [0, 1). Uses 24 high bits for stable precision.
  [[nodiscard]] constexpr float next_float01() noexcept {
    constexpr float inv = 1.0f / 16777216.0f; // 2^24
    return static_cast<float>(next_u32() >> 8) * inv;
  }

  // Float in [lo, hi).
  [[nodiscard]] constexpr float uniform(float lo, float hi) noexcept {
    return lo + (hi - lo) * next_float01();
  }

  // Integer in [lo, hi], both inclusive.
  [[nodiscard]] constexpr int uniform_int(int lo, int hi) noexcept {
    if (hi <= lo) return lo;
    return lo + static_cast<int>(uniform_u32(static_cast<std::uint32_t>(hi - lo) + 1U));
  }

  [[nodiscard]] constexpr bool chance(float p) noexcept {
    return next_float01() < p;
  }

private:
  std::uint64_t state_{0x853C49E6748FEA9BULL};
  std::uint64_t inc_{0xDA3E39CB94B95BDBULL};
};

} // namespace antsim::core
