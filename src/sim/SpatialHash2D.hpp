#pragma once

#include "SimTypes.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace antsim::sim {

// Uniform-grid spatial hash keyed by floor(x / cell), floor(y / cell).
// Buckets only exist while they hold at least one id.
class SpatialHash2D final {
public:
  SpatialHash2D() = default;
  explicit SpatialHash2D(float cell_size) { set_cell_size(cell_size); }

  void set_cell_size(float cell_size) {
    cell_size_ = std::max(0.01f, cell_size);
    inv_cell_size_ = 1.0f / cell_size_;
  }

  [[nodiscard]] float cell_size() const noexcept { return cell_size_; }

  void clear() {
    buckets_.clear();
    size_ = 0;
  }

  void insert(std::uint32_t id, Vec2 p) {
    buckets_[key_of(p)].push_back(id);
    ++size_;
  }

  // Removes `id` from the bucket that covers `p`. Returns false if it was not there.
  bool erase(std::uint32_t id, Vec2 p) {
    const auto it = buckets_.find(key_of(p));
    if (it == buckets_.end()) return false;

    std::vector<std::uint32_t>& ids = it->second;
    const auto pos = std::find(ids.begin(), ids.end(), id);
    if (pos == ids.end()) return false;

    *pos = ids.back();
    ids.pop_back();
    --size_;

    if (ids.empty()) buckets_.erase(it);
    return true;
  }

  // Query ids whose cell may intersect a circle. Caller is expected to distance-check.
  template <class Fn>
  void query_circle_candidates(Vec2 center, float radius, Fn&& fn) const {
    radius = std::max(0.0f, radius);

    const int min_x = world_to_cell(center.x - radius);
    const int max_x = world_to_cell(center.x + radius);
    const int min_y = world_to_cell(center.y - radius);
    const int max_y = world_to_cell(center.y + radius);

    for (int cy = min_y; cy <= max_y; ++cy) {
      for (int cx = min_x; cx <= max_x; ++cx) {
        const auto it = buckets_.find(pack_key(cx, cy));
        if (it == buckets_.end()) continue;
        for (std::uint32_t id : it->second) {
          fn(id);
        }
      }
    }
  }

  template <class Fn>
  void for_each_bucket(Fn&& fn) const {
    for (const auto& [key, ids] : buckets_) {
      fn(key, ids);
    }
  }

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t bucket_count() const noexcept { return buckets_.size(); }

  [[nodiscard]] std::int64_t key_of(Vec2 p) const noexcept {
    return pack_key(world_to_cell(p.x), world_to_cell(p.y));
  }

private:
  [[nodiscard]] int world_to_cell(float v) const noexcept {
    // floor works for negative coordinates too.
    return static_cast<int>(std::floor(v * inv_cell_size_));
  }

  [[nodiscard]] static std::int64_t pack_key(int cx, int cy) noexcept {
    const std::uint64_t ux = static_cast<std::uint32_t>(cx);
    const std::uint64_t uy = static_cast<std::uint32_t>(cy);
    return static_cast<std::int64_t>((ux << 32ULL) | uy);
  }

  float cell_size_{20.0f};
  float inv_cell_size_{0.05f};
  std::size_t size_{0};

  std::unordered_map<std::int64_t, std::vector<std::uint32_t>> buckets_{};
};

} // namespace antsim::sim
