#pragma once

#include "trailguard/domain/position.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace trailguard {

// Best stop ever reached for one ticker.
struct Watermark {
  domain::PositionSide side{domain::PositionSide::Long};
  double stop{0.0};
  double extreme{0.0};
  std::int64_t updated_ms{0};
};

// -----------------------------------------------------------------------------
// WatermarkStore - restart-safe memory of trailing stops
// -----------------------------------------------------------------------------
//
// @brief  Persists ticker → {side, stop, extreme} as a JSON object so a
//         restarted monitor never starts from a looser stop than the one it
//         had reached before.
//
// @details
// File format:
//   { "RELIANCE": {"side": "LONG", "stop": 2411.5, "extreme": 2480.0,
//                  "updated_ms": 1718000000000}, ... }
//
// Every put()/erase() rewrites the whole file through a temporary sibling
// and std::filesystem::rename, so a crash mid-write leaves the previous file
// intact. An empty path keeps the store in memory only (tests).
//
// load() treats a missing file as empty and throws std::runtime_error for a
// file that exists but cannot be parsed. Write failures are logged to
// std::cerr and the in-memory value is kept.
//
// Thread model: all methods lock mutex_. In practice only the risk loop
// writes.
// -----------------------------------------------------------------------------
class WatermarkStore {
 public:
  explicit WatermarkStore(std::string path = "");

  WatermarkStore(const WatermarkStore&) = delete;
  WatermarkStore& operator=(const WatermarkStore&) = delete;

  void load();

  std::optional<Watermark> get(const std::string& ticker) const;

  void put(const std::string& ticker, const Watermark& watermark);

  void erase(const std::string& ticker);

  std::size_t size() const;

  const std::string& path() const { return path_; }

 private:
  void saveLocked() const;

  std::string path_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Watermark> entries_;
};

}  // namespace trailguard
