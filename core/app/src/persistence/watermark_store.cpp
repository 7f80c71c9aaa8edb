#include "trailguard/persistence/watermark_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace trailguard {

namespace {

const char* sideName(domain::PositionSide side) {
  return side == domain::PositionSide::Long ? "LONG" : "SHORT";
}

}  // namespace

WatermarkStore::WatermarkStore(std::string path) : path_(std::move(path)) {}

// -----------------------------------------------------------------------------
// load()
// -----------------------------------------------------------------------------
void WatermarkStore::load() {
  if (path_.empty()) {
    return;
  }

  std::ifstream in(path_);
  if (!in) {
    std::cout << "[WatermarkStore] no watermark file at " << path_
              << "; starting empty.\n";
    return;
  }

  std::unordered_map<std::string, Watermark> loaded;
  try {
    const nlohmann::json root = nlohmann::json::parse(in);
    for (const auto& [ticker, value] : root.items()) {
      Watermark w;
      w.side = value.at("side").get<std::string>() == "SHORT"
                   ? domain::PositionSide::Short
                   : domain::PositionSide::Long;
      w.stop = value.at("stop").get<double>();
      w.extreme = value.value("extreme", 0.0);
      w.updated_ms = value.value("updated_ms", std::int64_t{0});
      loaded.emplace(ticker, w);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("corrupt watermark file " + path_ + ": " +
                             e.what());
  }

  std::lock_guard lock(mutex_);
  entries_ = std::move(loaded);
  std::cout << "[WatermarkStore] loaded " << entries_.size()
            << " watermark(s) from " << path_ << "\n";
}

std::optional<Watermark> WatermarkStore::get(const std::string& ticker) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(ticker);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void WatermarkStore::put(const std::string& ticker,
                         const Watermark& watermark) {
  std::lock_guard lock(mutex_);
  entries_[ticker] = watermark;
  saveLocked();
}

void WatermarkStore::erase(const std::string& ticker) {
  std::lock_guard lock(mutex_);
  if (entries_.erase(ticker) > 0) {
    saveLocked();
  }
}

std::size_t WatermarkStore::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

// -----------------------------------------------------------------------------
// saveLocked(): write temp file, then rename over the real one
// -----------------------------------------------------------------------------
void WatermarkStore::saveLocked() const {
  if (path_.empty()) {
    return;
  }

  nlohmann::json root = nlohmann::json::object();
  for (const auto& [ticker, w] : entries_) {
    root[ticker] = {{"side", sideName(w.side)},
                    {"stop", w.stop},
                    {"extreme", w.extreme},
                    {"updated_ms", w.updated_ms}};
  }

  const std::string tmp_path = path_ + ".tmp";
  std::error_code ec;
  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      std::cerr << "[WatermarkStore] cannot open " << tmp_path
                << " for writing.\n";
      return;
    }
    out << root.dump(2) << "\n";
    if (!out) {
      std::cerr << "[WatermarkStore] write to " << tmp_path << " failed.\n";
      return;
    }
  }

  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::cerr << "[WatermarkStore] rename to " << path_
              << " failed: " << ec.message() << "\n";
  }
}

}  // namespace trailguard
