#include <certalign/align/position_cache.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <vector>

namespace certalign::align {

namespace cc = certalign::core;
using json = nlohmann::json;

namespace {

std::string canonical(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return {};
  const auto end = value.find_last_not_of(" \t\r\n");
  std::string out = value.substr(start, end - start + 1);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::uint64_t fnv1a64(const std::string& data) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string short_key(const std::string& key) { return key.substr(0, 8); }

}  // namespace

PositionCache::PositionCache(std::chrono::seconds ttl, NowFn now)
    : ttl_(ttl), now_(now ? std::move(now) : NowFn([] { return CacheClock::now(); })) {}

std::string PositionCache::key_for(const cc::FieldValues& fields) {
  std::string canon;
  for (const auto& [name, value] : fields) {
    canon += canonical(name);
    canon += '=';
    canon += canonical(value);
    canon += '\n';
  }
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(fnv1a64(canon)));
  return std::string(buf);
}

bool PositionCache::expired(const CacheEntry& e, CacheClock::time_point now) const noexcept {
  return now - e.created_at >= e.ttl;
}

std::optional<cc::RenderParameters> PositionCache::get(const cc::FieldValues& fields) {
  const std::string key = key_for(fields);
  const auto now = now_();

  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++counters_.misses;
    spdlog::debug("position cache miss for key {}...", short_key(key));
    return std::nullopt;
  }
  if (expired(it->second, now)) {
    entries_.erase(it);
    ++counters_.expired;
    ++counters_.misses;
    spdlog::debug("position cache entry expired for key {}...", short_key(key));
    return std::nullopt;
  }
  ++counters_.hits;
  spdlog::debug("position cache hit for key {}...", short_key(key));
  return it->second.payload;
}

void PositionCache::set(const cc::FieldValues& fields, cc::RenderParameters payload) {
  CacheEntry entry;
  entry.key = key_for(fields);
  entry.payload = std::move(payload);
  entry.created_at = now_();
  entry.ttl = ttl_;

  std::lock_guard lock(mutex_);
  entries_.insert_or_assign(entry.key, std::move(entry));
}

bool PositionCache::invalidate(const cc::FieldValues& fields) {
  const std::string key = key_for(fields);
  std::lock_guard lock(mutex_);
  if (entries_.erase(key) == 0) return false;
  ++counters_.invalidations;
  return true;
}

std::size_t PositionCache::clear_expired() {
  const auto now = now_();
  std::lock_guard lock(mutex_);
  const std::size_t removed = std::erase_if(
      entries_, [&](const auto& entry) { return expired(entry.second, now); });
  counters_.expired += removed;
  if (removed > 0) spdlog::info("cleared {} expired position cache entries", removed);
  return removed;
}

void PositionCache::clear_all() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

CacheStats PositionCache::stats() const {
  std::lock_guard lock(mutex_);
  CacheStats s = counters_;
  s.size = entries_.size();
  return s;
}

std::expected<void, cc::VerifyError> PositionCache::save(const std::string& path) const {
  std::vector<CacheEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) snapshot.push_back(entry);
  }
  std::sort(snapshot.begin(), snapshot.end(),
            [](const CacheEntry& a, const CacheEntry& b) { return a.key < b.key; });

  json doc;
  doc["version"] = 1;
  doc["entries"] = json::array();
  for (const auto& e : snapshot) {
    json offsets = json::object();
    for (const auto& [field, off] : e.payload.offsets) {
      offsets[field] = {{"dx", off.dx}, {"dy", off.dy}};
    }
    doc["entries"].push_back({
        {"key", e.key},
        {"created_at", std::chrono::duration_cast<std::chrono::seconds>(
                           e.created_at.time_since_epoch()).count()},
        {"ttl_seconds", e.ttl.count()},
        {"offsets", std::move(offsets)},
    });
  }

  std::ofstream f(path);
  if (!f) {
    spdlog::error("could not write position cache to '{}'", path);
    return std::unexpected(cc::VerifyError::IoError);
  }
  f << doc.dump(2) << '\n';
  if (!f) return std::unexpected(cc::VerifyError::IoError);
  spdlog::debug("saved {} position cache entries to '{}'", snapshot.size(), path);
  return {};
}

std::expected<std::size_t, cc::VerifyError> PositionCache::load(const std::string& path) {
  if (!std::filesystem::exists(path)) return 0;

  std::ifstream f(path);
  if (!f) return std::unexpected(cc::VerifyError::IoError);

  std::vector<CacheEntry> loaded;
  try {
    const json doc = json::parse(f);
    for (const auto& j : doc.at("entries")) {
      CacheEntry e;
      e.key = j.at("key").get<std::string>();
      e.created_at = CacheClock::time_point(
          std::chrono::seconds(j.at("created_at").get<std::int64_t>()));
      e.ttl = std::chrono::seconds(j.at("ttl_seconds").get<std::int64_t>());
      for (const auto& [field, off] : j.at("offsets").items()) {
        e.payload.offsets[field] = cc::FieldOffset{off.at("dx").get<double>(),
                                                   off.at("dy").get<double>()};
      }
      loaded.push_back(std::move(e));
    }
  } catch (const json::exception& e) {
    spdlog::warn("could not load position cache '{}': {}", path, e.what());
    return std::unexpected(cc::VerifyError::CorruptData);
  }

  std::lock_guard lock(mutex_);
  for (auto& e : loaded) {
    std::string key = e.key;
    entries_.insert_or_assign(std::move(key), std::move(e));
  }
  spdlog::debug("loaded {} position cache entries from '{}'", loaded.size(), path);
  return loaded.size();
}

}  // namespace certalign::align
