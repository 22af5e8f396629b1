#pragma once

#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/render_parameters.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace certalign::align {

using CacheClock = std::chrono::system_clock;

struct CacheEntry {
  std::string key;
  certalign::core::RenderParameters payload;
  CacheClock::time_point created_at;
  std::chrono::seconds ttl{0};
};

struct CacheStats {
  std::size_t size{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  /// Entries removed because their TTL elapsed.
  std::uint64_t expired{0};
  /// Entries removed because they failed revalidation.
  std::uint64_t invalidations{0};
};

/// Render parameters that previously produced a passing certificate, keyed by the
/// canonicalized field text. A hit is advisory only: the caller must re-render and
/// re-verify before trusting it.
///
/// Thread-safety: all members may be called concurrently; the internal mutex guards
/// only the map and counters.
class PositionCache {
 public:
  using NowFn = std::function<CacheClock::time_point()>;

  /// \param ttl Lifetime of each entry; entries aged >= ttl are misses.
  /// \param now Clock source (injectable for tests); defaults to system_clock::now.
  explicit PositionCache(std::chrono::seconds ttl = std::chrono::hours(24),
                         NowFn now = {});

  PositionCache(const PositionCache&) = delete;
  PositionCache& operator=(const PositionCache&) = delete;

  /// Stable key: FNV-1a 64 (hex) over "name=value" lines of the trimmed, lower-cased
  /// values, in field-name order.
  [[nodiscard]] static std::string key_for(const certalign::core::FieldValues& fields);

  /// Payload for \p fields, or nullopt on miss. Expired entries are removed here.
  [[nodiscard]] std::optional<certalign::core::RenderParameters> get(
      const certalign::core::FieldValues& fields);

  void set(const certalign::core::FieldValues& fields,
           certalign::core::RenderParameters payload);

  /// Drops the entry for \p fields (failed revalidation). Returns true if one existed.
  bool invalidate(const certalign::core::FieldValues& fields);

  /// Removes every expired entry; returns how many were removed.
  std::size_t clear_expired();

  void clear_all();

  [[nodiscard]] CacheStats stats() const;

  [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

  /// Persist all entries as JSON. Returns IoError if the file cannot be written.
  [[nodiscard]] std::expected<void, certalign::core::VerifyError> save(
      const std::string& path) const;

  /// Merge entries from a JSON file written by save(). A missing file is not an error;
  /// a malformed one returns CorruptData and leaves the cache unchanged.
  [[nodiscard]] std::expected<std::size_t, certalign::core::VerifyError> load(
      const std::string& path);

 private:
  [[nodiscard]] bool expired(const CacheEntry& e, CacheClock::time_point now) const noexcept;

  std::chrono::seconds ttl_;
  NowFn now_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CacheEntry> entries_;
  CacheStats counters_;
};

}  // namespace certalign::align
