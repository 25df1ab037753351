#pragma once

#include "navcache/policy.hpp"
#include "navcache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace navcache {

enum class FsyncMode { Never, EverySec, Always };

struct CacheConfig {
  std::size_t max_volatile_bytes{50 * 1024 * 1024};
  std::size_t max_durable_bytes{100 * 1024 * 1024};
  Millis default_ttl{5 * 60 * 1000};
  Millis stale_ttl{30 * 60 * 1000};
  bool enable_persistence{true};
  PriorityWeights priority_weights{};
  double min_hit_rate_for_adaptation{0.3};
  std::uint64_t thrashing_threshold{50};
};

struct NavigationConfig {
  Millis stale_threshold{5 * 60 * 1000};
  bool enable_background_refresh{true};
  Millis max_cache_lookup_time{50};
  bool capture_on_leave{false};
};

struct RefreshConfig {
  std::uint32_t max_retries{3};
  Millis initial_retry_delay{1000};
  Millis max_retry_delay{30000};
  Millis interaction_defer_delay{200};
  bool enable_auto_refresh{true};
};

struct StateConfig {
  std::size_t max_states{10};
  bool persist_states{false};
  std::string key_prefix{"state:"};
  Millis paint_delay{16};
};

struct StorageConfig {
  std::string data_dir{"./navcache_data"};
  FsyncMode fsync{FsyncMode::EverySec};
  double compaction_threshold{0.25};
  std::size_t segment_bytes{8 * 1024 * 1024};
};

struct NavcacheConfig {
  CacheConfig cache;
  NavigationConfig navigation;
  RefreshConfig refresh;
  StateConfig state;
  StorageConfig storage;
};

// Clamps out-of-range values and resets inconsistent ones to defaults.
void sanitize(CacheConfig &cfg);
void sanitize(NavcacheConfig &cfg);

// Reads a flat JSON object and applies the keys it recognizes on top of
// `cfg`. Leaves `cfg` untouched when the file is missing or malformed.
bool load_config(const std::string &path, NavcacheConfig &cfg,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, NavcacheConfig &cfg,
                  std::string *err = nullptr);

std::string describe(const NavcacheConfig &cfg);

} // namespace navcache
