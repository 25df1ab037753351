#include "navcache/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace navcache;

TEST_CASE("Config parse applies known keys and clamps values",
          "[config]") {
  NavcacheConfig cfg;
  std::string err;
  REQUIRE(parse_config(R"({
    "max_volatile_bytes": 4096,
    "default_ttl_ms": 600000,
    "stale_ttl_ms": 1000,
    "priority_weight_frequency": 7.5,
    "priority_weight_recency": -2,
    "min_hit_rate_for_adaptation": 3,
    "thrashing_threshold": 0,
    "max_retries": 0,
    "initial_retry_delay_ms": 100,
    "max_retry_delay_ms": 50,
    "data_dir": "/tmp/navcache_cfg",
    "fsync": "always",
    "enable_persistence": false
  })",
                       cfg, &err));
  CHECK(cfg.cache.max_volatile_bytes == 4096);
  CHECK(cfg.cache.default_ttl == Millis{600000});
  CHECK(cfg.cache.stale_ttl == cfg.cache.default_ttl);
  CHECK(cfg.cache.priority_weights.frequency == 1.0);
  CHECK(cfg.cache.priority_weights.recency == 0.0);
  CHECK(cfg.cache.min_hit_rate_for_adaptation == 1.0);
  CHECK(cfg.cache.thrashing_threshold == 1);
  CHECK(cfg.refresh.max_retries == 1);
  CHECK(cfg.refresh.max_retry_delay == cfg.refresh.initial_retry_delay);
  CHECK(cfg.storage.data_dir == "/tmp/navcache_cfg");
  CHECK(cfg.storage.fsync == FsyncMode::Always);
  CHECK_FALSE(cfg.cache.enable_persistence);
}

TEST_CASE("Zero weight sum falls back to defaults", "[config][weights]") {
  CacheConfig c;
  c.priority_weights = {0.0, 0.0};
  sanitize(c);
  CHECK(c.priority_weights.frequency == PriorityWeights{}.frequency);
  CHECK(c.priority_weights.recency == PriorityWeights{}.recency);
}

TEST_CASE("Invalid config is rejected without touching the previous one",
          "[config][atomic]") {
  NavcacheConfig cfg;
  cfg.cache.max_volatile_bytes = 1234;
  std::string err;
  CHECK_FALSE(parse_config("max_volatile_bytes: 1", cfg, &err));
  CHECK(err == "invalid schema");
  CHECK(cfg.cache.max_volatile_bytes == 1234);

  err.clear();
  CHECK_FALSE(
      parse_config(R"({"max_volatile_bytes": 99, "fsync": "sometimes"})", cfg,
                   &err));
  CHECK(err.find("fsync") != std::string::npos);
  CHECK(cfg.cache.max_volatile_bytes == 1234);

  err.clear();
  CHECK_FALSE(load_config("does_not_exist_navcache.json", cfg, &err));
  CHECK(err == "config file not found");
}

TEST_CASE("Out of range numbers are rejected with the key named",
          "[config][atomic]") {
  NavcacheConfig cfg;
  cfg.state.max_states = 7;
  std::string err;
  CHECK_FALSE(parse_config(R"({"max_states": 99999999999999999999999})", cfg,
                           &err));
  CHECK(err == "invalid value for max_states");
  CHECK(cfg.state.max_states == 7);

  err.clear();
  const std::string huge(400, '9');
  CHECK_FALSE(parse_config("{\"compaction_threshold\": " + huge +
                               ", \"max_states\": 12}",
                           cfg, &err));
  CHECK(err == "invalid value for compaction_threshold");
  CHECK(cfg.state.max_states == 7);
}

TEST_CASE("Config file round trip through load_config", "[config][file]") {
  const char *path = "navcache_config_test.json";
  std::ofstream out(path);
  out << R"({"max_states": 3, "paint_delay_ms": 20, "persist_states": true,)"
      << R"( "state_key_prefix": "snap:", "stale_threshold_ms": 60000})";
  out.close();
  NavcacheConfig cfg;
  std::string err;
  REQUIRE(load_config(path, cfg, &err));
  CHECK(cfg.state.max_states == 3);
  CHECK(cfg.state.paint_delay == Millis{20});
  CHECK(cfg.state.persist_states);
  CHECK(cfg.state.key_prefix == "snap:");
  CHECK(cfg.navigation.stale_threshold == Millis{60000});
  const auto text = describe(cfg);
  CHECK(text.find("max_states:3") != std::string::npos);
}
