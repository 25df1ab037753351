#include "navcache/codec.hpp"
#include "navcache/durable_store.hpp"
#include "navcache/segment_log.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace navcache;
using navcache::testing::bytes;
using navcache::testing::fresh_dir;
using navcache::testing::ManualClock;

namespace {
CacheEntry make_entry(const ManualClock &clock, const Payload &data,
                      Millis ttl = std::chrono::minutes(5)) {
  CacheEntry e;
  e.data = data;
  e.size_bytes = data.size();
  e.timestamp = clock.now;
  e.expires_at = clock.now + ttl;
  e.priority = 10.0;
  e.tags = {"page:profile", "route:/me"};
  e.metadata.created_at = clock.now;
  e.metadata.last_accessed_at = clock.now;
  e.metadata.page_kind = PageKind::Profile;
  e.metadata.content_kind = ContentKind::Personalized;
  return e;
}

SegmentLogConfig log_config(const std::string &dir) {
  SegmentLogConfig c;
  c.dir = dir;
  c.fsync = FsyncMode::Never;
  return c;
}
} // namespace

TEST_CASE("Segment log put, get, delete and reopen", "[segment_log]") {
  const auto dir = fresh_dir("segment_basic");
  {
    SegmentLog log(log_config(dir));
    std::string err;
    REQUIRE(log.init(&err));
    REQUIRE(log.put("a", bytes("alpha"), &err));
    REQUIRE(log.put("b", bytes("beta"), &err));
    REQUIRE(log.put("a", bytes("alpha-2"), &err));
    REQUIRE(log.del("b", &err));
    CHECK(log.get("a") == bytes("alpha-2"));
    CHECK_FALSE(log.get("b").has_value());
    CHECK(log.keys() == std::vector<std::string>{"a"});
  }
  SegmentLog reopened(log_config(dir));
  REQUIRE(reopened.init());
  CHECK(reopened.get("a") == bytes("alpha-2"));
  CHECK_FALSE(reopened.contains("b"));
  CHECK(reopened.size() == 1);
}

TEST_CASE("Torn tail is truncated on recovery", "[segment_log][recovery]") {
  const auto dir = fresh_dir("segment_torn");
  {
    SegmentLog log(log_config(dir));
    REQUIRE(log.init());
    REQUIRE(log.put("page:/a", bytes("one")));
    REQUIRE(log.put("page:/b", bytes("two")));
  }
  const auto seg = dir + "/segment_1.log";
  const auto good_size = std::filesystem::file_size(seg);
  {
    std::ofstream out(seg, std::ios::binary | std::ios::app);
    out << "NVC1-garbage-that-is-not-a-record";
  }
  SegmentLog log(log_config(dir));
  REQUIRE(log.init());
  CHECK(log.stats().repaired_tails == 1);
  CHECK(std::filesystem::file_size(seg) == good_size);
  CHECK(log.get("page:/a") == bytes("one"));
  CHECK(log.get("page:/b") == bytes("two"));
  REQUIRE(log.put("page:/c", bytes("three")));
  CHECK(log.get("page:/c") == bytes("three"));
}

TEST_CASE("Compaction keeps every live record", "[segment_log][compaction]") {
  const auto dir = fresh_dir("segment_compact");
  auto cfg = log_config(dir);
  cfg.segment_bytes = 512;
  cfg.gc_fragmentation_threshold = 0.3;
  {
    SegmentLog log(cfg);
    REQUIRE(log.init());
    for (int round = 0; round < 10; ++round)
      for (int k = 0; k < 8; ++k)
        REQUIRE(log.put("k" + std::to_string(k),
                        bytes("v" + std::to_string(round) + "-" +
                              std::to_string(k))));
    REQUIRE(log.del("k7"));
    REQUIRE(log.segment_count() > 2);
    log.maybe_compact();
    CHECK(log.stats().gc_runs == 1);
    CHECK(log.segment_count() <= 2);
    for (int k = 0; k < 7; ++k)
      CHECK(log.get("k" + std::to_string(k)) ==
            bytes("v9-" + std::to_string(k)));
    CHECK_FALSE(log.contains("k7"));
  }
  SegmentLog reopened(cfg);
  REQUIRE(reopened.init());
  CHECK(reopened.size() == 7);
  CHECK(reopened.get("k3") == bytes("v9-3"));
  CHECK_FALSE(reopened.contains("k7"));
}

TEST_CASE("Segment log rejects writes past its byte budget",
          "[segment_log][budget]") {
  auto cfg = log_config(fresh_dir("segment_budget"));
  cfg.max_bytes = 256;
  SegmentLog log(cfg);
  REQUIRE(log.init());
  std::string err;
  CHECK(log.put("small", Payload(64, 1), &err));
  CHECK_FALSE(log.put("big", Payload(512, 2), &err));
  CHECK(err == "durable tier full");
}

TEST_CASE("Entry codec rejects corrupt blobs", "[codec]") {
  ManualClock clock;
  auto blob = encode_entry(make_entry(clock, bytes("payload")));
  CacheEntry out;
  std::string err;
  REQUIRE(decode_entry(blob, &out, &err));
  CHECK(out.data == bytes("payload"));
  CHECK(out.metadata.page_kind == PageKind::Profile);
  CHECK(out.tags.contains("route:/me"));

  auto truncated = blob;
  truncated.resize(blob.size() / 2);
  CHECK_FALSE(decode_entry(truncated, &out, &err));
  CHECK(err == "truncated entry");

  auto bad_magic = blob;
  bad_magic[0] ^= 0xff;
  CHECK_FALSE(decode_entry(bad_magic, &out, &err));
  CHECK(err == "bad magic");
}

TEST_CASE("Entry codec keeps sub-millisecond access times", "[codec]") {
  ManualClock clock;
  auto entry = make_entry(clock, bytes("payload"));
  entry.metadata.last_accessed_at += std::chrono::microseconds(250);
  CacheEntry out;
  std::string err;
  REQUIRE(decode_entry(encode_entry(entry), &out, &err));
  CHECK(out.metadata.last_accessed_at == entry.metadata.last_accessed_at);
  CHECK(out.timestamp == entry.timestamp);

  // Version 1 blobs carry whole milliseconds.
  CacheEntry legacy = entry;
  legacy.timestamp = TimePoint(Clock::duration(1'700'000'000));
  auto blob = encode_entry(legacy);
  blob[4] = 1;
  REQUIRE(decode_entry(blob, &out, &err));
  CHECK(out.timestamp == TimePoint(Millis(1'700'000'000)));
}

TEST_CASE("Durable store survives restart", "[durable][recovery]") {
  ManualClock clock;
  NavcacheConfig cfg;
  cfg.storage.data_dir = fresh_dir("durable_restart");
  Context ctx(cfg, clock.fn());
  {
    DurableStore store(ctx, std::make_unique<SegmentLog>(
                                log_config(cfg.storage.data_dir)));
    REQUIRE(store.init());
    REQUIRE(store.set("page:/me", make_entry(clock, bytes("profile"))));
    REQUIRE(store.set("page:/settings", make_entry(clock, bytes("settings"))));
    REQUIRE(store.del("page:/settings"));
  }
  DurableStore store(ctx, std::make_unique<SegmentLog>(
                              log_config(cfg.storage.data_dir)));
  REQUIRE(store.init());
  CHECK(store.keys() == std::vector<std::string>{"page:/me"});
  CHECK(store.size_bytes() == 7);
  auto e = store.get("page:/me");
  REQUIRE(e.has_value());
  CHECK(e->data == bytes("profile"));
  CHECK(e->metadata.access_count == 1);
  CHECK(store.keys_for_tag("page:profile") ==
        std::vector<std::string>{"page:/me"});
}

TEST_CASE("Durable budget evicts by priority and spares unsaved entries",
          "[durable][eviction]") {
  ManualClock clock;
  NavcacheConfig cfg;
  cfg.cache.max_durable_bytes = 1000;
  Context ctx(cfg, clock.fn());
  DurableStore store(ctx, std::make_unique<MemoryStorage>());
  REQUIRE(store.init());

  auto draft = make_entry(clock, Payload(300, 1));
  draft.metadata.has_unsaved_changes = true;
  REQUIRE(store.set("draft", draft));
  clock.advance(Millis{1});
  REQUIRE(store.set("b", make_entry(clock, Payload(300, 2))));
  clock.advance(Millis{1});
  REQUIRE(store.set("c", make_entry(clock, Payload(300, 3))));
  clock.advance(Millis{1});
  REQUIRE(store.set("d", make_entry(clock, Payload(300, 4))));

  CHECK(store.contains("draft"));
  CHECK_FALSE(store.contains("b"));
  CHECK(store.contains("c"));
  CHECK(store.contains("d"));
  CHECK(store.size_bytes() <= 1000);
  CHECK(store.stats().evictions == 1);

  std::string err;
  CHECK_FALSE(store.set("huge", make_entry(clock, Payload(2000, 5)), &err));
  CHECK(err == "entry exceeds durable budget");
}

TEST_CASE("Expired durable entries stay until cleanup", "[durable][expiry]") {
  ManualClock clock;
  Context ctx({}, clock.fn());
  DurableStore store(ctx, std::make_unique<MemoryStorage>());
  REQUIRE(store.init());
  REQUIRE(store.set("page:/old", make_entry(clock, bytes("x"), Millis{100})));
  clock.advance(Millis{200});

  CHECK_FALSE(store.get("page:/old").has_value());
  CHECK(store.get("page:/old", true).has_value());
  CHECK(store.cleanup_expired() == 1);
  CHECK_FALSE(store.contains("page:/old"));
}

TEST_CASE("Undecodable durable blobs are dropped on init",
          "[durable][corruption]") {
  ManualClock clock;
  Context ctx({}, clock.fn());
  auto mem = std::make_unique<MemoryStorage>();
  REQUIRE(mem->put("page:/bad", bytes("not an entry")));
  REQUIRE(mem->put("page:/good", encode_entry(make_entry(clock, bytes("ok")))));
  DurableStore store(ctx, std::move(mem));
  REQUIRE(store.init());
  CHECK(store.stats().decode_errors == 1);
  CHECK(store.keys() == std::vector<std::string>{"page:/good"});
  CHECK_FALSE(store.storage().contains("page:/bad"));
}

TEST_CASE("Durable operations fail cleanly before init", "[durable][errors]") {
  ManualClock clock;
  Context ctx({}, clock.fn());
  DurableStore store(ctx, std::make_unique<MemoryStorage>());
  std::string err;
  CHECK_FALSE(store.get("k", false, &err).has_value());
  CHECK(err == "durable tier not initialized");
  CHECK_FALSE(store.set("k", make_entry(clock, bytes("v")), &err));
}
