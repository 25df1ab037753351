#include "navcache/context.hpp"
#include "navcache/durable_store.hpp"
#include "navcache/log.hpp"
#include "navcache/segment_log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace navcache;

namespace {
long long epoch_ms(TimePoint t) {
  return std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
}

void usage() {
  std::cerr << "usage: navcache_inspect <data_dir> "
               "[stats|keys|get <key>|invalidate <key>|invalidate-tag <tag>|"
               "cleanup-expired]\n";
}

void print_entry(const std::string &key, const CacheEntry &e) {
  std::cout << "key:" << key << "\n";
  std::cout << "size_bytes:" << e.size_bytes << "\n";
  std::cout << "priority:" << e.priority << "\n";
  std::cout << "timestamp_ms:" << epoch_ms(e.timestamp) << "\n";
  std::cout << "expires_at_ms:" << epoch_ms(e.expires_at) << "\n";
  std::cout << "stale:" << (e.stale ? 1 : 0) << "\n";
  std::cout << "source:" << to_string(e.metadata.source) << "\n";
  std::cout << "access_count:" << e.metadata.access_count << "\n";
  if (e.metadata.page_kind)
    std::cout << "page_kind:" << to_string(*e.metadata.page_kind) << "\n";
  if (e.metadata.content_kind)
    std::cout << "content_kind:" << to_string(*e.metadata.content_kind)
              << "\n";
  std::cout << "unsaved:" << (e.metadata.has_unsaved_changes ? 1 : 0) << "\n";
  std::cout << "tags:";
  bool first = true;
  for (const auto &t : e.tags) {
    std::cout << (first ? "" : ",") << t;
    first = false;
  }
  std::cout << "\n";
  const bool printable =
      std::all_of(e.data.begin(), e.data.end(),
                  [](std::uint8_t c) { return std::isprint(c) || c == '\n'; });
  if (printable)
    std::cout << "data:" << std::string(e.data.begin(), e.data.end()) << "\n";
}
} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 2;
  }
  log::init(spdlog::level::warn);

  NavcacheConfig cfg;
  cfg.storage.data_dir = argv[1];
  cfg.cache.max_durable_bytes = std::size_t{1} << 40;
  Context ctx(cfg);

  auto storage = make_storage_by_name("segment_log", ctx.config());
  auto *segments = static_cast<SegmentLog *>(storage.get());
  DurableStore store(ctx, std::move(storage));
  std::string err;
  if (!store.init(&err)) {
    std::cerr << "cannot open " << argv[1] << ": " << err << "\n";
    return 1;
  }

  const std::string cmd = argc > 2 ? argv[2] : "stats";
  if (cmd == "stats") {
    const auto ds = store.stats();
    const auto &ss = segments->stats();
    std::cout << "entries:" << ds.entries << "\n";
    std::cout << "payload_bytes:" << ds.bytes << "\n";
    std::cout << "decode_errors:" << ds.decode_errors << "\n";
    std::cout << "segments:" << segments->segment_count() << "\n";
    std::cout << "live_bytes:" << ss.bytes << "\n";
    std::cout << "fragmentation:" << ss.fragmentation_estimate << "\n";
    std::cout << "repaired_tails:" << ss.repaired_tails << "\n";
    std::cout << "index_rebuild_ms:" << ss.index_rebuild_ms << "\n";
    return 0;
  }
  if (cmd == "keys") {
    for (const auto &k : store.keys())
      std::cout << k << "\n";
    return 0;
  }
  if (argc < 4 && (cmd == "get" || cmd == "invalidate" ||
                   cmd == "invalidate-tag")) {
    usage();
    return 2;
  }
  if (cmd == "get") {
    auto e = store.get(argv[3], true, &err);
    if (!e) {
      std::cerr << (err.empty() ? "not found" : err) << "\n";
      return 1;
    }
    print_entry(argv[3], *e);
    return 0;
  }
  if (cmd == "invalidate") {
    if (!store.contains(argv[3])) {
      std::cout << "removed:0\n";
      return 0;
    }
    if (!store.del(argv[3], &err)) {
      std::cerr << err << "\n";
      return 1;
    }
    std::cout << "removed:1\n";
    return 0;
  }
  if (cmd == "invalidate-tag") {
    const auto n = store.invalidate_by_tags({argv[3]}, &err);
    if (!err.empty()) {
      std::cerr << err << "\n";
      return 1;
    }
    std::cout << "removed:" << n << "\n";
    return 0;
  }
  if (cmd == "cleanup-expired") {
    const auto n = store.cleanup_expired(&err);
    if (!err.empty()) {
      std::cerr << err << "\n";
      return 1;
    }
    segments->maybe_compact();
    std::cout << "removed:" << n << "\n";
    return 0;
  }
  usage();
  return 2;
}
