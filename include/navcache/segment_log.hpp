#pragma once

#include "navcache/config.hpp"
#include "navcache/storage.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace navcache {

struct SegmentLogConfig {
  std::string dir{"./navcache_data"};
  std::size_t max_bytes{100 * 1024 * 1024};
  std::size_t segment_bytes{8 * 1024 * 1024};
  double gc_fragmentation_threshold{0.25};
  FsyncMode fsync{FsyncMode::EverySec};
};

struct SegmentLogStats {
  std::size_t bytes{0};
  std::uint64_t gets{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t puts{0};
  std::uint64_t deletes{0};
  double read_mb{0.0};
  double write_mb{0.0};
  std::uint64_t gc_runs{0};
  std::uint64_t gc_bytes_reclaimed{0};
  std::uint64_t gc_time_ms{0};
  double fragmentation_estimate{0.0};
  std::size_t index_rebuild_ms{0};
  std::uint64_t repaired_tails{0};
};

// Append-only, checksummed segment files plus a manifest. The index is
// rebuilt on init by scanning every segment; a torn or corrupt tail is
// truncated at the last good record.
class SegmentLog final : public IPersistentStorage {
public:
  explicit SegmentLog(SegmentLogConfig cfg);
  ~SegmentLog() override;

  SegmentLog(const SegmentLog &) = delete;
  SegmentLog &operator=(const SegmentLog &) = delete;

  std::string name() const override { return "segment_log"; }
  bool init(std::string *err = nullptr) override;
  std::optional<Blob> get(const std::string &key,
                          std::string *err = nullptr) override;
  bool put(const std::string &key, const Blob &value,
           std::string *err = nullptr) override;
  bool del(const std::string &key, std::string *err = nullptr) override;
  bool clear(std::string *err = nullptr) override;
  bool contains(const std::string &key) const override;
  std::vector<std::string> keys() const override;
  std::size_t bytes_used() const override { return live_bytes_; }

  void maybe_compact() override;

  const SegmentLogStats &stats() const { return stats_; }
  std::size_t size() const;
  std::size_t segment_count() const { return segments_.size(); }
  const SegmentLogConfig &config() const { return cfg_; }

private:
  struct IndexEntry {
    std::uint32_t segment_id{0};
    std::uint64_t offset{0};
    std::uint32_t key_len{0};
    std::uint32_t value_len{0};
    std::uint64_t seq{0};
    bool tombstone{false};
  };

  struct SegmentMeta {
    std::uint32_t id{0};
    std::size_t bytes{0};
  };

  std::string seg_path(std::uint32_t id) const;
  bool append_record(const std::string &key, const Blob &value,
                     bool tombstone, IndexEntry *entry, std::string *err);
  bool write_record(int fd, const std::string &key, const Blob &value,
                    std::uint64_t seq, bool tombstone, std::uint64_t *offset);
  bool sync_for_policy();
  bool load_manifest(std::vector<std::uint32_t> *segments,
                     std::uint32_t *active);
  bool write_manifest();
  bool scan_segment(std::uint32_t id);
  bool read_entry(const IndexEntry &e, Blob *value_out);
  bool open_active(std::string *err);
  bool roll_segment(std::string *err);
  void recompute_live();
  std::uint32_t next_segment_id() const;
  static std::size_t record_size(const IndexEntry &e);
  static std::uint64_t fnv1a(const std::string &s);

  SegmentLogConfig cfg_;
  SegmentLogStats stats_;
  std::unordered_map<std::string, IndexEntry> index_;
  std::vector<SegmentMeta> segments_;
  std::uint32_t active_segment_{1};
  int active_fd_{-1};
  bool ready_{false};
  std::uint64_t next_seq_{1};
  std::uint64_t last_fsync_epoch_s_{0};
  std::size_t live_bytes_{0};
  std::size_t total_segment_bytes_{0};
};

// "segment_log" opens a SegmentLog under cfg.storage.data_dir sized for the
// durable budget; "memory" returns a MemoryStorage. Unknown names yield null.
std::unique_ptr<IPersistentStorage> make_storage_by_name(const std::string &name,
                                                         const NavcacheConfig &cfg);

} // namespace navcache
