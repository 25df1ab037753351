#include "navcache/segment_log.hpp"

#include "navcache/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unordered_set>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace navcache {
namespace {
#pragma pack(push, 1)
struct RecordHeader {
  std::uint32_t magic;
  std::uint32_t checksum;
  std::uint64_t key_hash;
  std::uint64_t seq;
  std::uint32_t key_len;
  std::uint32_t value_len;
  std::uint8_t tombstone;
  std::uint8_t reserved[7];
};
#pragma pack(pop)

constexpr std::uint32_t kMagic = 0x4e564331; // NVC1

std::uint32_t checksum32(const std::string &key, const Blob &value,
                         const RecordHeader &h) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(RecordHeader); ++i) {
    if (i >= offsetof(RecordHeader, checksum) &&
        i < offsetof(RecordHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (unsigned char c : key)
    mix(c);
  for (auto b : value)
    mix(b);
  return sum;
}

bool fsync_dir(const std::string &dir) {
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  close(dfd);
  return ok;
}

bool write_all(int fd, const void *data, std::size_t len) {
  const auto *p = static_cast<const std::uint8_t *>(data);
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w <= 0)
      return false;
    p += w;
    len -= static_cast<std::size_t>(w);
  }
  return true;
}
} // namespace

SegmentLog::SegmentLog(SegmentLogConfig cfg) : cfg_(std::move(cfg)) {}

SegmentLog::~SegmentLog() {
  if (active_fd_ >= 0)
    close(active_fd_);
}

bool SegmentLog::init(std::string *err) {
  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  if (ec) {
    if (err)
      *err = "cannot create " + cfg_.dir + ": " + ec.message();
    return false;
  }
  std::vector<std::uint32_t> segs;
  std::uint32_t active = 1;
  if (!load_manifest(&segs, &active)) {
    segs = {1};
    active = 1;
  }
  if (std::find(segs.begin(), segs.end(), active) == segs.end())
    segs.push_back(active);

  index_.clear();
  segments_.clear();
  total_segment_bytes_ = 0;
  next_seq_ = 1;
  const auto start = std::chrono::steady_clock::now();
  for (auto s : segs) {
    if (!scan_segment(s)) {
      if (err)
        *err = "segment scan failed: " + seg_path(s);
      return false;
    }
    SegmentMeta sm;
    sm.id = s;
    std::error_code size_ec;
    const auto bytes = std::filesystem::file_size(seg_path(s), size_ec);
    sm.bytes = size_ec ? 0 : static_cast<std::size_t>(bytes);
    segments_.push_back(sm);
    total_segment_bytes_ += sm.bytes;
  }
  active_segment_ = active;
  if (!open_active(err))
    return false;
  recompute_live();
  stats_.fragmentation_estimate =
      total_segment_bytes_ == 0
          ? 0.0
          : 1.0 - static_cast<double>(live_bytes_) /
                      static_cast<double>(total_segment_bytes_);
  stats_.index_rebuild_ms = static_cast<std::size_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
  if (!write_manifest()) {
    if (err)
      *err = "failed to write manifest";
    return false;
  }
  ready_ = true;
  log::storage()->debug("segment log {} ready: {} keys, {} segments, {} ms",
                        cfg_.dir, size(), segments_.size(),
                        stats_.index_rebuild_ms);
  return true;
}

std::optional<Blob> SegmentLog::get(const std::string &key, std::string *err) {
  ++stats_.gets;
  auto it = index_.find(key);
  if (it == index_.end() || it->second.tombstone) {
    ++stats_.misses;
    return std::nullopt;
  }
  Blob out;
  if (!read_entry(it->second, &out)) {
    ++stats_.misses;
    if (err)
      *err = "read failed for " + key;
    return std::nullopt;
  }
  ++stats_.hits;
  return out;
}

bool SegmentLog::put(const std::string &key, const Blob &value,
                     std::string *err) {
  if (!ready_) {
    if (err)
      *err = "segment log not initialized";
    return false;
  }
  IndexEntry ie;
  if (!append_record(key, value, false, &ie, err))
    return false;
  auto it = index_.find(key);
  if (it != index_.end() && !it->second.tombstone)
    live_bytes_ -= record_size(it->second);
  index_[key] = ie;
  live_bytes_ += record_size(ie);
  stats_.bytes = live_bytes_;
  ++stats_.puts;
  return true;
}

bool SegmentLog::del(const std::string &key, std::string *err) {
  if (!ready_) {
    if (err)
      *err = "segment log not initialized";
    return false;
  }
  auto it = index_.find(key);
  if (it == index_.end() || it->second.tombstone)
    return true;
  IndexEntry ie;
  if (!append_record(key, {}, true, &ie, err))
    return false;
  live_bytes_ -= record_size(it->second);
  it->second = ie;
  stats_.bytes = live_bytes_;
  ++stats_.deletes;
  return true;
}

bool SegmentLog::clear(std::string *err) {
  if (active_fd_ >= 0) {
    close(active_fd_);
    active_fd_ = -1;
  }
  std::error_code ec;
  for (const auto &s : segments_)
    std::filesystem::remove(seg_path(s.id), ec);
  index_.clear();
  segments_.clear();
  total_segment_bytes_ = 0;
  live_bytes_ = 0;
  stats_.bytes = 0;
  active_segment_ = 1;
  segments_.push_back({active_segment_, 0});
  if (!open_active(err))
    return false;
  if (!write_manifest()) {
    if (err)
      *err = "failed to write manifest";
    return false;
  }
  return true;
}

bool SegmentLog::contains(const std::string &key) const {
  auto it = index_.find(key);
  return it != index_.end() && !it->second.tombstone;
}

std::vector<std::string> SegmentLog::keys() const {
  std::vector<std::string> out;
  out.reserve(index_.size());
  for (const auto &[k, e] : index_)
    if (!e.tombstone)
      out.push_back(k);
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t SegmentLog::size() const {
  return static_cast<std::size_t>(
      std::count_if(index_.begin(), index_.end(),
                    [](const auto &kv) { return !kv.second.tombstone; }));
}

void SegmentLog::maybe_compact() {
  if (!ready_ || segments_.size() < 2)
    return;
  stats_.fragmentation_estimate =
      total_segment_bytes_ == 0
          ? 0.0
          : 1.0 - static_cast<double>(live_bytes_) /
                      static_cast<double>(total_segment_bytes_);
  if (stats_.fragmentation_estimate < cfg_.gc_fragmentation_threshold)
    return;

  const auto start = std::chrono::steady_clock::now();
  std::unordered_set<std::uint32_t> sealed;
  for (const auto &s : segments_)
    if (s.id != active_segment_)
      sealed.insert(s.id);

  const std::uint32_t compact_id = next_segment_id();
  const std::string compact_path = seg_path(compact_id);
  int fd = open(compact_path.c_str(), O_CREAT | O_RDWR | O_TRUNC | O_APPEND,
                0644);
  if (fd < 0) {
    log::storage()->warn("compaction: cannot open {}", compact_path);
    return;
  }

  std::unordered_map<std::string, IndexEntry> moved;
  for (const auto &[k, e] : index_) {
    if (e.tombstone || !sealed.contains(e.segment_id))
      continue;
    Blob val;
    std::uint64_t off = 0;
    if (!read_entry(e, &val) ||
        !write_record(fd, k, val, e.seq, false, &off)) {
      close(fd);
      std::filesystem::remove(compact_path);
      log::storage()->warn("compaction aborted while copying {}", k);
      return;
    }
    IndexEntry ne = e;
    ne.segment_id = compact_id;
    ne.offset = off;
    moved[k] = ne;
  }
  ::fsync(fd);
  close(fd);

  const std::size_t before = total_segment_bytes_;
  for (auto it = index_.begin(); it != index_.end();) {
    if (it->second.tombstone && sealed.contains(it->second.segment_id))
      it = index_.erase(it);
    else
      ++it;
  }
  for (const auto &[k, e] : moved)
    index_[k] = e;

  std::vector<SegmentMeta> keep;
  for (const auto &s : segments_)
    if (s.id == active_segment_)
      keep.push_back(s);
  std::error_code size_ec;
  const auto compact_bytes = std::filesystem::file_size(compact_path, size_ec);
  keep.push_back({compact_id, size_ec ? 0 : static_cast<std::size_t>(compact_bytes)});
  segments_ = keep;
  if (!write_manifest()) {
    log::storage()->error("compaction: manifest write failed in {}", cfg_.dir);
    return;
  }
  std::error_code ec;
  for (auto id : sealed)
    std::filesystem::remove(seg_path(id), ec);

  total_segment_bytes_ = 0;
  for (const auto &s : segments_)
    total_segment_bytes_ += s.bytes;
  stats_.gc_runs++;
  if (before > total_segment_bytes_)
    stats_.gc_bytes_reclaimed += before - total_segment_bytes_;
  stats_.gc_time_ms += static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
  stats_.fragmentation_estimate =
      total_segment_bytes_ == 0
          ? 0.0
          : 1.0 - static_cast<double>(live_bytes_) /
                      static_cast<double>(total_segment_bytes_);
}

std::string SegmentLog::seg_path(std::uint32_t id) const {
  return cfg_.dir + "/segment_" + std::to_string(id) + ".log";
}

bool SegmentLog::write_record(int fd, const std::string &key, const Blob &value,
                              std::uint64_t seq, bool tombstone,
                              std::uint64_t *offset) {
  RecordHeader h{};
  h.magic = kMagic;
  h.key_hash = fnv1a(key);
  h.seq = seq;
  h.key_len = static_cast<std::uint32_t>(key.size());
  h.value_len = static_cast<std::uint32_t>(value.size());
  h.tombstone = tombstone ? 1 : 0;
  h.checksum = checksum32(key, value, h);

  off_t off = lseek(fd, 0, SEEK_END);
  if (off < 0)
    return false;
  if (!write_all(fd, &h, sizeof(h)))
    return false;
  if (!write_all(fd, key.data(), key.size()))
    return false;
  if (!value.empty() && !write_all(fd, value.data(), value.size()))
    return false;
  if (offset)
    *offset = static_cast<std::uint64_t>(off);
  return true;
}

bool SegmentLog::append_record(const std::string &key, const Blob &value,
                               bool tombstone, IndexEntry *entry,
                               std::string *err) {
  const std::size_t need = sizeof(RecordHeader) + key.size() + value.size();
  if (!tombstone && live_bytes_ + need > cfg_.max_bytes) {
    if (err)
      *err = "durable tier full";
    return false;
  }
  const std::uint64_t seq = next_seq_++;
  std::uint64_t off = 0;
  if (!write_record(active_fd_, key, value, seq, tombstone, &off)) {
    if (err)
      *err = "write failed on " + seg_path(active_segment_);
    return false;
  }
  if (!sync_for_policy()) {
    if (err)
      *err = "fsync failed on " + seg_path(active_segment_);
    return false;
  }

  stats_.write_mb += static_cast<double>(need) / (1024.0 * 1024.0);
  if (entry) {
    entry->segment_id = active_segment_;
    entry->offset = off;
    entry->key_len = static_cast<std::uint32_t>(key.size());
    entry->value_len = static_cast<std::uint32_t>(value.size());
    entry->seq = seq;
    entry->tombstone = tombstone;
  }
  for (auto &s : segments_) {
    if (s.id == active_segment_) {
      s.bytes += need;
      total_segment_bytes_ += need;
      if (s.bytes > cfg_.segment_bytes && !roll_segment(err))
        return false;
      break;
    }
  }
  return true;
}

bool SegmentLog::sync_for_policy() {
  if (cfg_.fsync == FsyncMode::Never)
    return true;
  if (cfg_.fsync == FsyncMode::Always)
    return ::fsync(active_fd_) == 0;
  const auto now_s = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  if (now_s != last_fsync_epoch_s_) {
    last_fsync_epoch_s_ = now_s;
    return ::fsync(active_fd_) == 0;
  }
  return true;
}

bool SegmentLog::load_manifest(std::vector<std::uint32_t> *segments,
                               std::uint32_t *active) {
  std::ifstream in(cfg_.dir + "/manifest.txt");
  if (!in.is_open())
    return false;
  std::string line;
  try {
    while (std::getline(in, line)) {
      if (line.rfind("active=", 0) == 0)
        *active = static_cast<std::uint32_t>(std::stoul(line.substr(7)));
      if (line.rfind("segment=", 0) == 0)
        segments->push_back(
            static_cast<std::uint32_t>(std::stoul(line.substr(8))));
    }
  } catch (const std::exception &e) {
    log::storage()->warn("ignoring unreadable manifest in {}: {}", cfg_.dir,
                         e.what());
    segments->clear();
    return false;
  }
  if (segments->empty())
    segments->push_back(*active);
  return true;
}

bool SegmentLog::write_manifest() {
  const std::string tmp = cfg_.dir + "/manifest.tmp";
  const std::string final = cfg_.dir + "/manifest.txt";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open())
      return false;
    out << "active=" << active_segment_ << "\n";
    for (const auto &s : segments_)
      out << "segment=" << s.id << "\n";
    out.flush();
  }
  int fd = open(tmp.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  bool ok = ::fsync(fd) == 0;
  close(fd);
  if (!ok)
    return false;
  if (std::rename(tmp.c_str(), final.c_str()) != 0)
    return false;
  return fsync_dir(cfg_.dir);
}

bool SegmentLog::scan_segment(std::uint32_t id) {
  const std::string path = seg_path(id);
  int fd = open(path.c_str(), O_CREAT | O_RDWR, 0644);
  if (fd < 0)
    return false;
  off_t off = 0;
  bool torn = false;
  while (true) {
    RecordHeader h{};
    ssize_t r = pread(fd, &h, sizeof(h), off);
    if (r == 0)
      break;
    if (r != static_cast<ssize_t>(sizeof(h)) || h.magic != kMagic) {
      torn = true;
      break;
    }
    std::string key(h.key_len, '\0');
    Blob value(h.value_len);
    if (pread(fd, key.data(), h.key_len, off + static_cast<off_t>(sizeof(h))) !=
        static_cast<ssize_t>(h.key_len)) {
      torn = true;
      break;
    }
    if (h.value_len > 0 &&
        pread(fd, value.data(), h.value_len,
              off + static_cast<off_t>(sizeof(h) + h.key_len)) !=
            static_cast<ssize_t>(h.value_len)) {
      torn = true;
      break;
    }
    if (checksum32(key, value, h) != h.checksum) {
      torn = true;
      break;
    }
    IndexEntry e;
    e.segment_id = id;
    e.offset = static_cast<std::uint64_t>(off);
    e.key_len = h.key_len;
    e.value_len = h.value_len;
    e.seq = h.seq;
    e.tombstone = h.tombstone != 0;
    auto it = index_.find(key);
    if (it == index_.end() || it->second.seq <= e.seq)
      index_[key] = e;
    next_seq_ = std::max(next_seq_, h.seq + 1);
    off += static_cast<off_t>(sizeof(h) + h.key_len + h.value_len);
  }
  if (torn) {
    if (ftruncate(fd, off) != 0) {
      close(fd);
      return false;
    }
    ++stats_.repaired_tails;
    log::storage()->warn("truncated torn tail of {} at offset {}", path,
                         static_cast<long long>(off));
  }
  close(fd);
  return true;
}

bool SegmentLog::read_entry(const IndexEntry &e, Blob *value_out) {
  const std::string path = seg_path(e.segment_id);
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  RecordHeader h{};
  if (pread(fd, &h, sizeof(h), static_cast<off_t>(e.offset)) !=
          static_cast<ssize_t>(sizeof(h)) ||
      h.magic != kMagic) {
    close(fd);
    return false;
  }
  std::string key(h.key_len, '\0');
  if (pread(fd, key.data(), h.key_len,
            static_cast<off_t>(e.offset + sizeof(h))) !=
      static_cast<ssize_t>(h.key_len)) {
    close(fd);
    return false;
  }
  value_out->assign(h.value_len, 0);
  if (h.value_len > 0 &&
      pread(fd, value_out->data(), h.value_len,
            static_cast<off_t>(e.offset + sizeof(h) + h.key_len)) !=
          static_cast<ssize_t>(h.value_len)) {
    close(fd);
    return false;
  }
  close(fd);
  if (checksum32(key, *value_out, h) != h.checksum)
    return false;
  stats_.read_mb +=
      static_cast<double>(h.value_len + sizeof(h)) / (1024.0 * 1024.0);
  return true;
}

bool SegmentLog::open_active(std::string *err) {
  auto p = seg_path(active_segment_);
  active_fd_ = open(p.c_str(), O_CREAT | O_RDWR | O_APPEND, 0644);
  if (active_fd_ < 0) {
    if (err)
      *err = "failed to open active segment " + p;
    return false;
  }
  return true;
}

bool SegmentLog::roll_segment(std::string *err) {
  if (active_fd_ >= 0) {
    ::fsync(active_fd_);
    close(active_fd_);
    active_fd_ = -1;
  }
  active_segment_ = next_segment_id();
  segments_.push_back({active_segment_, 0});
  if (!open_active(err))
    return false;
  if (!write_manifest()) {
    if (err)
      *err = "failed to write manifest";
    return false;
  }
  return true;
}

void SegmentLog::recompute_live() {
  live_bytes_ = 0;
  for (const auto &[_, e] : index_)
    if (!e.tombstone)
      live_bytes_ += record_size(e);
  stats_.bytes = live_bytes_;
}

std::uint32_t SegmentLog::next_segment_id() const {
  std::uint32_t max_id = 0;
  for (const auto &s : segments_)
    max_id = std::max(max_id, s.id);
  return max_id + 1;
}

std::size_t SegmentLog::record_size(const IndexEntry &e) {
  return sizeof(RecordHeader) + e.key_len + e.value_len;
}

std::unique_ptr<IPersistentStorage> make_storage_by_name(const std::string &name,
                                                         const NavcacheConfig &cfg) {
  if (name == "memory")
    return std::make_unique<MemoryStorage>();
  if (name != "segment_log")
    return nullptr;
  SegmentLogConfig sc;
  sc.dir = cfg.storage.data_dir;
  // Record headers, keys and entry metadata on top of the payload budget.
  sc.max_bytes = cfg.cache.max_durable_bytes * 2 + 1024 * 1024;
  sc.segment_bytes = cfg.storage.segment_bytes;
  sc.gc_fragmentation_threshold = cfg.storage.compaction_threshold;
  sc.fsync = cfg.storage.fsync;
  return std::make_unique<SegmentLog>(sc);
}

std::uint64_t SegmentLog::fnv1a(const std::string &s) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

} // namespace navcache
