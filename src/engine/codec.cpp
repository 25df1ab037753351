#include "navcache/codec.hpp"

#include <cstring>

namespace navcache {
namespace {
constexpr std::uint32_t kEntryMagic = 0x4e564345; // NVCE
constexpr std::uint32_t kStateMagic = 0x4e565354; // NVST
// Version 2 stores time points in clock ticks, version 1 in milliseconds.
constexpr std::uint8_t kVersion = 2;
constexpr std::uint8_t kMillisVersion = 1;

enum : std::uint8_t { kNone = 0, kBool = 1, kDouble = 2, kString = 3 };

class Writer {
public:
  explicit Writer(Blob &out) : out_(out) {}

  void u8(std::uint8_t v) { out_.push_back(v); }
  void u32(std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
      out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  void u64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i)
      out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }
  void f64(double v) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    u64(bits);
  }
  void str(const std::string &s) {
    u32(static_cast<std::uint32_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
  }
  void bytes(const Blob &b) {
    u32(static_cast<std::uint32_t>(b.size()));
    out_.insert(out_.end(), b.begin(), b.end());
  }
  void time(TimePoint t) { i64(t.time_since_epoch().count()); }
  void value(const StateValue &v) {
    if (const auto *b = std::get_if<bool>(&v)) {
      u8(kBool);
      u8(*b ? 1 : 0);
    } else if (const auto *d = std::get_if<double>(&v)) {
      u8(kDouble);
      f64(*d);
    } else {
      u8(kString);
      str(std::get<std::string>(v));
    }
  }
  void map(const StateMap &m) {
    u32(static_cast<std::uint32_t>(m.size()));
    for (const auto &[k, v] : m) {
      str(k);
      value(v);
    }
  }

private:
  Blob &out_;
};

class Reader {
public:
  explicit Reader(const Blob &in) : in_(in) {}

  bool ok() const { return ok_; }
  void use_millis() { millis_ = true; }
  bool done() const { return pos_ == in_.size(); }

  std::uint8_t u8() {
    if (!need(1))
      return 0;
    return in_[pos_++];
  }
  std::uint32_t u32() {
    if (!need(4))
      return 0;
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
      v |= static_cast<std::uint32_t>(in_[pos_++]) << (8 * i);
    return v;
  }
  std::uint64_t u64() {
    if (!need(8))
      return 0;
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
      v |= static_cast<std::uint64_t>(in_[pos_++]) << (8 * i);
    return v;
  }
  std::int64_t i64() { return static_cast<std::int64_t>(u64()); }
  double f64() {
    const std::uint64_t bits = u64();
    double v = 0.0;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
  }
  std::string str() {
    const auto n = u32();
    if (!need(n))
      return {};
    std::string s(in_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  in_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return s;
  }
  Blob bytes() {
    const auto n = u32();
    if (!need(n))
      return {};
    Blob b(in_.begin() + static_cast<std::ptrdiff_t>(pos_),
           in_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return b;
  }
  TimePoint time() {
    const auto v = i64();
    if (millis_)
      return TimePoint(std::chrono::duration_cast<Clock::duration>(Millis(v)));
    return TimePoint(Clock::duration(v));
  }
  StateValue value() {
    switch (u8()) {
    case kBool:
      return StateValue(u8() != 0);
    case kDouble:
      return StateValue(f64());
    case kString:
      return StateValue(str());
    default:
      ok_ = false;
      return StateValue(false);
    }
  }
  StateMap map() {
    StateMap m;
    const auto n = u32();
    for (std::uint32_t i = 0; i < n && ok_; ++i) {
      auto k = str();
      m[k] = value();
    }
    return m;
  }

private:
  bool need(std::size_t n) {
    if (!ok_ || in_.size() - pos_ < n) {
      ok_ = false;
      return false;
    }
    return true;
  }

  const Blob &in_;
  std::size_t pos_{0};
  bool ok_{true};
  bool millis_{false};
};

bool check_header(Reader &r, std::uint32_t magic, std::string *err) {
  if (r.u32() != magic || !r.ok()) {
    if (err)
      *err = "bad magic";
    return false;
  }
  const auto version = r.u8();
  if (version == kMillisVersion) {
    r.use_millis();
    return true;
  }
  if (version != kVersion) {
    if (err)
      *err = "unsupported version " + std::to_string(version);
    return false;
  }
  return true;
}
} // namespace

Blob encode_entry(const CacheEntry &entry) {
  Blob out;
  out.reserve(64 + entry.data.size());
  Writer w(out);
  w.u32(kEntryMagic);
  w.u8(kVersion);
  w.bytes(entry.data);
  w.time(entry.timestamp);
  w.time(entry.expires_at);
  w.f64(entry.priority);
  w.u64(entry.size_bytes);
  w.u32(static_cast<std::uint32_t>(entry.tags.size()));
  for (const auto &t : entry.tags)
    w.str(t);
  w.u8(entry.stale ? 1 : 0);
  const auto &m = entry.metadata;
  w.time(m.created_at);
  w.time(m.last_accessed_at);
  w.u64(m.access_count);
  w.u8(static_cast<std::uint8_t>(m.source));
  w.u8(m.page_kind ? static_cast<std::uint8_t>(*m.page_kind) + 1 : 0);
  w.u8(m.content_kind ? static_cast<std::uint8_t>(*m.content_kind) + 1 : 0);
  w.u8(m.has_unsaved_changes ? 1 : 0);
  return out;
}

bool decode_entry(const Blob &blob, CacheEntry *out, std::string *err) {
  Reader r(blob);
  if (!check_header(r, kEntryMagic, err))
    return false;
  CacheEntry e;
  e.data = r.bytes();
  e.timestamp = r.time();
  e.expires_at = r.time();
  e.priority = r.f64();
  e.size_bytes = static_cast<std::size_t>(r.u64());
  const auto ntags = r.u32();
  for (std::uint32_t i = 0; i < ntags && r.ok(); ++i)
    e.tags.insert(r.str());
  e.stale = r.u8() != 0;
  e.metadata.created_at = r.time();
  e.metadata.last_accessed_at = r.time();
  e.metadata.access_count = r.u64();
  const auto source = r.u8();
  const auto page = r.u8();
  const auto content = r.u8();
  e.metadata.has_unsaved_changes = r.u8() != 0;
  if (!r.ok() || !r.done()) {
    if (err)
      *err = "truncated entry";
    return false;
  }
  if (source > static_cast<std::uint8_t>(EntrySource::Volatile) ||
      page > static_cast<std::uint8_t>(PageKind::Other) + 1 ||
      content > static_cast<std::uint8_t>(ContentKind::Generic) + 1) {
    if (err)
      *err = "enum out of range";
    return false;
  }
  e.metadata.source = static_cast<EntrySource>(source);
  if (page)
    e.metadata.page_kind = static_cast<PageKind>(page - 1);
  if (content)
    e.metadata.content_kind = static_cast<ContentKind>(content - 1);
  *out = std::move(e);
  return true;
}

Blob encode_state(const PageState &state) {
  Blob out;
  Writer w(out);
  w.u32(kStateMagic);
  w.u8(kVersion);
  w.f64(state.scroll.x);
  w.f64(state.scroll.y);
  w.map(state.filters);
  w.str(state.search_term);
  w.u32(static_cast<std::uint32_t>(state.expanded_sections.size()));
  for (const auto &s : state.expanded_sections)
    w.str(s);
  w.u32(static_cast<std::uint32_t>(state.form_data.size()));
  for (const auto &[form, fields] : state.form_data) {
    w.str(form);
    w.map(fields);
  }
  w.map(state.custom_state);
  return out;
}

bool decode_state(const Blob &blob, PageState *out, std::string *err) {
  Reader r(blob);
  if (!check_header(r, kStateMagic, err))
    return false;
  PageState s;
  s.scroll.x = r.f64();
  s.scroll.y = r.f64();
  s.filters = r.map();
  s.search_term = r.str();
  const auto nsections = r.u32();
  for (std::uint32_t i = 0; i < nsections && r.ok(); ++i)
    s.expanded_sections.push_back(r.str());
  const auto nforms = r.u32();
  for (std::uint32_t i = 0; i < nforms && r.ok(); ++i) {
    auto form = r.str();
    s.form_data[form] = r.map();
  }
  s.custom_state = r.map();
  if (!r.ok() || !r.done()) {
    if (err)
      *err = "truncated state";
    return false;
  }
  *out = std::move(s);
  return true;
}

} // namespace navcache
