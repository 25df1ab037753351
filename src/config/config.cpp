#include "navcache/config.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace navcache {
namespace {
// Numeric helpers record the first key whose value does not convert in
// `bad` and report it as absent.
bool extract_double(const std::string &text, const std::string &key,
                    double &out, std::string &bad) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = std::stod(m[1].str());
  } catch (const std::exception &) {
    if (bad.empty())
      bad = key;
    return false;
  }
  return true;
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out, std::string &bad) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::exception &) {
    if (bad.empty())
      bad = key;
    return false;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

double clamp_d(double v, double lo, double hi) {
  return std::min(hi, std::max(lo, v));
}

Millis clamp_ms(Millis v, Millis lo, Millis hi) { return std::clamp(v, lo, hi); }

constexpr std::uint64_t kMaxBytes = 1ULL << 40;
constexpr Millis kDay{24LL * 60 * 60 * 1000};
} // namespace

void sanitize(CacheConfig &cfg) {
  const CacheConfig defaults;
  if (cfg.max_volatile_bytes == 0)
    cfg.max_volatile_bytes = defaults.max_volatile_bytes;
  if (cfg.max_durable_bytes == 0)
    cfg.max_durable_bytes = defaults.max_durable_bytes;
  cfg.max_volatile_bytes =
      std::min<std::size_t>(cfg.max_volatile_bytes, kMaxBytes);
  cfg.max_durable_bytes =
      std::min<std::size_t>(cfg.max_durable_bytes, kMaxBytes);
  if (cfg.default_ttl <= Millis{0})
    cfg.default_ttl = defaults.default_ttl;
  cfg.default_ttl = std::min(cfg.default_ttl, 30 * kDay);
  if (cfg.stale_ttl < cfg.default_ttl)
    cfg.stale_ttl = cfg.default_ttl;

  auto &w = cfg.priority_weights;
  w.frequency = clamp_d(w.frequency, 0.0, 1.0);
  w.recency = clamp_d(w.recency, 0.0, 1.0);
  if (w.frequency + w.recency <= 0.0)
    w = defaults.priority_weights;

  cfg.min_hit_rate_for_adaptation =
      clamp_d(cfg.min_hit_rate_for_adaptation, 0.0, 1.0);
  cfg.thrashing_threshold =
      std::max<std::uint64_t>(1, cfg.thrashing_threshold);
}

void sanitize(NavcacheConfig &cfg) {
  sanitize(cfg.cache);

  auto &nav = cfg.navigation;
  nav.stale_threshold = clamp_ms(nav.stale_threshold, Millis{0}, kDay);
  nav.max_cache_lookup_time =
      clamp_ms(nav.max_cache_lookup_time, Millis{1}, Millis{10000});

  auto &r = cfg.refresh;
  r.max_retries = std::clamp<std::uint32_t>(r.max_retries, 1, 100);
  r.initial_retry_delay =
      clamp_ms(r.initial_retry_delay, Millis{1}, Millis{60 * 60 * 1000});
  if (r.max_retry_delay < r.initial_retry_delay)
    r.max_retry_delay = r.initial_retry_delay;
  r.interaction_defer_delay =
      clamp_ms(r.interaction_defer_delay, Millis{0}, Millis{60 * 1000});

  auto &s = cfg.state;
  s.max_states = std::clamp<std::size_t>(s.max_states, 1, 10000);
  if (s.key_prefix.empty())
    s.key_prefix = StateConfig{}.key_prefix;
  s.paint_delay = clamp_ms(s.paint_delay, Millis{0}, Millis{1000});

  auto &st = cfg.storage;
  if (st.data_dir.empty())
    st.data_dir = StorageConfig{}.data_dir;
  st.compaction_threshold = clamp_d(st.compaction_threshold, 0.05, 0.95);
  st.segment_bytes =
      std::clamp<std::size_t>(st.segment_bytes, 64 * 1024, 1ULL << 30);
}

bool parse_config(const std::string &text, NavcacheConfig &cfg,
                  std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  NavcacheConfig next = cfg;
  double d;
  std::uint64_t u;
  std::string s;
  std::string bad;
  bool b;

  auto &c = next.cache;
  if (extract_u64(text, "max_volatile_bytes", u, bad))
    c.max_volatile_bytes = static_cast<std::size_t>(std::min(u, kMaxBytes));
  if (extract_u64(text, "max_durable_bytes", u, bad))
    c.max_durable_bytes = static_cast<std::size_t>(std::min(u, kMaxBytes));
  if (extract_u64(text, "default_ttl_ms", u, bad))
    c.default_ttl = Millis(static_cast<std::int64_t>(std::min(u, kMaxBytes)));
  if (extract_u64(text, "stale_ttl_ms", u, bad))
    c.stale_ttl = Millis(static_cast<std::int64_t>(std::min(u, kMaxBytes)));
  if (extract_bool(text, "enable_persistence", b))
    c.enable_persistence = b;
  if (extract_double(text, "priority_weight_frequency", d, bad))
    c.priority_weights.frequency = d;
  if (extract_double(text, "priority_weight_recency", d, bad))
    c.priority_weights.recency = d;
  if (extract_double(text, "min_hit_rate_for_adaptation", d, bad))
    c.min_hit_rate_for_adaptation = d;
  if (extract_u64(text, "thrashing_threshold", u, bad))
    c.thrashing_threshold = u;

  auto &nav = next.navigation;
  if (extract_u64(text, "stale_threshold_ms", u, bad))
    nav.stale_threshold = Millis(static_cast<std::int64_t>(std::min(u, kMaxBytes)));
  if (extract_bool(text, "enable_background_refresh", b))
    nav.enable_background_refresh = b;
  if (extract_u64(text, "max_cache_lookup_time_ms", u, bad))
    nav.max_cache_lookup_time =
        Millis(static_cast<std::int64_t>(std::min(u, kMaxBytes)));
  if (extract_bool(text, "capture_on_leave", b))
    nav.capture_on_leave = b;

  auto &r = next.refresh;
  if (extract_u64(text, "max_retries", u, bad))
    r.max_retries = static_cast<std::uint32_t>(std::min<std::uint64_t>(u, 100));
  if (extract_u64(text, "initial_retry_delay_ms", u, bad))
    r.initial_retry_delay =
        Millis(static_cast<std::int64_t>(std::min(u, kMaxBytes)));
  if (extract_u64(text, "max_retry_delay_ms", u, bad))
    r.max_retry_delay = Millis(static_cast<std::int64_t>(std::min(u, kMaxBytes)));
  if (extract_u64(text, "interaction_defer_delay_ms", u, bad))
    r.interaction_defer_delay =
        Millis(static_cast<std::int64_t>(std::min(u, kMaxBytes)));
  if (extract_bool(text, "enable_auto_refresh", b))
    r.enable_auto_refresh = b;

  auto &st = next.state;
  if (extract_u64(text, "max_states", u, bad))
    st.max_states = static_cast<std::size_t>(std::min<std::uint64_t>(u, 10000));
  if (extract_bool(text, "persist_states", b))
    st.persist_states = b;
  if (extract_string(text, "state_key_prefix", s))
    st.key_prefix = s;
  if (extract_u64(text, "paint_delay_ms", u, bad))
    st.paint_delay = Millis(static_cast<std::int64_t>(std::min<std::uint64_t>(u, 1000)));

  auto &sto = next.storage;
  if (extract_string(text, "data_dir", s))
    sto.data_dir = s;
  if (extract_string(text, "fsync", s)) {
    if (s == "never")
      sto.fsync = FsyncMode::Never;
    else if (s == "always")
      sto.fsync = FsyncMode::Always;
    else if (s == "everysec")
      sto.fsync = FsyncMode::EverySec;
    else {
      if (err)
        *err = "unknown fsync mode: " + s;
      return false;
    }
  }
  if (extract_double(text, "compaction_threshold", d, bad))
    sto.compaction_threshold = d;
  if (extract_u64(text, "segment_bytes", u, bad))
    sto.segment_bytes = static_cast<std::size_t>(std::min(u, kMaxBytes));

  if (!bad.empty()) {
    if (err)
      *err = "invalid value for " + bad;
    return false;
  }

  sanitize(next);
  cfg = std::move(next);
  return true;
}

bool load_config(const std::string &path, NavcacheConfig &cfg,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

std::string describe(const NavcacheConfig &cfg) {
  std::ostringstream os;
  os << "max_volatile_bytes:" << cfg.cache.max_volatile_bytes << "\n";
  os << "max_durable_bytes:" << cfg.cache.max_durable_bytes << "\n";
  os << "default_ttl_ms:" << cfg.cache.default_ttl.count() << "\n";
  os << "stale_ttl_ms:" << cfg.cache.stale_ttl.count() << "\n";
  os << "enable_persistence:" << (cfg.cache.enable_persistence ? 1 : 0) << "\n";
  os << "priority_weight_frequency:" << cfg.cache.priority_weights.frequency
     << "\n";
  os << "priority_weight_recency:" << cfg.cache.priority_weights.recency
     << "\n";
  os << "stale_threshold_ms:" << cfg.navigation.stale_threshold.count() << "\n";
  os << "max_retries:" << cfg.refresh.max_retries << "\n";
  os << "initial_retry_delay_ms:" << cfg.refresh.initial_retry_delay.count()
     << "\n";
  os << "max_retry_delay_ms:" << cfg.refresh.max_retry_delay.count() << "\n";
  os << "interaction_defer_delay_ms:"
     << cfg.refresh.interaction_defer_delay.count() << "\n";
  os << "max_states:" << cfg.state.max_states << "\n";
  os << "data_dir:" << cfg.storage.data_dir << "\n";
  return os.str();
}

} // namespace navcache
