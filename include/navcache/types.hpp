#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace navcache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;
using Payload = std::vector<std::uint8_t>;

enum class EntrySource : std::uint8_t { Network, Durable, Volatile };

enum class PageKind : std::uint8_t {
  Dashboard,
  Profile,
  Timetable,
  Settings,
  PublicProfile,
  Other
};

enum class ContentKind : std::uint8_t { UserGenerated, Personalized, Generic };

std::string to_string(EntrySource source);
std::string to_string(PageKind kind);
std::string to_string(ContentKind kind);
std::optional<PageKind> parse_page_kind(const std::string &text);
std::optional<ContentKind> parse_content_kind(const std::string &text);

struct EntryMetadata {
  TimePoint created_at{};
  TimePoint last_accessed_at{};
  std::uint64_t access_count{0};
  EntrySource source{EntrySource::Network};
  std::optional<PageKind> page_kind;
  std::optional<ContentKind> content_kind;
  bool has_unsaved_changes{false};
};

struct CacheEntry {
  Payload data;
  TimePoint timestamp{};
  TimePoint expires_at{};
  double priority{0.0};
  std::size_t size_bytes{0};
  std::set<std::string> tags;
  bool stale{false};
  EntryMetadata metadata;
};

// Filter, form and custom values captured from UI controls.
using StateValue = std::variant<bool, double, std::string>;
using StateMap = std::map<std::string, StateValue>;

struct ScrollPosition {
  double x{0.0};
  double y{0.0};
  bool operator==(const ScrollPosition &) const = default;
};

struct PageState {
  ScrollPosition scroll;
  StateMap filters;
  std::string search_term;
  std::vector<std::string> expanded_sections;
  std::map<std::string, StateMap> form_data;
  StateMap custom_state;
  bool operator==(const PageState &) const = default;
};

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t evictions{0};
  double hit_rate{0.0};
  std::size_t memory_bytes{0};
  std::size_t entries{0};
  std::size_t stale_entries{0};
  std::uint64_t thrashing_count{0};
};

bool is_expired(const CacheEntry &entry, TimePoint now);
bool is_stale(const CacheEntry &entry, Millis stale_ttl, TimePoint now);
std::size_t approximate_size(const Payload &data);

inline std::string page_key(const std::string &route) { return "page:" + route; }
// Route part of a page key, empty for any other key.
inline std::string route_of_key(const std::string &key) {
  return key.starts_with("page:") ? key.substr(5) : std::string{};
}

} // namespace navcache
