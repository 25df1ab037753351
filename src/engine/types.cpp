#include "navcache/types.hpp"

namespace navcache {

std::string to_string(EntrySource source) {
  switch (source) {
  case EntrySource::Network:
    return "network";
  case EntrySource::Durable:
    return "durable";
  case EntrySource::Volatile:
    return "volatile";
  }
  return "network";
}

std::string to_string(PageKind kind) {
  switch (kind) {
  case PageKind::Dashboard:
    return "dashboard";
  case PageKind::Profile:
    return "profile";
  case PageKind::Timetable:
    return "timetable";
  case PageKind::Settings:
    return "settings";
  case PageKind::PublicProfile:
    return "public-profile";
  case PageKind::Other:
    break;
  }
  return "other";
}

std::string to_string(ContentKind kind) {
  switch (kind) {
  case ContentKind::UserGenerated:
    return "user-generated";
  case ContentKind::Personalized:
    return "personalized";
  case ContentKind::Generic:
    break;
  }
  return "generic";
}

std::optional<PageKind> parse_page_kind(const std::string &text) {
  if (text == "dashboard")
    return PageKind::Dashboard;
  if (text == "profile")
    return PageKind::Profile;
  if (text == "timetable")
    return PageKind::Timetable;
  if (text == "settings")
    return PageKind::Settings;
  if (text == "public-profile")
    return PageKind::PublicProfile;
  if (text == "other")
    return PageKind::Other;
  return std::nullopt;
}

std::optional<ContentKind> parse_content_kind(const std::string &text) {
  if (text == "user-generated")
    return ContentKind::UserGenerated;
  if (text == "personalized")
    return ContentKind::Personalized;
  if (text == "generic")
    return ContentKind::Generic;
  return std::nullopt;
}

bool is_expired(const CacheEntry &entry, TimePoint now) {
  return entry.expires_at <= now;
}

bool is_stale(const CacheEntry &entry, Millis stale_ttl, TimePoint now) {
  return entry.stale || (now - entry.timestamp) > stale_ttl;
}

std::size_t approximate_size(const Payload &data) { return data.size(); }

} // namespace navcache
