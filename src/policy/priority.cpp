#include "navcache/policy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace navcache {
namespace {
double clamp_priority(double p) { return std::min(100.0, std::max(0.0, p)); }

double age_hours(TimePoint last_accessed_at, TimePoint now) {
  const auto age = std::chrono::duration<double, std::ratio<3600>>(
      now - last_accessed_at);
  return std::max(0.0, age.count());
}
} // namespace

double frequency_score(std::uint64_t access_count) {
  return std::min(100.0,
                  std::log10(static_cast<double>(access_count) + 1.0) * 50.0);
}

double recency_score(TimePoint last_accessed_at, TimePoint now) {
  return std::max(0.0,
                  100.0 * std::exp(-age_hours(last_accessed_at, now) / 24.0));
}

double page_kind_score(PageKind kind) {
  switch (kind) {
  case PageKind::Dashboard:
    return 100.0;
  case PageKind::Profile:
    return 90.0;
  case PageKind::Timetable:
    return 70.0;
  case PageKind::Settings:
    return 60.0;
  case PageKind::PublicProfile:
    return 50.0;
  case PageKind::Other:
    break;
  }
  return 30.0;
}

double content_kind_score(ContentKind kind) {
  switch (kind) {
  case ContentKind::UserGenerated:
    return 100.0;
  case ContentKind::Personalized:
    return 70.0;
  case ContentKind::Generic:
    break;
  }
  return 30.0;
}

double calculate_priority(std::uint64_t access_count, TimePoint last_accessed_at,
                          const PriorityWeights &weights, TimePoint now) {
  return clamp_priority(frequency_score(access_count) * weights.frequency +
                        recency_score(last_accessed_at, now) * weights.recency);
}

double calculate_extended_priority(PageKind page, ContentKind content,
                                   std::uint64_t access_count,
                                   TimePoint last_accessed_at,
                                   const ExtendedWeights &weights,
                                   TimePoint now) {
  return clamp_priority(
      frequency_score(access_count) * weights.frequency +
      recency_score(last_accessed_at, now) * weights.recency +
      page_kind_score(page) * weights.page +
      content_kind_score(content) * weights.content);
}

void sort_eviction_order(std::vector<EvictionCandidate> &candidates) {
  std::sort(candidates.begin(), candidates.end(),
            [](const EvictionCandidate &a, const EvictionCandidate &b) {
              if (a.priority != b.priority)
                return a.priority < b.priority;
              if (a.last_accessed_at != b.last_accessed_at)
                return a.last_accessed_at < b.last_accessed_at;
              if (a.sequence != b.sequence)
                return a.sequence < b.sequence;
              return a.key < b.key;
            });
}

std::vector<std::string>
pick_victims(std::vector<EvictionCandidate> candidates,
             std::size_t current_bytes, std::size_t target_bytes) {
  std::vector<std::string> victims;
  if (current_bytes <= target_bytes)
    return victims;
  sort_eviction_order(candidates);
  std::size_t to_remove = current_bytes - target_bytes;
  for (const auto &c : candidates) {
    if (to_remove == 0)
      break;
    if (c.protected_entry)
      continue;
    victims.push_back(c.key);
    to_remove -= std::min(to_remove, c.size_bytes);
  }
  return victims;
}

} // namespace navcache
