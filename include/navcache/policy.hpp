#pragma once

#include "navcache/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace navcache {

struct PriorityWeights {
  double frequency{0.6};
  double recency{0.4};
};

// Weights used once an entry carries page and content classification.
struct ExtendedWeights {
  double frequency{0.3};
  double recency{0.2};
  double page{0.3};
  double content{0.2};
};

constexpr double kCriticalPriority = 80.0;

double frequency_score(std::uint64_t access_count);
double recency_score(TimePoint last_accessed_at, TimePoint now);
double page_kind_score(PageKind kind);
double content_kind_score(ContentKind kind);

double calculate_priority(std::uint64_t access_count, TimePoint last_accessed_at,
                          const PriorityWeights &weights, TimePoint now);
double calculate_extended_priority(PageKind page, ContentKind content,
                                   std::uint64_t access_count,
                                   TimePoint last_accessed_at,
                                   const ExtendedWeights &weights,
                                   TimePoint now);

struct EvictionCandidate {
  std::string key;
  double priority{0.0};
  TimePoint last_accessed_at{};
  std::uint64_t sequence{0};
  std::size_t size_bytes{0};
  bool protected_entry{false};
};

// Lowest priority first, then least recently accessed, then oldest sequence.
void sort_eviction_order(std::vector<EvictionCandidate> &candidates);

// Keys to evict, in order, so that `current_bytes` drops to `target_bytes`.
// Protected candidates are skipped.
std::vector<std::string>
pick_victims(std::vector<EvictionCandidate> candidates,
             std::size_t current_bytes, std::size_t target_bytes);

} // namespace navcache
