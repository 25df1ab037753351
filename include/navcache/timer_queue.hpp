#pragma once

#include "navcache/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

namespace navcache {

using TaskId = std::uint64_t;
using ClockFn = std::function<TimePoint()>;

// Cooperative deadline queue. Nothing runs until the host calls run_due();
// tasks due at the same instant run in scheduling order.
class TimerQueue {
public:
  explicit TimerQueue(ClockFn now);

  TaskId schedule_at(TimePoint deadline, std::function<void()> fn);
  TaskId schedule_after(Millis delay, std::function<void()> fn);
  bool cancel(TaskId id);
  bool is_pending(TaskId id) const { return tasks_.contains(id); }

  // Runs every task already queued whose deadline has passed. Tasks queued
  // by a running task wait for the next call.
  std::size_t run_due();
  void clear();

  std::size_t pending() const { return tasks_.size(); }
  std::optional<TimePoint> next_deadline();

private:
  struct Node {
    TimePoint deadline;
    TaskId id;
    bool operator>(const Node &other) const {
      if (deadline != other.deadline)
        return deadline > other.deadline;
      return id > other.id;
    }
  };

  ClockFn now_;
  std::priority_queue<Node, std::vector<Node>, std::greater<Node>> heap_;
  std::unordered_map<TaskId, std::function<void()>> tasks_;
  TaskId next_id_{1};
};

} // namespace navcache
