#include "navcache/timer_queue.hpp"

namespace navcache {

TimerQueue::TimerQueue(ClockFn now) : now_(std::move(now)) {}

TaskId TimerQueue::schedule_at(TimePoint deadline, std::function<void()> fn) {
  const TaskId id = next_id_++;
  tasks_[id] = std::move(fn);
  heap_.push({deadline, id});
  return id;
}

TaskId TimerQueue::schedule_after(Millis delay, std::function<void()> fn) {
  return schedule_at(now_() + delay, std::move(fn));
}

bool TimerQueue::cancel(TaskId id) { return tasks_.erase(id) > 0; }

std::size_t TimerQueue::run_due() {
  const TaskId limit = next_id_;
  const TimePoint now = now_();
  std::vector<Node> later;
  std::size_t ran = 0;
  while (!heap_.empty() && heap_.top().deadline <= now) {
    const Node node = heap_.top();
    heap_.pop();
    if (node.id >= limit) {
      later.push_back(node);
      continue;
    }
    auto it = tasks_.find(node.id);
    if (it == tasks_.end())
      continue;
    auto fn = std::move(it->second);
    tasks_.erase(it);
    fn();
    ++ran;
  }
  for (const auto &n : later)
    heap_.push(n);
  return ran;
}

void TimerQueue::clear() {
  tasks_.clear();
  heap_ = {};
}

std::optional<TimePoint> TimerQueue::next_deadline() {
  while (!heap_.empty() && !tasks_.contains(heap_.top().id))
    heap_.pop();
  if (heap_.empty())
    return std::nullopt;
  return heap_.top().deadline;
}

} // namespace navcache
