#include "navcache/refresh_manager.hpp"

#include "navcache/log.hpp"

#include <algorithm>
#include <exception>

namespace navcache {

RefreshManager::RefreshManager(Context &ctx, Orchestrator &cache)
    : ctx_(ctx), cache_(cache) {}

RefreshManager::~RefreshManager() { clear(); }

void RefreshManager::schedule_refresh(const std::string &route,
                                      RefreshCallback callback, PageKind page,
                                      ContentKind content,
                                      UpdateCallback on_update) {
  if (!ctx_.config().refresh.enable_auto_refresh)
    return;
  cancel_refresh(route);

  Task task;
  task.callback = std::move(callback);
  task.on_update = std::move(on_update);
  task.page = page;
  task.content = content;
  task.scheduled_at = ctx_.now();
  task.generation = next_generation_++;
  const auto gen = task.generation;

  if (user_interacting_) {
    tasks_[route] = std::move(task);
    deferred_.push_back(route);
    log::refresh()->debug("deferred refresh of {} while user interacts", route);
    return;
  }
  task.timer = ctx_.timers().schedule_after(
      Millis{0}, [this, route, gen] { execute(route, gen); });
  tasks_[route] = std::move(task);
  log::refresh()->debug("scheduled refresh of {}", route);
}

bool RefreshManager::cancel_refresh(const std::string &route) {
  drop_deferred(route);
  auto it = tasks_.find(route);
  if (it == tasks_.end())
    return false;
  if (it->second.timer)
    ctx_.timers().cancel(*it->second.timer);
  tasks_.erase(it);
  return true;
}

void RefreshManager::set_user_interacting(bool interacting) {
  user_interacting_ = interacting;
  if (release_timer_) {
    ctx_.timers().cancel(*release_timer_);
    release_timer_.reset();
  }
  if (!interacting && !deferred_.empty())
    release_timer_ = ctx_.timers().schedule_after(
        ctx_.config().refresh.interaction_defer_delay, [this] {
          release_timer_.reset();
          release_deferred();
        });
}

bool RefreshManager::is_refresh_executing(const std::string &route) const {
  auto it = tasks_.find(route);
  return it != tasks_.end() && it->second.executing;
}

std::uint32_t RefreshManager::get_retry_count(const std::string &route) const {
  auto it = tasks_.find(route);
  return it == tasks_.end() ? 0 : it->second.retry_count;
}

RefreshStats RefreshManager::stats() const {
  RefreshStats s;
  s.scheduled = tasks_.size();
  s.deferred = deferred_.size();
  s.executing = static_cast<std::size_t>(
      std::count_if(tasks_.begin(), tasks_.end(),
                    [](const auto &kv) { return kv.second.executing; }));
  s.user_interacting = user_interacting_;
  s.completed = completed_;
  s.failed = failed_;
  s.retries = retries_;
  s.superseded = superseded_;
  return s;
}

void RefreshManager::clear() {
  for (auto &[_, task] : tasks_)
    if (task.timer)
      ctx_.timers().cancel(*task.timer);
  if (release_timer_) {
    ctx_.timers().cancel(*release_timer_);
    release_timer_.reset();
  }
  tasks_.clear();
  deferred_.clear();
  user_interacting_ = false;
}

void RefreshManager::execute(const std::string &route,
                             std::uint64_t generation) {
  auto it = tasks_.find(route);
  if (it == tasks_.end() || it->second.generation != generation ||
      it->second.executing)
    return;
  Task &task = it->second;
  task.executing = true;
  task.timer.reset();
  auto callback = task.callback;

  std::optional<Payload> fresh;
  std::string err;
  try {
    fresh = callback(route, &err);
  } catch (const std::exception &e) {
    fresh.reset();
    err = e.what();
  }

  // The callback may have cancelled or rescheduled this route.
  it = tasks_.find(route);
  if (it == tasks_.end() || it->second.generation != generation) {
    ++superseded_;
    log::refresh()->debug("discarding superseded refresh result for {}",
                          route);
    return;
  }
  it->second.executing = false;

  if (!fresh) {
    handle_failure(route, err.empty() ? "no data" : err);
    return;
  }

  SetOptions opts;
  opts.page_kind = it->second.page;
  opts.content_kind = it->second.content;
  opts.route = route;
  const auto key = page_key(route);
  if (auto previous = cache_.peek(key)) {
    opts.has_unsaved_changes = previous->metadata.has_unsaved_changes;
    for (const auto &t : previous->tags)
      if (!t.starts_with("page:") && !t.starts_with("content:") &&
          !t.starts_with("route:"))
        opts.tags.push_back(t);
  }
  cache_.set(key, *fresh, opts);
  auto on_update = std::move(it->second.on_update);
  tasks_.erase(it);
  ++completed_;
  log::refresh()->debug("refreshed {}", route);

  if (on_update)
    on_update(*fresh);

  SyncMessage msg;
  msg.type = SyncMessageType::CacheUpdated;
  msg.keys = {key};
  msg.data = std::move(*fresh);
  msg.at = ctx_.now();
  ctx_.channel().publish(msg);
}

void RefreshManager::handle_failure(const std::string &route,
                                    const std::string &why) {
  auto &task = tasks_.at(route);
  ++task.retry_count;
  const auto &cfg = ctx_.config().refresh;
  if (task.retry_count >= cfg.max_retries) {
    log::refresh()->error("refresh of {} failed after {} attempts: {}", route,
                          task.retry_count, why);
    ++failed_;
    tasks_.erase(route);
    return;
  }

  Millis delay = cfg.initial_retry_delay;
  for (std::uint32_t i = 1; i < task.retry_count && delay < cfg.max_retry_delay;
       ++i)
    delay *= 2;
  delay = std::min(delay, cfg.max_retry_delay);

  log::refresh()->warn("refresh of {} failed, retrying in {} ms (attempt "
                       "{}/{}): {}",
                       route, delay.count(), task.retry_count, cfg.max_retries,
                       why);
  ++retries_;
  const auto gen = task.generation;
  task.timer = ctx_.timers().schedule_after(
      delay, [this, route, gen] { execute(route, gen); });
}

void RefreshManager::release_deferred() {
  auto routes = std::move(deferred_);
  deferred_.clear();
  for (const auto &route : routes) {
    auto it = tasks_.find(route);
    if (it != tasks_.end())
      execute(route, it->second.generation);
  }
}

void RefreshManager::drop_deferred(const std::string &route) {
  deferred_.erase(std::remove(deferred_.begin(), deferred_.end(), route),
                  deferred_.end());
}

} // namespace navcache
