#pragma once

#include "navcache/config.hpp"
#include "navcache/sync_channel.hpp"
#include "navcache/timer_queue.hpp"

namespace navcache {

// Shared runtime state handed by reference to every component: the
// configuration, the time source, the deferred-work queue and the sync
// channel. Constructed once per cache instance.
class Context {
public:
  explicit Context(NavcacheConfig cfg = {}, ClockFn clock = {});

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  const NavcacheConfig &config() const { return cfg_; }
  // Replaces the configuration after sanitizing it. VolatileStore keeps its
  // own copy and needs VolatileStore::update_config as well.
  void update_config(NavcacheConfig cfg);

  TimePoint now() const { return clock_(); }
  void set_clock(ClockFn clock);

  TimerQueue &timers() { return timers_; }
  SyncChannel &channel() { return channel_; }

private:
  NavcacheConfig cfg_;
  ClockFn clock_;
  TimerQueue timers_;
  SyncChannel channel_;
};

} // namespace navcache
