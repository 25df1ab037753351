#include "navcache/context.hpp"

namespace navcache {

Context::Context(NavcacheConfig cfg, ClockFn clock)
    : cfg_(std::move(cfg)), clock_(std::move(clock)),
      timers_([this] { return now(); }) {
  if (!clock_)
    clock_ = [] { return Clock::now(); };
  sanitize(cfg_);
}

void Context::update_config(NavcacheConfig cfg) {
  sanitize(cfg);
  cfg_ = std::move(cfg);
}

void Context::set_clock(ClockFn clock) {
  if (clock)
    clock_ = std::move(clock);
  else
    clock_ = [] { return Clock::now(); };
}

} // namespace navcache
