#include "navcache/state_manager.hpp"

#include "navcache/codec.hpp"
#include "navcache/log.hpp"

#include <algorithm>

namespace navcache {

StateManager::StateManager(Context &ctx, IUiSurface &surface,
                           IPersistentStorage *backup)
    : ctx_(ctx), surface_(surface), backup_(backup) {
  if (backup_enabled())
    load_backup();
}

StateManager::~StateManager() { cancel_pending_scroll(); }

PageState
StateManager::capture_state(const std::string &route,
                            const std::optional<CaptureSelectors> &selectors) {
  PageState state = surface_.capture(selectors.value_or(default_selectors_));
  set_state(route, state);
  log::state()->debug("captured state for {}", route);
  return state;
}

bool StateManager::restore_state(const std::string &route,
                                 const std::optional<PageState> &state) {
  std::optional<PageState> target = state;
  if (!target)
    target = get_state(route);
  if (!target)
    return false;

  surface_.apply_filters(target->filters);
  surface_.apply_expanded_sections(target->expanded_sections);
  surface_.apply_form_data(target->form_data);
  surface_.apply_search_term(target->search_term);

  cancel_pending_scroll();
  const ScrollPosition scroll = target->scroll;
  pending_scroll_ = ctx_.timers().schedule_after(
      ctx_.config().state.paint_delay, [this, scroll] {
        pending_scroll_.reset();
        surface_.apply_scroll(scroll);
      });
  log::state()->debug("restored state for {}", route);
  return true;
}

std::optional<PageState> StateManager::get_state(const std::string &route) {
  auto it = states_.find(route);
  if (it == states_.end())
    return std::nullopt;
  touch(route);
  return it->second;
}

void StateManager::set_state(const std::string &route, PageState state) {
  states_[route] = std::move(state);
  touch(route);
  if (backup_enabled())
    persist(route, states_[route]);
  while (states_.size() > ctx_.config().state.max_states)
    evict_lru();
}

bool StateManager::clear_state(const std::string &route) {
  auto it = states_.find(route);
  if (it == states_.end())
    return false;
  states_.erase(it);
  if (auto pos = lru_pos_.find(route); pos != lru_pos_.end()) {
    lru_.erase(pos->second);
    lru_pos_.erase(pos);
  }
  if (backup_enabled())
    unpersist(route);
  return true;
}

void StateManager::clear_all_states() {
  if (backup_enabled())
    for (const auto &route : lru_)
      unpersist(route);
  states_.clear();
  lru_.clear();
  lru_pos_.clear();
  cancel_pending_scroll();
}

void StateManager::touch(const std::string &route) {
  if (auto pos = lru_pos_.find(route); pos != lru_pos_.end())
    lru_.erase(pos->second);
  lru_.push_front(route);
  lru_pos_[route] = lru_.begin();
}

void StateManager::evict_lru() {
  if (lru_.empty())
    return;
  const std::string victim = lru_.back();
  log::state()->debug("evicting state for {}", victim);
  clear_state(victim);
}

bool StateManager::backup_enabled() const {
  return backup_ != nullptr && ctx_.config().state.persist_states;
}

void StateManager::persist(const std::string &route, const PageState &state) {
  std::string err;
  if (!backup_->put(ctx_.config().state.key_prefix + route,
                    encode_state(state), &err))
    log::state()->warn("state backup for {} failed: {}", route, err);
}

void StateManager::unpersist(const std::string &route) {
  std::string err;
  if (!backup_->del(ctx_.config().state.key_prefix + route, &err))
    log::state()->warn("removing state backup for {} failed: {}", route, err);
}

void StateManager::load_backup() {
  const auto &prefix = ctx_.config().state.key_prefix;
  std::size_t loaded = 0;
  for (const auto &key : backup_->keys()) {
    if (key.rfind(prefix, 0) != 0)
      continue;
    std::string err;
    auto blob = backup_->get(key, &err);
    PageState state;
    if (!blob || !decode_state(*blob, &state, &err)) {
      log::state()->warn("skipping unreadable state backup {}: {}", key, err);
      continue;
    }
    const auto route = key.substr(prefix.size());
    states_[route] = std::move(state);
    touch(route);
    ++loaded;
  }
  while (states_.size() > ctx_.config().state.max_states)
    evict_lru();
  if (loaded > 0)
    log::state()->info("loaded {} saved page states", loaded);
}

void StateManager::cancel_pending_scroll() {
  if (pending_scroll_) {
    ctx_.timers().cancel(*pending_scroll_);
    pending_scroll_.reset();
  }
}

} // namespace navcache
