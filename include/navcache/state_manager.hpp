#pragma once

#include "navcache/context.hpp"
#include "navcache/storage.hpp"
#include "navcache/types.hpp"
#include "navcache/ui_surface.hpp"

#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace navcache {

// Per-route UI snapshots with an LRU bound of StateConfig::max_states.
// When persist_states is set and a backup engine is given, snapshots are
// mirrored into it under StateConfig::key_prefix and reloaded on
// construction. The backup engine must already be initialized and must not
// be shared with the durable cache tier.
class StateManager {
public:
  StateManager(Context &ctx, IUiSurface &surface,
               IPersistentStorage *backup = nullptr);
  ~StateManager();

  StateManager(const StateManager &) = delete;
  StateManager &operator=(const StateManager &) = delete;

  PageState capture_state(const std::string &route,
                          const std::optional<CaptureSelectors> &selectors =
                              std::nullopt);
  // Applies filters, expanded sections, form data and the search term now;
  // scroll follows after paint_delay on the timer queue.
  bool restore_state(const std::string &route,
                     const std::optional<PageState> &state = std::nullopt);

  std::optional<PageState> get_state(const std::string &route);
  void set_state(const std::string &route, PageState state);
  bool clear_state(const std::string &route);
  void clear_all_states();

  // Most recently used first.
  std::vector<std::string> stored_routes() const {
    return {lru_.begin(), lru_.end()};
  }
  std::size_t state_count() const { return states_.size(); }
  bool scroll_pending() const { return pending_scroll_.has_value(); }

  void set_default_selectors(CaptureSelectors selectors) {
    default_selectors_ = std::move(selectors);
  }
  const CaptureSelectors &default_selectors() const {
    return default_selectors_;
  }

private:
  void touch(const std::string &route);
  void evict_lru();
  bool backup_enabled() const;
  void persist(const std::string &route, const PageState &state);
  void unpersist(const std::string &route);
  void load_backup();
  void cancel_pending_scroll();

  Context &ctx_;
  IUiSurface &surface_;
  IPersistentStorage *backup_;
  CaptureSelectors default_selectors_;
  std::unordered_map<std::string, PageState> states_;
  std::list<std::string> lru_;
  std::unordered_map<std::string, std::list<std::string>::iterator> lru_pos_;
  std::optional<TaskId> pending_scroll_;
};

} // namespace navcache
