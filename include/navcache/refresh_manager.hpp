#pragma once

#include "navcache/context.hpp"
#include "navcache/orchestrator.hpp"
#include "navcache/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace navcache {

// Fetches fresh data for a route. Failure is an empty result with `err`
// filled in, or a thrown std::exception.
using RefreshCallback = std::function<std::optional<Payload>(
    const std::string &route, std::string *err)>;
using UpdateCallback = std::function<void(const Payload &data)>;

struct RefreshStats {
  std::size_t scheduled{0};
  std::size_t deferred{0};
  std::size_t executing{0};
  bool user_interacting{false};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t retries{0};
  std::uint64_t superseded{0};
};

// At most one refresh task per route. Tasks run on the context's timer
// queue, retry with exponential backoff and are held back while the user
// is interacting with the page.
class RefreshManager {
public:
  RefreshManager(Context &ctx, Orchestrator &cache);
  ~RefreshManager();

  RefreshManager(const RefreshManager &) = delete;
  RefreshManager &operator=(const RefreshManager &) = delete;

  void schedule_refresh(const std::string &route, RefreshCallback callback,
                        PageKind page = PageKind::Other,
                        ContentKind content = ContentKind::Generic,
                        UpdateCallback on_update = {});
  bool cancel_refresh(const std::string &route);

  void set_user_interacting(bool interacting);
  bool is_user_currently_interacting() const { return user_interacting_; }

  bool is_refresh_scheduled(const std::string &route) const {
    return tasks_.contains(route);
  }
  bool is_refresh_executing(const std::string &route) const;
  std::uint32_t get_retry_count(const std::string &route) const;
  std::vector<std::string> get_deferred_refreshes() const { return deferred_; }

  RefreshStats stats() const;
  void clear();

private:
  struct Task {
    RefreshCallback callback;
    UpdateCallback on_update;
    PageKind page{PageKind::Other};
    ContentKind content{ContentKind::Generic};
    std::uint32_t retry_count{0};
    TimePoint scheduled_at{};
    std::optional<TaskId> timer;
    bool executing{false};
    std::uint64_t generation{0};
  };

  void execute(const std::string &route, std::uint64_t generation);
  void handle_failure(const std::string &route, const std::string &why);
  void release_deferred();
  void drop_deferred(const std::string &route);

  Context &ctx_;
  Orchestrator &cache_;
  std::unordered_map<std::string, Task> tasks_;
  std::vector<std::string> deferred_;
  bool user_interacting_{false};
  std::optional<TaskId> release_timer_;
  std::uint64_t next_generation_{1};
  std::uint64_t completed_{0};
  std::uint64_t failed_{0};
  std::uint64_t retries_{0};
  std::uint64_t superseded_{0};
};

} // namespace navcache
