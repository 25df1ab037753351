#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace navcache::log {

// Sets the level on every subsystem logger, existing and future.
void init(spdlog::level::level_enum level = spdlog::level::info);

// Named logger sharing one stderr sink; created on first use.
std::shared_ptr<spdlog::logger> get(const std::string &name);

inline std::shared_ptr<spdlog::logger> cache() { return get("cache"); }
inline std::shared_ptr<spdlog::logger> storage() { return get("storage"); }
inline std::shared_ptr<spdlog::logger> state() { return get("state"); }
inline std::shared_ptr<spdlog::logger> nav() { return get("nav"); }
inline std::shared_ptr<spdlog::logger> refresh() { return get("refresh"); }

} // namespace navcache::log
