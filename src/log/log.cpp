#include "navcache/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace navcache::log {
namespace {
constexpr const char *kLogFormat = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

spdlog::level::level_enum &current_level() {
  static spdlog::level::level_enum level = spdlog::level::info;
  return level;
}

std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> &shared_sink() {
  static auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  return sink;
}
} // namespace

void init(spdlog::level::level_enum level) {
  current_level() = level;
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger> &l) {
    l->set_level(level);
  });
}

std::shared_ptr<spdlog::logger> get(const std::string &name) {
  const std::string full = "navcache." + name;
  if (auto existing = spdlog::get(full))
    return existing;
  auto logger = std::make_shared<spdlog::logger>(full, shared_sink());
  logger->set_pattern(kLogFormat);
  logger->set_level(current_level());
  spdlog::register_logger(logger);
  return logger;
}

} // namespace navcache::log
