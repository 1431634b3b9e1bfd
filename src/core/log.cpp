#include "vectra/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace vectra {

auto logger() -> std::shared_ptr<spdlog::logger> {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("vectra")) return existing;
    auto created = spdlog::stderr_color_mt("vectra");
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    return created;
  }();
  return instance;
}

auto set_log_level(std::string_view level) -> void {
  auto parsed = spdlog::level::from_str(std::string(level));
  if (parsed == spdlog::level::off && level != "off") parsed = spdlog::level::info;
  logger()->set_level(parsed);
}

} // namespace vectra
