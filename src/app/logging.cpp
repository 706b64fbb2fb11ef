#include <imgpipe/app/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace imgpipe::app {

void init_logging(std::string_view level) {
  auto logger = spdlog::get("imgpipe");
  if (!logger) {
    logger = spdlog::stdout_color_mt("imgpipe");
  }
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %l %n %v");

  auto lvl = spdlog::level::from_str(std::string(level));
  if (lvl == spdlog::level::off && level != "off") {
    lvl = spdlog::level::info;
  }
  logger->set_level(lvl);
  spdlog::set_default_logger(logger);
}

}  // namespace imgpipe::app
