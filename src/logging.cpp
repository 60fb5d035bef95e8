#include "logging.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

static void install(std::shared_ptr<spdlog::logger> logger, const std::string& level) {
  logger->set_level(spdlog::level::from_str(level));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

bool init_logging(const Config& cfg, std::string& msg) {
  if (cfg.log_path.empty()) {
    install(std::make_shared<spdlog::logger>("manifold", std::make_shared<spdlog::sinks::null_sink_mt>()), "off");
    return true;
  }
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_path);
    install(std::make_shared<spdlog::logger>("manifold", std::move(sink)), cfg.log_level);
  } catch (const spdlog::spdlog_ex& ex) {
    msg = std::string("log: ") + ex.what();
    install(std::make_shared<spdlog::logger>("manifold", std::make_shared<spdlog::sinks::null_sink_mt>()), "off");
    return false;
  }
  return true;
}
