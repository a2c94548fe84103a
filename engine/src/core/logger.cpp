#include "kiln/core/logger.hpp"

namespace kiln::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

LogCategory Logger::Asset{"asset"};
LogCategory Logger::Scene{"scene"};
LogCategory Logger::Render{"render"};
LogCategory Logger::RHI{"rhi"};

namespace {
std::shared_ptr<spdlog::logger>
makeLogger(const std::string &name, const spdlog::sink_ptr &sink,
           const std::string &pattern, spdlog::level::level_enum level) {
  auto logger = std::make_shared<spdlog::logger>(name, sink);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::register_logger(logger);
  return logger;
}
} // namespace

void Logger::init(const std::string &pattern) {
  if (sLogger) {
    return; // Already initialized
  }

#ifdef DEBUG
  constexpr auto level = spdlog::level::debug;
#else
  constexpr auto level = spdlog::level::info;
#endif

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

  sLogger = makeLogger("kiln", consoleSink, pattern, level);
  for (LogCategory *category : {&Asset, &Scene, &Render, &RHI}) {
    category->m_logger =
        makeLogger(category->m_name, consoleSink, pattern, level);
  }

  info("Logger initialized");
}

void Logger::shutdown() {
  if (!sLogger) {
    return;
  }

  sLogger->flush();
  for (LogCategory *category : {&Asset, &Scene, &Render, &RHI}) {
    category->m_logger.reset();
  }
  sLogger.reset();
  spdlog::drop_all();
}

void Logger::setLevel(spdlog::level::level_enum level) {
  if (sLogger) {
    sLogger->set_level(level);
  }
  for (LogCategory *category : {&Asset, &Scene, &Render, &RHI}) {
    if (category->m_logger) {
      category->m_logger->set_level(level);
    }
  }
}

} // namespace kiln::core
