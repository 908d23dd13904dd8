//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file logger.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Global spdlog setup (stdout + optional run log file).
 */

#pragma once

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace bv_log {

/**
 * @brief Initialize the global spdlog logger.
 *
 * Always logs to stdout. When @p log_file is not empty a second sink appends
 * the same records to that file, so a run folder keeps its own log.
 *
 * @param level Level name understood by spdlog ("trace", "debug", "info"...).
 * @param log_file Optional path of the run log.
 */
inline void init_logger(const std::string &level = "info",
                        const std::string &log_file = "") {
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  std::vector<spdlog::sink_ptr> sinks{console_sink};
  if (!log_file.empty()) {
    auto file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);
  }

  auto logger =
      std::make_shared<spdlog::logger>("bv_logger", sinks.begin(), sinks.end());

  // Replace a previous instance (the CLI reinitializes once the output folder
  // is known)
  spdlog::drop("bv_logger");
  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);

  spdlog::set_level(spdlog::level::from_str(level));
  spdlog::flush_on(spdlog::level::info);
}

} // namespace bv_log
