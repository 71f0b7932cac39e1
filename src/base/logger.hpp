#ifndef CHAINRELAY_LOGGER_HPP
#define CHAINRELAY_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace chainrelay::base {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @param basepath - optional log file; stdout is used when empty
   * @return logger object
   */
  Logger createLogger(const std::string &tag, const std::string &basepath = "");

  /**
   * Set the level of every registered logger and of loggers created later
   * @param level - spdlog level
   */
  void setLogLevel(spdlog::level::level_enum level);

  /**
   * Route loggers created from now on into a file instead of stdout
   * @param path - log file path, empty to go back to stdout
   */
  void setDefaultLogFile(const std::string &path);
}  // namespace chainrelay::base

#endif  // CHAINRELAY_LOGGER_HPP
