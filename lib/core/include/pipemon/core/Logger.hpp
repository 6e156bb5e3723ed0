#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace PIPEMON {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
 * @return std::nullopt for unknown names
 */
std::optional<LogLevel> LogLevelFromString(const std::string &name);

std::string LogLevelToString(LogLevel level);

/**
 * @brief Per-component line logger
 *
 * Line format: [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [component] message
 *
 * With a log directory every component appends to <directory>/<component>.log
 * and ERROR lines are echoed to stderr. Without a directory all lines at or
 * above the level go to stderr.
 */
class Logger {
public:
  // Get logger instance for component
  static std::shared_ptr<Logger> GetLogger(const std::string &component);

  // Initialize logging system; empty logDir logs to stderr only
  static bool Initialize(const std::string &logDir,
                         LogLevel level = LogLevel::INFO);

  static LogLevel GetGlobalLogLevel();

  void Debug(const std::string &message);
  void Info(const std::string &message);
  void Warning(const std::string &message);
  void Error(const std::string &message);

  void Flush();

  const std::string &Component() const { return fComponent; }

  ~Logger();

private:
  explicit Logger(const std::string &component);

  void WriteLog(LogLevel level, const std::string &message);
  void ReopenIfNeeded(const std::string &directory);
  static std::string GetTimestamp();

  std::string fComponent;
  std::ofstream fLogFile;
  std::string fOpenedDirectory;
  std::mutex fLogMutex;
};

} // namespace PIPEMON
