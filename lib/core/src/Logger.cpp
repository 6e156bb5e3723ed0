#include "pipemon/core/Logger.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace PIPEMON {

namespace {

std::mutex gConfigMutex;
std::string gLogDirectory;
LogLevel gLogLevel = LogLevel::INFO;

} // namespace

std::optional<LogLevel> LogLevelFromString(const std::string &name) {
  std::string lower;
  for (char c : name) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug")
    return LogLevel::DEBUG;
  if (lower == "info")
    return LogLevel::INFO;
  if (lower == "warning" || lower == "warn")
    return LogLevel::WARNING;
  if (lower == "error")
    return LogLevel::ERROR;
  return std::nullopt;
}

std::string LogLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

std::shared_ptr<Logger> Logger::GetLogger(const std::string &component) {
  static std::map<std::string, std::shared_ptr<Logger>> loggers;
  static std::mutex loggerMutex;

  std::lock_guard<std::mutex> lock(loggerMutex);

  auto it = loggers.find(component);
  if (it != loggers.end()) {
    return it->second;
  }

  auto logger = std::shared_ptr<Logger>(new Logger(component));
  loggers[component] = logger;
  return logger;
}

bool Logger::Initialize(const std::string &logDir, LogLevel level) {
  std::lock_guard<std::mutex> lock(gConfigMutex);
  gLogLevel = level;
  gLogDirectory = logDir;

  if (logDir.empty()) {
    return true;
  }

  if (mkdir(logDir.c_str(), 0755) != 0 && errno != EEXIST) {
    std::cerr << "Failed to create log directory: " << logDir << std::endl;
    gLogDirectory.clear();
    return false;
  }
  return true;
}

LogLevel Logger::GetGlobalLogLevel() {
  std::lock_guard<std::mutex> lock(gConfigMutex);
  return gLogLevel;
}

Logger::Logger(const std::string &component) : fComponent(component) {}

Logger::~Logger() {
  if (fLogFile.is_open()) {
    fLogFile.close();
  }
}

void Logger::Debug(const std::string &message) {
  WriteLog(LogLevel::DEBUG, message);
}

void Logger::Info(const std::string &message) {
  WriteLog(LogLevel::INFO, message);
}

void Logger::Warning(const std::string &message) {
  WriteLog(LogLevel::WARNING, message);
}

void Logger::Error(const std::string &message) {
  WriteLog(LogLevel::ERROR, message);
}

void Logger::Flush() {
  std::lock_guard<std::mutex> lock(fLogMutex);
  if (fLogFile.is_open()) {
    fLogFile.flush();
  }
}

void Logger::ReopenIfNeeded(const std::string &directory) {
  if (directory == fOpenedDirectory && (directory.empty() || fLogFile.is_open())) {
    return;
  }
  if (fLogFile.is_open()) {
    fLogFile.close();
  }
  fOpenedDirectory = directory;
  if (directory.empty()) {
    return;
  }

  std::string path = directory + "/" + fComponent + ".log";
  fLogFile.open(path, std::ios::out | std::ios::app);
  if (!fLogFile.is_open()) {
    std::cerr << "Failed to open log file: " << path << std::endl;
  }
}

void Logger::WriteLog(LogLevel level, const std::string &message) {
  std::string directory;
  {
    std::lock_guard<std::mutex> lock(gConfigMutex);
    if (level < gLogLevel) {
      return;
    }
    directory = gLogDirectory;
  }

  std::lock_guard<std::mutex> lock(fLogMutex);
  ReopenIfNeeded(directory);

  std::string logEntry = "[" + GetTimestamp() + "] [" +
                         LogLevelToString(level) + "] [" + fComponent + "] " +
                         message;

  if (fLogFile.is_open()) {
    fLogFile << logEntry << std::endl;
    if (level == LogLevel::ERROR) {
      std::cerr << logEntry << std::endl;
    }
  } else {
    std::cerr << logEntry << std::endl;
  }
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm_now{};
  localtime_r(&time_t_now, &tm_now);

  std::ostringstream oss;
  oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

} // namespace PIPEMON
