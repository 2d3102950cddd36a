#pragma once
#ifndef SLEEPFILE_LOGGER_H
#define SLEEPFILE_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace sleepfile {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/// Parse "trace", "debug", "info", "warn", "error" or "fatal" (any case).
/// Returns @p fallback for anything else.
LogLevel parseLogLevel(const std::string &name, LogLevel fallback);

class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /// Returns the active logger, falling back to a console-only WARN logger
  /// when init() was never called.
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  /**
   * @brief Write one JSON object per line with "timestamp", "level" and
   *        "message" members, if @p level passes the current filter.
   */
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string levelToString(LogLevel level);
  std::string formatLine(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace sleepfile

#endif // SLEEPFILE_LOGGER_H
