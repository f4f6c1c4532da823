#ifndef LOGGER_H
#define LOGGER_H

#include <stdarg.h>
#include <stddef.h>
#include <mutex>
#include <string>
#include <vector>

// Log levels
enum LogLevel {
  LOG_LEVEL_DEBUG = 0,  // Output only, not stored
  LOG_LEVEL_INFO = 1,   // Output + memory
  LOG_LEVEL_WARN = 2,   // Output + memory
  LOG_LEVEL_ERROR = 3   // Output + memory
};

// Log entry structure
struct LogEntry {
  unsigned long timestamp;  // Milliseconds since boot
  LogLevel level;
  std::string message;
};

// Receives one fully formatted line (no trailing newline)
typedef void (*LogOutput)(const char* line);

// Millisecond clock used for timestamps
typedef unsigned long (*LogClock)();

class Logger {
public:
  Logger();

  // Initialize logger
  void begin(size_t maxEntries);

  // Route output and timestamps. Defaults: stdout and a steady clock.
  void setOutput(LogOutput output);
  void setClock(LogClock clock);

  // Log functions
  void debug(const char* message);
  void debug(const std::string& message);
  void info(const char* message);
  void info(const std::string& message);
  void warn(const char* message);
  void warn(const std::string& message);
  void error(const char* message);
  void error(const std::string& message);

  // Printf-style logging
  void debugf(const char* format, ...);
  void infof(const char* format, ...);
  void warnf(const char* format, ...);
  void errorf(const char* format, ...);

  // Copy of the stored log entries
  std::vector<LogEntry> getEntries() const;

  // Get log entries as JSON string
  std::string getEntriesJSON() const;

  // Clear all stored entries
  void clear();

private:
  std::vector<LogEntry> entries;
  size_t maxEntries;
  LogOutput output;
  LogClock clock;
  mutable std::mutex mutex;

  // Core logging function
  void log(LogLevel level, const std::string& message);
  void logv(LogLevel level, const char* format, va_list args);

  // Format timestamp as H:MM:SS.mmm
  std::string formatTimestamp(unsigned long millis) const;

  // Get level name as string
  const char* getLevelName(LogLevel level) const;
};

// Global logger instance
extern Logger logger;

// Convenience macros
#define LOG_DEBUG(msg) logger.debug(msg)
#define LOG_INFO(msg) logger.info(msg)
#define LOG_WARN(msg) logger.warn(msg)
#define LOG_ERROR(msg) logger.error(msg)

#define LOG_DEBUGF(...) logger.debugf(__VA_ARGS__)
#define LOG_INFOF(...) logger.infof(__VA_ARGS__)
#define LOG_WARNF(...) logger.warnf(__VA_ARGS__)
#define LOG_ERRORF(...) logger.errorf(__VA_ARGS__)

#endif // LOGGER_H
