#include "logger.h"
#include "config.h"
#include <stdarg.h>
#include <stdio.h>
#include <chrono>

// Global logger instance
Logger logger;

static void stdoutOutput(const char* line) {
  fputs(line, stdout);
  fputc('\n', stdout);
  fflush(stdout);
}

static unsigned long steadyMillis() {
  static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
}

Logger::Logger() : maxEntries(LOG_BUFFER_SIZE), output(stdoutOutput), clock(steadyMillis) {}

void Logger::begin(size_t maxEntries) {
  std::lock_guard<std::mutex> lock(mutex);
  this->maxEntries = maxEntries;
  entries.reserve(maxEntries);
}

void Logger::setOutput(LogOutput output) {
  std::lock_guard<std::mutex> lock(mutex);
  this->output = output ? output : stdoutOutput;
}

void Logger::setClock(LogClock clock) {
  std::lock_guard<std::mutex> lock(mutex);
  this->clock = clock ? clock : steadyMillis;
}

void Logger::log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex);
  unsigned long now = clock();
  std::string timestamp = formatTimestamp(now);

  // Always write to the output; the lock keeps lines from different tasks whole
  char line[320];
  snprintf(line, sizeof(line), "[%s] %s: %s", timestamp.c_str(), getLevelName(level), message.c_str());
  output(line);

  // Store in memory only if level >= INFO
  if (level >= LOG_LEVEL_INFO && maxEntries > 0) {
    LogEntry entry;
    entry.timestamp = now;
    entry.level = level;
    entry.message = message;

    // Add to circular buffer
    if (entries.size() >= maxEntries) {
      entries.erase(entries.begin());  // Remove oldest entry
    }
    entries.push_back(entry);
  }
}

std::string Logger::formatTimestamp(unsigned long millis) const {
  unsigned long totalSeconds = millis / 1000;
  unsigned long ms = millis % 1000;
  unsigned long seconds = totalSeconds % 60;
  unsigned long minutes = (totalSeconds / 60) % 60;
  unsigned long hours = totalSeconds / 3600;

  char buffer[24];
  snprintf(buffer, sizeof(buffer), "%lu:%02lu:%02lu.%03lu", hours, minutes, seconds, ms);
  return std::string(buffer);
}

const char* Logger::getLevelName(LogLevel level) const {
  switch (level) {
    case LOG_LEVEL_DEBUG: return "DEBUG";
    case LOG_LEVEL_INFO:  return "INFO ";
    case LOG_LEVEL_WARN:  return "WARN ";
    case LOG_LEVEL_ERROR: return "ERROR";
    default:              return "?????";
  }
}

void Logger::debug(const char* message) {
  log(LOG_LEVEL_DEBUG, std::string(message));
}

void Logger::debug(const std::string& message) {
  log(LOG_LEVEL_DEBUG, message);
}

void Logger::info(const char* message) {
  log(LOG_LEVEL_INFO, std::string(message));
}

void Logger::info(const std::string& message) {
  log(LOG_LEVEL_INFO, message);
}

void Logger::warn(const char* message) {
  log(LOG_LEVEL_WARN, std::string(message));
}

void Logger::warn(const std::string& message) {
  log(LOG_LEVEL_WARN, message);
}

void Logger::error(const char* message) {
  log(LOG_LEVEL_ERROR, std::string(message));
}

void Logger::error(const std::string& message) {
  log(LOG_LEVEL_ERROR, message);
}

void Logger::logv(LogLevel level, const char* format, va_list args) {
  char buffer[256];
  vsnprintf(buffer, sizeof(buffer), format, args);
  log(level, std::string(buffer));
}

void Logger::debugf(const char* format, ...) {
  va_list args;
  va_start(args, format);
  logv(LOG_LEVEL_DEBUG, format, args);
  va_end(args);
}

void Logger::infof(const char* format, ...) {
  va_list args;
  va_start(args, format);
  logv(LOG_LEVEL_INFO, format, args);
  va_end(args);
}

void Logger::warnf(const char* format, ...) {
  va_list args;
  va_start(args, format);
  logv(LOG_LEVEL_WARN, format, args);
  va_end(args);
}

void Logger::errorf(const char* format, ...) {
  va_list args;
  va_start(args, format);
  logv(LOG_LEVEL_ERROR, format, args);
  va_end(args);
}

std::vector<LogEntry> Logger::getEntries() const {
  std::lock_guard<std::mutex> lock(mutex);
  return entries;
}

std::string Logger::getEntriesJSON() const {
  std::lock_guard<std::mutex> lock(mutex);
  std::string json = "[";

  for (size_t i = 0; i < entries.size(); i++) {
    if (i > 0) json += ",";

    const LogEntry& entry = entries[i];

    // Escape backslashes and quotes in message
    std::string escapedMessage;
    escapedMessage.reserve(entry.message.size());
    for (char c : entry.message) {
      if (c == '"' || c == '\\') escapedMessage += '\\';
      escapedMessage += c;
    }

    json += "{";
    json += "\"timestamp\":\"" + formatTimestamp(entry.timestamp) + "\",";
    json += "\"level\":\"" + std::string(getLevelName(entry.level)) + "\",";
    json += "\"message\":\"" + escapedMessage + "\"";
    json += "}";
  }

  json += "]";
  return json;
}

void Logger::clear() {
  std::lock_guard<std::mutex> lock(mutex);
  entries.clear();
}
