#ifndef ILOGSINK_HPP
#define ILOGSINK_HPP

#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char *logLevelName(LogLevel level);

/**
 * @struct LogEvent
 * @brief Structured event emitted by the core
 *
 * event is a stable short name ("scan-start", "entry-error", "purge-found",
 * "delete-result", ...), message is the human readable line.
 */
struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string event;
  std::string message;
};

/**
 * @brief Destination for core log events
 *
 * The core never writes to the terminal or to files itself. Implementations
 * must be safe to call from scanner worker threads.
 */
class ILogSink {
public:
  virtual void log(const LogEvent &event) = 0;
  virtual ~ILogSink() = default;

  void debug(const std::string &event, const std::string &message) {
    log({LogLevel::Debug, event, message});
  }
  void info(const std::string &event, const std::string &message) {
    log({LogLevel::Info, event, message});
  }
  void warn(const std::string &event, const std::string &message) {
    log({LogLevel::Warn, event, message});
  }
  void error(const std::string &event, const std::string &message) {
    log({LogLevel::Error, event, message});
  }
};

/** @brief Sink that discards everything */
class NullLogSink : public ILogSink {
public:
  void log(const LogEvent &) override {}
};

#endif // ILOGSINK_HPP
