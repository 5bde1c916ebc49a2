/**
 * @file streamlogsink.hpp
 * @brief Log sink writing timestamped lines to a stream and optional file
 */

#ifndef STREAMLOGSINK_HPP
#define STREAMLOGSINK_HPP

#include "ilogsink.hpp"

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

/**
 * @class StreamLogSink
 * @brief Formats "YYYY-MM-DD HH:MM:SS LEVEL message" lines
 *
 * Lines below the threshold are dropped. When a log file is given, every
 * line that passes the threshold is also appended there. The console copy
 * can be muted while a full-screen UI owns the terminal; the file copy keeps
 * receiving events.
 */
class StreamLogSink : public ILogSink {
public:
  StreamLogSink(std::ostream &out, LogLevel threshold,
                const std::string &logFile = "");

  void log(const LogEvent &event) override;

  /** @brief true if a log file was requested and could be opened */
  bool fileOpen() const { return m_file.is_open(); }

  void setConsoleMuted(bool muted);

  static std::string formatLine(const LogEvent &event);

private:
  std::ostream &m_out;
  std::ofstream m_file;
  LogLevel m_threshold;
  bool m_console_muted = false;
  std::mutex m_mutex;
};

#endif // STREAMLOGSINK_HPP
