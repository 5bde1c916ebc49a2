#include "streamlogsink.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

const char *logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

StreamLogSink::StreamLogSink(std::ostream &out, LogLevel threshold,
                             const std::string &logFile)
    : m_out(out), m_threshold(threshold) {
  if (!logFile.empty()) {
    m_file.open(logFile, std::ios::app);
  }
}

void StreamLogSink::setConsoleMuted(bool muted) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_console_muted = muted;
}

std::string StreamLogSink::formatLine(const LogEvent &event) {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);

  std::ostringstream line;
  line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ' '
       << logLevelName(event.level) << ' ' << event.message;
  return line.str();
}

void StreamLogSink::log(const LogEvent &event) {
  if (event.level < m_threshold)
    return;

  const std::string line = formatLine(event);

  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_console_muted) {
    m_out << line << '\n';
    m_out.flush();
  }
  if (m_file.is_open()) {
    m_file << line << '\n';
    m_file.flush();
  }
}
