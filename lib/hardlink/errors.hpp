/**
 * @file errors.hpp
 * @brief Error types raised and collected by scans, purges and deletes
 *
 * Fatal conditions are thrown (PathError, SerializationError). Recoverable
 * per-entry problems are collected into an ErrorSummary and reported once at
 * the end of the operation. Crossing a mount boundary under xdev is not an
 * error at all and cancellation is a flag on the result, not an exception.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Root path of a walk is missing, unreadable or not a directory
 */
class PathError : public std::runtime_error {
public:
  PathError(const std::string &path, const std::string &reason)
      : std::runtime_error("Cannot read " + path + ": " + reason),
        m_path(path) {}

  const std::string &path() const { return m_path; }

private:
  std::string m_path;
};

/**
 * @brief Persisted scan is corrupt, incompatible or cannot be written
 */
class SerializationError : public std::runtime_error {
public:
  explicit SerializationError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @struct ErrorSummary
 * @brief Count of recoverable errors plus a bounded sample of messages
 */
struct ErrorSummary {
  static constexpr std::size_t kSampleLimit = 5;

  std::size_t count = 0;
  std::vector<std::string> samples;

  void add(const std::string &message) {
    ++count;
    if (samples.size() < kSampleLimit)
      samples.push_back(message);
  }

  void merge(const ErrorSummary &other) {
    count += other.count;
    for (const auto &sample : other.samples) {
      if (samples.size() >= kSampleLimit)
        break;
      samples.push_back(sample);
    }
  }

  bool empty() const { return count == 0; }

  /**
   * @brief One-line summary, e.g. "3 entries could not be read (e.g. a; b)"
   * @param what Phrase completing the count ("entries could not be read")
   */
  std::string describe(const std::string &what) const {
    std::string text = std::to_string(count) + " " + what;
    if (!samples.empty()) {
      text += " (e.g. ";
      for (std::size_t i = 0; i < samples.size(); ++i) {
        if (i > 0)
          text += "; ";
        text += samples[i];
      }
      if (count > samples.size())
        text += "; ...";
      text += ")";
    }
    return text;
  }
};

#endif // ERRORS_HPP
