/**
 * @file utils.hpp
 * @brief Utility functions shared by the library, the CLI and the browser
 *
 * Key utilities:
 * - formatBytes: Human-readable size formatting
 * - formatMiB: Fixed MiB figure used in purge summaries
 * - utcTimestamp: ISO 8601 time stamp for persisted scans
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KiB) with two decimals.
 *
 * Example outputs:
 * - formatBytes(0) -> "0 B"
 * - formatBytes(512) -> "512.00 B"
 * - formatBytes(1536) -> "1.50 KiB"
 * - formatBytes(104857600) -> "100.00 MiB"
 */
inline std::string formatBytes(std::uint64_t bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 5) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
  return std::string(buf);
}

/** @brief Bytes as "12.34 MiB" regardless of magnitude */
inline std::string formatMiB(std::uint64_t bytes) {
  char buf[48];
  snprintf(buf, sizeof(buf), "%.2f MiB",
           static_cast<double>(bytes) / 1024.0 / 1024.0);
  return std::string(buf);
}

/** @brief Current time as "YYYY-MM-DDTHH:MM:SSZ" */
inline std::string utcTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&now, &utc);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buf);
}

#endif // UTILS_HPP
