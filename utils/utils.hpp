/**
 * @file utils.hpp
 * @brief Formatting helpers shared by the record view and the session
 *
 * Key utilities:
 * - formatBytes: Human-readable file size formatting
 * - formatAge: Human-readable file age formatting
 *
 * @see formatBytes()
 * @see formatAge()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdio>
#include <string>

/**
 * @brief Formats byte count into human-readable size string
 *
 * Converts a byte count into a human-readable string with appropriate units
 * and one decimal place of precision. The function uses binary units
 * (1024 bytes = 1 KB) rather than decimal units.
 *
 * Formatting rules:
 * - 0 bytes: Returns "0 B"
 * - < 1024 bytes: Returns "X.X B"
 * - < 1 MB: Returns "X.X KB"
 * - < 1 GB: Returns "X.X MB"
 * - < 1 TB: Returns "X.X GB"
 * - >= 1 TB: Returns "X.X TB"
 *
 * @param bytes The number of bytes to format
 *
 * @return std::string Formatted size (e.g., "1.5 KB", "3.2 MB")
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.0 GB"
 */
inline std::string formatBytes(unsigned long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Formats an age in whole days
 *
 * - formatAge(0) → "0 days"
 * - formatAge(1) → "1 day"
 * - formatAge(400) → "400 days"
 */
inline std::string formatAge(long long days) {
  if (days < 0)
    days = 0;
  return std::to_string(days) + (days == 1 ? " day" : " days");
}

#endif // UTILS_HPP
