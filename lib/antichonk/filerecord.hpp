#ifndef FILE_RECORD_HPP
#define FILE_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include "utils.hpp"

/**
 * @class FileRecord
 * @brief One regular file found by the scanner
 *
 * Holds the absolute path, the containing directory, the size in bytes and
 * the last-modified time of a file. Records are immutable once the scanner
 * has created them; identity is the absolute path.
 *
 * @see FileScanner
 */
class FileRecord {
public:
  using Clock = std::filesystem::file_time_type::clock;
  using TimePoint = std::filesystem::file_time_type;

private:
  std::filesystem::path m_path;
  std::filesystem::path m_parent;
  std::uintmax_t m_size;
  TimePoint m_modified;

public:
  FileRecord(const std::filesystem::path &p, std::uintmax_t s, TimePoint mtime)
      : m_path(p), m_parent(p.parent_path()), m_size(s), m_modified(mtime) {}

  const std::filesystem::path &getPath() const { return m_path; }
  const std::filesystem::path &getParentDirectory() const { return m_parent; }
  std::uintmax_t getFileSize() const { return m_size; }
  TimePoint getModifiedTime() const { return m_modified; }

  std::string getDisplayName() const { return m_path.filename().string(); }

  std::string getSizeFormatted() const { return formatBytes(m_size); }

  /**
   * @brief Whole days elapsed between the modification time and @p now
   *
   * Timestamps in the future (clock skew, files touched by another host)
   * count as zero days old.
   */
  long long getAgeDays(TimePoint now = Clock::now()) const {
    if (now <= m_modified)
      return 0;
    auto hours =
        std::chrono::duration_cast<std::chrono::hours>(now - m_modified);
    return hours.count() / 24;
  }

  std::string getAgeFormatted(TimePoint now = Clock::now()) const {
    return formatAge(getAgeDays(now));
  }

  /**
   * @brief Checks whether the file is still present
   *
   * Never throws; any error while querying the filesystem counts as "gone".
   */
  bool existsOnDisk() const {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(m_path, ec);
    return !ec && std::filesystem::exists(status);
  }
};

#endif // FILE_RECORD_HPP
