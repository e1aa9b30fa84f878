/**
 * @file filescanner.cpp
 * @brief Implementation of the recursive, cycle-safe directory scan
 */

#include "filescanner.hpp"

#include <algorithm>
#include <system_error>

#include <sys/stat.h>

std::optional<OrderBy> parseOrderBy(const std::string &value) {
  if (value == "age")
    return OrderBy::Age;
  if (value == "size")
    return OrderBy::Size;
  return std::nullopt;
}

std::string toString(OrderBy order) {
  return order == OrderBy::Age ? "age" : "size";
}

std::filesystem::path
FileScanner::normalizeRoot(const std::filesystem::path &dir) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(dir, ec);
  if (ec)
    absolute = dir;

  auto normal = absolute.lexically_normal();
  // "/data/" normalises to "/data/" with an empty filename
  if (normal.has_relative_path() && normal.filename().empty())
    normal = normal.parent_path();
  return normal;
}

/**
 * @brief Scans a directory tree and returns its files in presentation order
 *
 * Validates the root first: a missing root or a root that is not a directory
 * is reported through ScanError before any work is done. Everything that
 * goes wrong below the root (unreadable sub-directories, files deleted while
 * the scan runs) is skipped.
 *
 * Progress callbacks are invoked every 100 recorded files and once at the end
 * with the final count.
 *
 * @see scanRecursive()
 * @see sortRecords()
 */
std::vector<FileRecord>
FileScanner::scanDirectory(const std::filesystem::path &root_directory,
                           OrderBy order_by, ProgressCallback progress) {
  auto root = normalizeRoot(root_directory);

  std::error_code ec;
  auto status = std::filesystem::status(root, ec);
  if (ec || !std::filesystem::exists(status)) {
    throw ScanError("Directory does not exist: " + root.string());
  }
  if (!std::filesystem::is_directory(status)) {
    throw ScanError("Not a directory: " + root.string());
  }

  std::vector<FileRecord> results;
  std::set<DirectoryId> visited;
  int count = 0;

  if (auto id = directoryId(root)) {
    visited.insert(*id);
  }
  scanRecursive(root, visited, results, count, progress);

  // Final callback
  if (progress) {
    progress(count);
  }

  sortRecords(results, order_by);
  return results;
}

void FileScanner::scanRecursive(const std::filesystem::path &dir,
                                std::set<DirectoryId> &visited,
                                std::vector<FileRecord> &results, int &count,
                                const ProgressCallback &progress) {
  std::error_code ec;
  std::filesystem::directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec)
    return;

  for (; !ec && it != std::filesystem::directory_iterator();
       it.increment(ec)) {
    const auto &entry = *it;
    std::error_code type_ec;

    // Links are neither followed nor recorded: the target is either scanned
    // under its real path or lies outside the tree
    if (entry.is_symlink(type_ec) || type_ec)
      continue;

    if (entry.is_directory(type_ec)) {
      auto id = directoryId(entry.path());
      // unreadable, or already scanned through a bind mount
      if (!id || !visited.insert(*id).second)
        continue;

      scanRecursive(entry.path(), visited, results, count, progress);
      continue;
    }

    if (!entry.is_regular_file(type_ec))
      continue;

    auto record = processEntry(entry);
    if (!record)
      continue;

    results.push_back(std::move(*record));
    ++count;
    if (progress && count % 100 == 0)
      progress(count);
  }
}

std::optional<FileRecord>
FileScanner::processEntry(const std::filesystem::directory_entry &entry) {
  std::error_code ec;
  auto size = std::filesystem::file_size(entry.path(), ec);
  if (ec)
    return std::nullopt;

  auto mtime = std::filesystem::last_write_time(entry.path(), ec);
  if (ec)
    return std::nullopt;

  return FileRecord(entry.path(), size, mtime);
}

std::optional<FileScanner::DirectoryId>
FileScanner::directoryId(const std::filesystem::path &dir) {
  struct stat st;
  if (::stat(dir.c_str(), &st) != 0)
    return std::nullopt;
  return DirectoryId(static_cast<unsigned long long>(st.st_dev),
                     static_cast<unsigned long long>(st.st_ino));
}

/**
 * @brief Sorts records in presentation order
 *
 * Sorting logic:
 * - Size: a.getFileSize() > b.getFileSize() → a comes first
 * - Age: a.getModifiedTime() < b.getModifiedTime() → a comes first
 * - Equal keys: a.getPath() < b.getPath() → alphabetical order
 */
void FileScanner::sortRecords(std::vector<FileRecord> &records,
                              OrderBy order_by) {
  std::sort(records.begin(), records.end(),
            [order_by](const FileRecord &a, const FileRecord &b) {
              if (order_by == OrderBy::Size) {
                if (a.getFileSize() != b.getFileSize())
                  return a.getFileSize() > b.getFileSize();
              } else {
                if (a.getModifiedTime() != b.getModifiedTime())
                  return a.getModifiedTime() < b.getModifiedTime();
              }

              return a.getPath() < b.getPath();
            });
}
