/**
 * @file filescanner.hpp
 * @brief Recursive directory scanning into an ordered candidate sequence
 *
 * This header defines the FileScanner class which walks a directory tree,
 * collects every regular file with its size and modification time, and
 * returns the files sorted by the requested order.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "filerecord.hpp"

/**
 * @enum OrderBy
 * @brief Presentation order of the candidate sequence
 *
 * - Age: stalest file (oldest modification time) first
 * - Size: largest file first
 */
enum class OrderBy { Age, Size };

/**
 * @brief Parses the ORDER_BY command line value ("age" or "size")
 * @return The order, or std::nullopt for any other value
 */
std::optional<OrderBy> parseOrderBy(const std::string &value);

/** @brief Inverse of parseOrderBy() */
std::string toString(OrderBy order);

/**
 * @brief Fatal scan precondition failure
 *
 * Thrown before any record is produced when the scan root does not exist
 * or is not a directory.
 */
class ScanError : public std::runtime_error {
public:
  explicit ScanError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @class FileScanner
 * @brief Scans a directory tree and builds the ordered candidate sequence
 *
 * FileScanner traverses the tree below a root directory and builds a
 * collection of FileRecord objects for every regular file. Because both
 * orders need a global view of the tree, the whole tree is scanned before
 * the sorted result is returned.
 *
 * Key features:
 * - Symbolic links are never followed, and a directory reached twice (bind
 *   mounts) is scanned once, so every file appears under one path only and
 *   the walk terminates
 * - Files that vanish or become unreadable during the scan are skipped
 * - Progress reporting via callbacks
 * - Deterministic order: ties are broken by ascending path
 *
 * @see FileRecord
 * @see OrderBy
 */
class FileScanner {
private:
  /** @brief Identity of a directory on disk: (device, inode) */
  using DirectoryId = std::pair<unsigned long long, unsigned long long>;

public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(int count)
   * - count: Number of files recorded so far
   */
  using ProgressCallback = std::function<void(int count)>;

  /**
   * @brief Scans a directory tree and returns its files in presentation order
   *
   * The root is made absolute and normalised first, so the parent directory
   * of every returned record compares equal to the paths the session stores
   * in its PruneSet.
   *
   * @param root_directory The directory to scan
   * @param order_by Sort order of the result
   * @param progress Optional callback, invoked every 100 files and once at
   *                 the end with the final count
   *
   * @return std::vector<FileRecord> Every regular file below the root, sorted
   *
   * @throws ScanError if the root does not exist or is not a directory
   *
   * @see sortRecords()
   */
  std::vector<FileRecord> scanDirectory(const std::filesystem::path &root_directory,
                                        OrderBy order_by,
                                        ProgressCallback progress = nullptr);

  /**
   * @brief Sorts records in presentation order
   *
   * - Size: size descending, then path ascending
   * - Age: modification time ascending (stalest first), then path ascending
   *
   * @param records Vector of FileRecord objects to sort in-place
   * @param order_by Sort order
   */
  static void sortRecords(std::vector<FileRecord> &records, OrderBy order_by);

  /**
   * @brief Returns the absolute, lexically normal form of a directory path
   *
   * Trailing separators are removed so that "/data/" and "/data" compare
   * equal.
   */
  static std::filesystem::path normalizeRoot(const std::filesystem::path &dir);

private:
  /**
   * @brief Recursively collects the files of one directory
   *
   * @param dir Directory to enumerate
   * @param visited Directories already entered during this scan
   * @param results Vector to append records to
   * @param count Number of files recorded so far
   * @param progress Optional progress callback
   */
  void scanRecursive(const std::filesystem::path &dir,
                     std::set<DirectoryId> &visited,
                     std::vector<FileRecord> &results, int &count,
                     const ProgressCallback &progress);

  /**
   * @brief Builds a FileRecord for a regular file
   *
   * @return std::nullopt if the file disappeared or cannot be stat'ed
   */
  static std::optional<FileRecord>
  processEntry(const std::filesystem::directory_entry &entry);

  /** @brief Looks up the (device, inode) pair of a directory */
  static std::optional<DirectoryId>
  directoryId(const std::filesystem::path &dir);
};

#endif // FILESCANNER_HPP
