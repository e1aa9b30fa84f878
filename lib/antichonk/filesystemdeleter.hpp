#ifndef FILESYSTEMDELETER_HPP
#define FILESYSTEMDELETER_HPP

#include "ideleter.hpp"

/**
 * @class FilesystemDeleter
 * @brief IDeleter backed by std::filesystem, guarded by FileSafety
 *
 * Never throws: every filesystem error is returned as a failed DeleteResult.
 * Paths that FileSafety blocks are refused without touching the disk.
 *
 * @see FileSafety
 */
class FilesystemDeleter : public IDeleter {
public:
  /**
   * @brief Removes a single file
   *
   * A file that is already gone is reported as a failure ("already gone"),
   * since nothing was reclaimed.
   */
  DeleteResult deleteFile(const std::filesystem::path &path) override;

  /**
   * @brief Removes a directory and everything below it
   *
   * Deletion is not transactional: when removal fails halfway the entries
   * removed so far stay removed and the result reports the failure. A
   * symbolic link to a directory is refused; neither the link nor its
   * target is removed.
   */
  DeleteResult deleteDirectory(const std::filesystem::path &path) override;

  /**
   * @brief Sum of the regular file sizes below @p dir, links not followed
   *
   * Sub-directories that cannot be read are left out of the total; the rest
   * of the tree is still counted.
   */
  static std::uintmax_t measure(const std::filesystem::path &dir);

private:
  static bool checkSafety(const std::filesystem::path &path,
                          DeleteResult &result);
};

#endif // FILESYSTEMDELETER_HPP
