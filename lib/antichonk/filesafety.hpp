#ifndef FILESAFETY_HPP
#define FILESAFETY_HPP

#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Safety checks applied before anything is deleted
 *
 * The deleter consults these checks for every path it is asked to remove,
 * so a "delete the directory" answer can never take a system directory, the
 * home directory or a whole mounted filesystem with it.
 */
class FileSafety {
public:
  enum class DeletionStatus {
    Allowed,
    BlockedSystemPath,
    BlockedHome,
    BlockedMountPoint,
    BlockedVirtualFS,
    WarningRemovableMedia
  };

  struct MountInfo {
    std::string device;
    std::string mountpoint;
    std::string fstype;
    bool is_removable;
  };

  /**
   * @brief Check if deletion is allowed for a path
   * @param path Full path to check; trailing separators are ignored
   * @return DeletionStatus indicating if/why deletion is blocked
   */
  static DeletionStatus checkDeletion(const std::string &path);

  /**
   * @brief True for every status that forbids the deletion
   *
   * WarningRemovableMedia is informational only.
   */
  static bool isBlocked(DeletionStatus status);

  /**
   * @brief Get human-readable message for deletion status
   */
  static std::string getStatusMessage(DeletionStatus status,
                                      const std::string &path);

  /**
   * @brief Check if path is a system directory
   */
  static bool isSystemPath(const std::string &path);

  /**
   * @brief Check if path is user's home directory
   */
  static bool isUserHome(const std::string &path);

  /**
   * @brief Check if path is a mount point
   */
  static bool isMountPoint(const std::string &path);

  /**
   * @brief Check if path is on a virtual/protected filesystem
   */
  static bool isProtectedFilesystem(const std::string &path);

  /**
   * @brief Check if path is on removable media (USB, etc.)
   */
  static bool isRemovableMedia(const std::string &path);

  /**
   * @brief Get all mount points from /proc/mounts
   */
  static std::vector<MountInfo> getMountPoints();

  /**
   * @brief True when @p path equals @p dir or lies beneath it
   *
   * Compares whole components: "/media/usb" is within "/media" but
   * "/mediaserver" is not.
   */
  static bool isWithin(const std::string &path, const std::string &dir);

private:
  static const std::unordered_set<std::string> CRITICAL_PATHS;

  static bool isMountPoint(const std::string &path,
                           const std::vector<MountInfo> &mounts);

  static bool isRemovableMedia(const std::string &path,
                               const std::vector<MountInfo> &mounts);

  static std::string stripTrailingSlash(const std::string &path);
};

#endif // FILESAFETY_HPP
