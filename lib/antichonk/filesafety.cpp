/**
 * @file filesafety.cpp
 * @brief Safety checks guarding the delete primitives
 */

#include "filesafety.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/vfs.h>

/**
 * @brief Critical system paths that should never be deleted
 *
 * Essential root filesystem directories whose deletion would break the
 * operating system.
 */
const std::unordered_set<std::string> FileSafety::CRITICAL_PATHS = {
    "/",    "/boot", "/dev", "/etc", "/lib", "/lib64", "/proc", "/root", "/run",
    "/sys", "/usr",  "/var", "/bin", "/sbin", "/opt",  "/srv",  "/tmp",  "/home"};

std::string FileSafety::stripTrailingSlash(const std::string &path) {
  std::string result = path;
  while (result.size() > 1 && result.back() == '/')
    result.pop_back();
  return result;
}

/**
 * @brief Checks whether a path is safe to delete
 *
 * Checks run in order of severity:
 * 1. System paths (blocked)
 * 2. User home directory (blocked)
 * 3. Virtual filesystems like /proc, /sys (blocked)
 * 4. Mount points (blocked)
 * 5. Removable media (warning only)
 *
 * /proc/mounts is read once and shared by the last two checks.
 *
 * @see DeletionStatus
 * @see getStatusMessage()
 */
FileSafety::DeletionStatus FileSafety::checkDeletion(const std::string &path) {
  const std::string p = stripTrailingSlash(path);

  if (isSystemPath(p))
    return DeletionStatus::BlockedSystemPath;

  if (isUserHome(p))
    return DeletionStatus::BlockedHome;

  if (isProtectedFilesystem(p))
    return DeletionStatus::BlockedVirtualFS;

  const auto mounts = getMountPoints();

  if (isMountPoint(p, mounts))
    return DeletionStatus::BlockedMountPoint;

  if (isRemovableMedia(p, mounts))
    return DeletionStatus::WarningRemovableMedia;

  return DeletionStatus::Allowed;
}

bool FileSafety::isBlocked(DeletionStatus status) {
  return status != DeletionStatus::Allowed &&
         status != DeletionStatus::WarningRemovableMedia;
}

std::string FileSafety::getStatusMessage(DeletionStatus status,
                                         const std::string &path) {
  switch (status) {
  case DeletionStatus::Allowed:
    return "Deletion allowed";
  case DeletionStatus::BlockedSystemPath:
    return "Refusing to delete system directory: " + path;
  case DeletionStatus::BlockedHome:
    return "Refusing to delete your home directory: " + path;
  case DeletionStatus::BlockedMountPoint:
    return "Refusing to delete mount point: " + path;
  case DeletionStatus::BlockedVirtualFS:
    return "Refusing to delete on a virtual/system filesystem: " + path;
  case DeletionStatus::WarningRemovableMedia:
    return "This is on removable media: " + path;
  }
  return "Unknown status";
}

bool FileSafety::isSystemPath(const std::string &path) {
  return CRITICAL_PATHS.count(stripTrailingSlash(path)) > 0;
}

/**
 * @brief Checks if a path is the user's home directory
 *
 * @note Returns false if the HOME environment variable is not set
 */
bool FileSafety::isUserHome(const std::string &path) {
  const char *home = std::getenv("HOME");
  return home && stripTrailingSlash(path) == stripTrailingSlash(home);
}

bool FileSafety::isMountPoint(const std::string &path) {
  return isMountPoint(path, getMountPoints());
}

bool FileSafety::isMountPoint(const std::string &path,
                              const std::vector<MountInfo> &mounts) {
  const std::string p = stripTrailingSlash(path);
  for (const auto &mount : mounts) {
    if (mount.mountpoint == p)
      return true;
  }
  return false;
}

/**
 * @brief Checks if a path resides on a protected or virtual filesystem
 *
 * Uses statfs() on the path, or on its closest existing ancestor when the
 * path itself is already gone, and compares the filesystem magic number
 * against procfs, sysfs, devpts, securityfs and the cgroup filesystems.
 *
 * @return true if the path is on a protected filesystem or if statfs() fails
 *
 * @note Magic numbers from /usr/include/linux/magic.h
 * @note Returns true on error (fail-safe behavior)
 */
bool FileSafety::isProtectedFilesystem(const std::string &path) {
  struct statfs fs_info;

  std::string existing = stripTrailingSlash(path);
  while (statfs(existing.c_str(), &fs_info) != 0) {
    auto slash = existing.find_last_of('/');
    if (slash == std::string::npos || existing == "/")
      return true; // On error, assume protected
    existing = slash == 0 ? "/" : existing.substr(0, slash);
  }

  const long PROTECTED_FS[] = {
      0x9fa0,     // PROC_SUPER_MAGIC (procfs)
      0x62656572, // SYSFS_MAGIC (sysfs)
      0x3434,     // DEVPTS_SUPER_MAGIC (devpts)
      0x73636673, // SECURITYFS_MAGIC (securityfs)
      0x27e0eb,   // CGROUP_SUPER_MAGIC (cgroup)
      0x63677270, // CGROUP2_SUPER_MAGIC (cgroup2)
  };

  for (auto magic : PROTECTED_FS) {
    if (static_cast<long>(fs_info.f_type) == magic)
      return true;
  }

  return false;
}

/**
 * @brief Checks if a path is on removable media
 *
 * Picks the mount with the longest mount point containing the path, then:
 * 1. Flags it when the mount point is under /media, /mnt or /run/media
 * 2. For SCSI devices (/dev/sd*), queries sysfs for the removable flag
 *
 * @note This check generates a warning rather than blocking deletion
 */
bool FileSafety::isRemovableMedia(const std::string &path) {
  return isRemovableMedia(path, getMountPoints());
}

bool FileSafety::isRemovableMedia(const std::string &path,
                                  const std::vector<MountInfo> &mounts) {
  const std::string p = stripTrailingSlash(path);
  const MountInfo *best = nullptr;

  for (const auto &mount : mounts) {
    if (!isWithin(p, mount.mountpoint))
      continue;
    if (!best || mount.mountpoint.size() > best->mountpoint.size())
      best = &mount;
  }

  if (!best)
    return false;
  if (best->is_removable)
    return true;

  if (best->device.rfind("/dev/sd", 0) == 0 && best->device.size() >= 8) {
    // e.g. /dev/sda1 → /sys/block/sda/removable
    std::string device_name = best->device.substr(5, 3);
    std::ifstream removable_file("/sys/block/" + device_name + "/removable");
    int removable = 0;
    if (removable_file >> removable && removable == 1)
      return true;
  }

  return false;
}

/**
 * @brief Retrieves information about all currently mounted filesystems
 *
 * Parses /proc/mounts. Mount points under /media, /mnt or /run/media are
 * flagged as potentially removable.
 *
 * @return Empty vector if /proc/mounts cannot be opened
 */
std::vector<FileSafety::MountInfo> FileSafety::getMountPoints() {
  std::vector<MountInfo> mounts;
  std::ifstream mounts_file("/proc/mounts");

  if (!mounts_file.is_open())
    return mounts;

  std::string line;
  while (std::getline(mounts_file, line)) {
    std::istringstream iss(line);
    MountInfo info;
    std::string options;

    if (!(iss >> info.device >> info.mountpoint >> info.fstype >> options))
      continue;

    info.is_removable = isWithin(info.mountpoint, "/media") ||
                        isWithin(info.mountpoint, "/mnt") ||
                        isWithin(info.mountpoint, "/run/media");

    mounts.push_back(info);
  }

  return mounts;
}

bool FileSafety::isWithin(const std::string &path, const std::string &dir) {
  const std::string d = stripTrailingSlash(dir);
  if (d == "/")
    return !path.empty() && path[0] == '/';
  if (path.compare(0, d.size(), d) != 0)
    return false;
  return path.size() == d.size() || path[d.size()] == '/';
}
