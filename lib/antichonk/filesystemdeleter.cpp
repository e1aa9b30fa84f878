#include "filesystemdeleter.hpp"

#include <system_error>

#include "filesafety.hpp"

namespace {

const char *const REMOVABLE_NOTE = " (removable media)";

} // namespace

std::uintmax_t FilesystemDeleter::measure(const std::filesystem::path &dir) {
  std::uintmax_t total = 0;
  std::error_code ec;
  std::filesystem::directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);

  // An unreadable sub-directory only loses its own share of the total
  for (; !ec && it != std::filesystem::directory_iterator();
       it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_symlink(entry_ec) || entry_ec)
      continue;

    if (it->is_directory(entry_ec)) {
      total += measure(it->path());
      continue;
    }
    if (!it->is_regular_file(entry_ec))
      continue;

    auto size = it->file_size(entry_ec);
    if (!entry_ec)
      total += size;
  }
  return total;
}

bool FilesystemDeleter::checkSafety(const std::filesystem::path &path,
                                    DeleteResult &result) {
  auto status = FileSafety::checkDeletion(path.string());
  if (FileSafety::isBlocked(status)) {
    result.ok = false;
    result.message = FileSafety::getStatusMessage(status, path.string());
    return false;
  }
  if (status == FileSafety::DeletionStatus::WarningRemovableMedia)
    result.message = REMOVABLE_NOTE;
  return true;
}

DeleteResult FilesystemDeleter::deleteFile(const std::filesystem::path &path) {
  DeleteResult result;
  if (!checkSafety(path, result))
    return result;
  const std::string note = result.message;

  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec)
    size = 0;

  bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    result.message =
        "Error deleting file: " + path.string() + ": " + ec.message();
    return result;
  }
  if (!removed) {
    result.message = "File already gone: " + path.string();
    return result;
  }

  result.ok = true;
  result.removed = 1;
  result.bytes = size;
  result.message = "Deleted: " + path.string() + note;
  return result;
}

DeleteResult
FilesystemDeleter::deleteDirectory(const std::filesystem::path &path) {
  DeleteResult result;
  if (!checkSafety(path, result))
    return result;
  const std::string note = result.message;

  std::error_code ec;
  auto status = std::filesystem::symlink_status(path, ec);
  if (!ec && std::filesystem::is_symlink(status)) {
    result.message = "Refusing to delete, is a symbolic link: " + path.string();
    return result;
  }
  if (ec || !std::filesystem::is_directory(status)) {
    result.message = "Directory already gone: " + path.string();
    return result;
  }

  auto bytes = measure(path);
  auto removed = std::filesystem::remove_all(path, ec);
  if (ec) {
    result.message =
        "Error deleting directory: " + path.string() + ": " + ec.message();
    return result;
  }

  result.ok = true;
  result.removed = removed;
  result.bytes = bytes;
  result.message = "Deleted directory (" + std::to_string(removed) +
                   " items): " + path.string() + note;
  return result;
}
