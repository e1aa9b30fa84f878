#ifndef IDELETER_HPP
#define IDELETER_HPP

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @brief Outcome of one delete primitive call
 *
 * The session only interprets @c ok; @c message is shown to the operator.
 * @c removed is the number of filesystem entries actually removed and
 * @c bytes the size of the regular files among them (both 0 on failure).
 */
struct DeleteResult {
  bool ok = false;
  std::string message;
  std::uintmax_t removed = 0;
  std::uintmax_t bytes = 0;
};

class IDeleter {
public:
  virtual DeleteResult deleteFile(const std::filesystem::path &path) = 0;
  virtual DeleteResult deleteDirectory(const std::filesystem::path &path) = 0;
  virtual ~IDeleter() = default;
};

#endif // IDELETER_HPP
