#ifndef PRUNESET_HPP
#define PRUNESET_HPP

#include <cstddef>
#include <filesystem>
#include <set>

/**
 * @class PruneSet
 * @brief Directories whose remaining files are suppressed for the run
 *
 * A directory enters the set when the operator skips it or deletes it. The
 * set only grows; a path is covered when it is a member or lies beneath a
 * member. Comparison is component-wise, so "/a/b" covers "/a/b/c" but not
 * "/a/bc".
 */
class PruneSet {
private:
  std::set<std::filesystem::path> m_directories;

public:
  /** @brief Adds a directory; adding the same directory twice is a no-op */
  void add(const std::filesystem::path &directory);

  /** @brief True when @p directory itself is a member */
  bool contains(const std::filesystem::path &directory) const;

  /**
   * @brief True when @p path is a member or a descendant of a member
   *
   * Walks the ancestors of @p path, so the cost is O(depth).
   */
  bool covers(const std::filesystem::path &path) const;

  std::size_t size() const { return m_directories.size(); }
  bool empty() const { return m_directories.empty(); }
};

#endif // PRUNESET_HPP
