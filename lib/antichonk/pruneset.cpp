#include "pruneset.hpp"

namespace {

// "/a/b/" and "/a/b" must be the same member
std::filesystem::path canonicalKey(const std::filesystem::path &p) {
  auto normal = p.lexically_normal();
  if (normal.has_relative_path() && normal.filename().empty())
    normal = normal.parent_path();
  return normal;
}

} // namespace

void PruneSet::add(const std::filesystem::path &directory) {
  m_directories.insert(canonicalKey(directory));
}

bool PruneSet::contains(const std::filesystem::path &directory) const {
  return m_directories.count(canonicalKey(directory)) > 0;
}

bool PruneSet::covers(const std::filesystem::path &path) const {
  if (m_directories.empty())
    return false;

  auto current = canonicalKey(path);
  while (true) {
    if (m_directories.count(current) > 0)
      return true;

    auto parent = current.parent_path();
    if (parent == current || parent.empty())
      return false;
    current = parent;
  }
}
