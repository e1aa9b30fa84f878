#include "decision.hpp"

Decision decisionFromInput(const std::string &line) {
  auto first = line.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return Decision::Invalid;

  auto last = line.find_last_not_of(" \t\r\n");
  if (last != first)
    return Decision::Invalid;

  const char key = line[first];
  for (const auto &[decision, info] : DecisionMap) {
    if (info.m_shortcut == key)
      return decision;
  }
  return Decision::Invalid;
}

std::vector<std::string> helpLines() {
  std::vector<std::string> lines;
  lines.reserve(DecisionMap.size());
  for (const auto &[decision, info] : DecisionMap) {
    lines.push_back(std::string("  ") + info.m_shortcut + "  " +
                    info.m_help_text);
  }
  return lines;
}

std::string shortcutList() {
  std::string list;
  for (const auto &[decision, info] : DecisionMap) {
    if (!list.empty())
      list += ',';
    list += info.m_shortcut;
  }
  return list;
}
