/**
 * @file decision.hpp
 * @brief Operator decisions and their keyboard shortcuts
 *
 * This header defines the decision set of the interactive session, the
 * mapping between decisions and single-character shortcuts, and the help
 * menu text derived from that mapping.
 *
 * @see Decision
 * @see DecisionInfo
 * @see DecisionMap
 */

#ifndef DECISION_HPP
#define DECISION_HPP

#include <string>
#include <utility>
#include <vector>

/**
 * @struct DecisionInfo
 * @brief Shortcut key and help menu line of one decision
 */
struct DecisionInfo {
  /** @brief Single character keyboard shortcut */
  char m_shortcut;

  /** @brief Help menu description, without the shortcut */
  std::string m_help_text;
};

/**
 * @enum Decision
 * @brief Result of interpreting one line of operator input
 *
 * - DeleteFile: delete the presented file (shortcut: 'd')
 * - DeleteDirectory: delete the directory containing the file (shortcut: 'D')
 * - SkipFile: go on to the next file (shortcut: 's')
 * - SkipDirectory: suppress the rest of the directory (shortcut: 'S')
 * - ShowHelp: print the help menu (shortcut: '?')
 * - Invalid: anything else; handled exactly like ShowHelp
 * - Quit: input stream closed; ends the session
 *
 * @note Shortcuts are case-sensitive ('d' vs 'D' are different)
 */
enum class Decision {
  DeleteFile,
  DeleteDirectory,
  SkipFile,
  SkipDirectory,
  ShowHelp,
  Invalid,
  Quit
};

/**
 * @brief Mapping of the operator decisions to their shortcuts and help text
 *
 * Kept as a vector so the help menu lists the decisions in a fixed order.
 * Invalid and Quit have no shortcut and are not listed.
 */
inline const std::vector<std::pair<Decision, DecisionInfo>> DecisionMap = {
    {Decision::DeleteFile, {'d', "delete the file"}},
    {Decision::DeleteDirectory,
     {'D', "delete the directory which contains the file"}},
    {Decision::SkipFile, {'s', "skip this file and go on to the next one"}},
    {Decision::SkipDirectory,
     {'S', "skip this directory and go on to the next one"}},
    {Decision::ShowHelp, {'?', "print this help menu"}}};

/**
 * @brief Interprets one line of operator input
 *
 * Leading and trailing whitespace is ignored. Exactly one remaining
 * character that matches a shortcut selects that decision; an empty line,
 * an unknown character or more than one character yields Decision::Invalid.
 *
 * @param line Input line without the trailing newline
 * @return The matching decision, never Decision::Quit
 */
Decision decisionFromInput(const std::string &line);

/**
 * @brief Help menu lines, one per shortcut
 *
 * Example output:
 * - "  d  delete the file"
 * - "  ?  print this help menu"
 */
std::vector<std::string> helpLines();

/** @brief Shortcut list for the prompt, e.g. "d,D,s,S,?" */
std::string shortcutList();

#endif // DECISION_HPP
