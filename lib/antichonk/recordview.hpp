/**
 * @file recordview.hpp
 * @brief Terminal rendering of presented records, help and summary
 */

#ifndef RECORDVIEW_HPP
#define RECORDVIEW_HPP

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>

#include <ftxui/dom/elements.hpp>

#include "filerecord.hpp"
#include "sessionsummary.hpp"

/**
 * @class RecordView
 * @brief Writes everything the operator sees to an output stream
 *
 * Record cards and the summary are laid out with the ftxui DOM and printed
 * once, sized to their content; they are not interactive components. Status
 * lines, the help menu and the prompt are plain text lines.
 *
 * @see Session
 */
class RecordView {
private:
  std::ostream &m_out;

public:
  /** @brief Maximum number of tree lines below the containing directory */
  static constexpr int MAX_TREE_ENTRIES = 40;

  /** @brief Maximum depth of the tree below the containing directory */
  static constexpr int MAX_TREE_DEPTH = 3;

  explicit RecordView(std::ostream &out) : m_out(out) {}

  /**
   * @brief Prints the card of a record: path, size, age, position and the
   *        tree of its containing directory with the record highlighted
   *
   * @param record The record being presented
   * @param position 1-based position of the record in the candidate sequence
   * @param total Length of the candidate sequence
   */
  void showRecord(const FileRecord &record, std::size_t position,
                  std::size_t total);

  /** @brief Prints the option menu */
  void showHelp();

  /** @brief Prints the prompt, without a trailing newline */
  void showPrompt();

  /** @brief Prints a "✓ ..." line */
  void showSuccess(const std::string &message);

  /** @brief Prints a "✗ ..." line */
  void showWarning(const std::string &message);

  /** @brief Prints a plain informational line */
  void showNotice(const std::string &message);

  void showSummary(const SessionSummary &summary);

  /**
   * @brief Builds the tree of @p directory with @p highlight in green
   *
   * Entries are listed case-insensitively by name, directories suffixed
   * with '/'. Symbolic links to directories are listed but not expanded.
   */
  static ftxui::Element directoryTree(const std::filesystem::path &directory,
                                      const std::filesystem::path &highlight);

  /** @brief Renders @p document at its natural size and writes it out */
  static void print(std::ostream &out, ftxui::Element document);
};

#endif // RECORDVIEW_HPP
