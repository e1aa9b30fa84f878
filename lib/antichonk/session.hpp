/**
 * @file session.hpp
 * @brief The interactive decision loop
 */

#ifndef SESSION_HPP
#define SESSION_HPP

#include <filesystem>
#include <istream>
#include <ostream>
#include <vector>

#include "candidatesequence.hpp"
#include "decision.hpp"
#include "filerecord.hpp"
#include "ideleter.hpp"
#include "pruneset.hpp"
#include "recordview.hpp"
#include "sessionsummary.hpp"

/**
 * @class Session
 * @brief Presents candidates one at a time and applies operator decisions
 *
 * Consumes the ordered candidate sequence lazily. For every record that
 * survives the PruneSet filter and still exists on disk, the record is
 * shown and one line of input is read:
 *
 * - 'd': delete the file
 * - 'D': delete the containing directory and prune it
 * - 's': skip the file
 * - 'S': prune the containing directory
 * - '?' or anything else: show the help menu and ask again
 *
 * End of input ends the session early. Delete failures are reported as
 * warnings and never stop the loop; no exception escapes run().
 *
 * The containing directory of a file directly inside the scan root is the
 * scan root itself. 'D' on such a file deletes the file only and does not
 * prune the root.
 *
 * @see CandidateSequence
 * @see PruneSet
 * @see IDeleter
 */
class Session {
private:
  // Declared before m_sequence, which holds a reference to it
  PruneSet m_prune_set;
  CandidateSequence m_sequence;
  std::filesystem::path m_root;
  IDeleter &m_deleter;
  std::istream &m_in;
  RecordView m_view;
  SessionSummary m_summary;

public:
  /**
   * @param records Ordered candidate sequence produced by FileScanner
   * @param scan_root Normalised scan root, as used by the scanner
   * @param deleter Delete primitives
   * @param in Operator input, one decision per line
   * @param out Operator output
   */
  Session(std::vector<FileRecord> records,
          const std::filesystem::path &scan_root, IDeleter &deleter,
          std::istream &in, std::ostream &out);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /**
   * @brief Runs the loop until the sequence is exhausted or input ends
   * @return Counters of the run; also printed as a summary box
   */
  SessionSummary run();

  const PruneSet &pruneSet() const { return m_prune_set; }

private:
  /**
   * @brief Presents one record and loops until a decision is applied
   * @return false when the input stream ended
   */
  bool handleRecord(const FileRecord &record);

  /** @brief Reads one line; Decision::Quit at end of input */
  Decision readDecision();

  void applyDecision(Decision decision, const FileRecord &record);

  void deleteFile(const FileRecord &record);

  void deleteDirectory(const FileRecord &record);
};

#endif // SESSION_HPP
