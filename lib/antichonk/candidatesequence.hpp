#ifndef CANDIDATESEQUENCE_HPP
#define CANDIDATESEQUENCE_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "filerecord.hpp"
#include "pruneset.hpp"

/**
 * @class CandidateSequence
 * @brief Lazy, filtered view over the ordered candidate sequence
 *
 * Yields the scanner's records in order, dropping every record whose parent
 * directory is covered by the PruneSet at the moment it is reached. The
 * PruneSet is owned by the session and may grow between two calls to
 * next(); the filter always sees its current state.
 *
 * The sequence is finite and not restartable.
 *
 * @see PruneSet
 * @see Session
 */
class CandidateSequence {
private:
  std::vector<FileRecord> m_records;
  const PruneSet &m_prune_set;
  std::size_t m_position = 0;
  std::size_t m_pruned = 0;

public:
  CandidateSequence(std::vector<FileRecord> records, const PruneSet &prune_set)
      : m_records(std::move(records)), m_prune_set(prune_set) {}

  CandidateSequence(const CandidateSequence &) = delete;
  CandidateSequence &operator=(const CandidateSequence &) = delete;

  /**
   * @brief Advances to the next record that is not pruned
   *
   * @return Pointer to the record, valid for the lifetime of the sequence,
   *         or nullptr once the sequence is exhausted
   */
  const FileRecord *next();

  /** @brief Number of records the scanner produced */
  std::size_t total() const { return m_records.size(); }

  /** @brief Records popped so far, pruned ones included */
  std::size_t consumed() const { return m_position; }

  /** @brief Records dropped because their directory was pruned */
  std::size_t pruned() const { return m_pruned; }

  bool exhausted() const { return m_position >= m_records.size(); }
};

#endif // CANDIDATESEQUENCE_HPP
