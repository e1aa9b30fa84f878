#include "candidatesequence.hpp"

const FileRecord *CandidateSequence::next() {
  while (m_position < m_records.size()) {
    const FileRecord &record = m_records[m_position++];

    if (m_prune_set.covers(record.getParentDirectory())) {
      ++m_pruned;
      continue;
    }
    return &record;
  }
  return nullptr;
}
