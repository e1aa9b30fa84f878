#include "session.hpp"

#include <exception>
#include <string>
#include <utility>

Session::Session(std::vector<FileRecord> records,
                 const std::filesystem::path &scan_root, IDeleter &deleter,
                 std::istream &in, std::ostream &out)
    : m_sequence(std::move(records), m_prune_set), m_root(scan_root),
      m_deleter(deleter), m_in(in), m_view(out) {}

SessionSummary Session::run() {
  while (const FileRecord *record = m_sequence.next()) {
    // Gone already: deleted out-of-band, or by an earlier 'D' elsewhere
    if (!record->existsOnDisk()) {
      ++m_summary.vanished;
      continue;
    }

    if (!handleRecord(*record)) {
      m_summary.quit_early = true;
      break;
    }
  }

  m_summary.pruned = m_sequence.pruned();
  m_view.showSummary(m_summary);
  return m_summary;
}

bool Session::handleRecord(const FileRecord &record) {
  ++m_summary.presented;
  m_view.showRecord(record, m_sequence.consumed(), m_sequence.total());

  while (true) {
    m_view.showPrompt();
    Decision decision = readDecision();

    switch (decision) {
    case Decision::Quit:
      m_view.showNotice("");
      return false;

    case Decision::ShowHelp:
    case Decision::Invalid:
      m_view.showHelp();
      m_view.showRecord(record, m_sequence.consumed(), m_sequence.total());
      continue;

    default:
      break;
    }

    try {
      applyDecision(decision, record);
    } catch (const std::exception &e) {
      ++m_summary.failures;
      m_view.showWarning("Error: " + std::string(e.what()));
    }
    return true;
  }
}

Decision Session::readDecision() {
  std::string line;
  if (!std::getline(m_in, line))
    return Decision::Quit;
  return decisionFromInput(line);
}

void Session::applyDecision(Decision decision, const FileRecord &record) {
  switch (decision) {
  case Decision::DeleteFile:
    deleteFile(record);
    break;

  case Decision::DeleteDirectory:
    if (record.getParentDirectory() == m_root) {
      m_view.showNotice("The containing directory is the scan root; "
                        "deleting the file only.");
      deleteFile(record);
    } else {
      deleteDirectory(record);
    }
    break;

  case Decision::SkipFile:
    ++m_summary.skipped_files;
    break;

  case Decision::SkipDirectory:
    m_prune_set.add(record.getParentDirectory());
    ++m_summary.skipped_directories;
    break;

  default:
    break;
  }
}

void Session::deleteFile(const FileRecord &record) {
  DeleteResult result = m_deleter.deleteFile(record.getPath());
  if (!result.ok) {
    ++m_summary.failures;
    m_view.showWarning(result.message);
    return;
  }

  ++m_summary.deleted_files;
  m_summary.bytes_reclaimed += result.bytes;
  m_view.showSuccess(result.message);
}

void Session::deleteDirectory(const FileRecord &record) {
  const auto &directory = record.getParentDirectory();

  // Pruned even when the deletion fails, so nothing below it comes back
  m_prune_set.add(directory);

  DeleteResult result = m_deleter.deleteDirectory(directory);
  if (!result.ok) {
    ++m_summary.failures;
    m_view.showWarning(result.message);
    return;
  }

  ++m_summary.deleted_directories;
  m_summary.bytes_reclaimed += result.bytes;
  m_view.showSuccess(result.message);
}
