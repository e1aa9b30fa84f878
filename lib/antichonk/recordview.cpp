#include "recordview.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>

#include "decision.hpp"
#include "utils.hpp"

using namespace ftxui;

namespace {

struct TreeEntry {
  std::filesystem::path path;
  std::string name;
  bool is_directory;
};

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::vector<TreeEntry> listDirectory(const std::filesystem::path &dir) {
  std::vector<TreeEntry> entries;
  std::error_code ec;
  std::filesystem::directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);

  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    bool is_dir = it->is_directory(type_ec) && !it->is_symlink(type_ec);
    entries.push_back({it->path(), it->path().filename().string(), is_dir});
  }

  std::sort(entries.begin(), entries.end(),
            [](const TreeEntry &a, const TreeEntry &b) {
              return lowercase(a.name) < lowercase(b.name);
            });
  return entries;
}

// Returns false once the entry budget is spent
bool appendTree(const std::filesystem::path &dir,
                const std::filesystem::path &highlight,
                const std::string &prefix, int depth, Elements &lines,
                int &budget) {
  auto entries = listDirectory(dir);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (budget <= 0) {
      lines.push_back(text(prefix + "└── …") | dim);
      return false;
    }
    --budget;

    const auto &entry = entries[i];
    const bool is_last = (i + 1 == entries.size());
    std::string line = prefix + (is_last ? "└── " : "├── ") + entry.name +
                       (entry.is_directory ? "/" : "");

    if (entry.path == highlight) {
      lines.push_back(text(line) | bold | color(Color::Green));
    } else if (entry.is_directory) {
      lines.push_back(text(line) | color(Color::Blue));
    } else {
      lines.push_back(text(line));
    }

    if (entry.is_directory && depth + 1 < RecordView::MAX_TREE_DEPTH) {
      if (!appendTree(entry.path, highlight,
                      prefix + (is_last ? "    " : "│   "), depth + 1, lines,
                      budget))
        return false;
    }
  }
  return true;
}

} // namespace

Element RecordView::directoryTree(const std::filesystem::path &directory,
                                  const std::filesystem::path &highlight) {
  Elements lines;
  std::string root_name = directory.filename().string();
  if (root_name.empty())
    root_name = directory.string();
  lines.push_back(text(root_name + "/") | bold | color(Color::Blue));

  int budget = MAX_TREE_ENTRIES;
  appendTree(directory, highlight, "", 0, lines, budget);
  return vbox(std::move(lines));
}

void RecordView::print(std::ostream &out, Element document) {
  document->ComputeRequirement();
  const int width = std::max(document->requirement().min_x, 1);
  const int height = std::max(document->requirement().min_y, 1);

  auto screen =
      Screen::Create(Dimension::Fixed(width), Dimension::Fixed(height));
  Render(screen, document);
  out << screen.ToString() << '\n';
}

void RecordView::showRecord(const FileRecord &record, std::size_t position,
                            std::size_t total) {
  auto header = vbox({
      hbox({text("Absolute path: ") | bold,
            text(record.getPath().string()) | color(Color::Yellow)}),
      hbox({text("Size: ") | bold, text(record.getSizeFormatted()),
            text("   Age: ") | bold, text(record.getAgeFormatted())}),
      text("File " + std::to_string(position) + " of " +
           std::to_string(total)) |
          dim,
  });

  auto card = vbox({header, separator(),
                    directoryTree(record.getParentDirectory(),
                                  record.getPath())}) |
              border;

  m_out << '\n';
  print(m_out, card);
}

void RecordView::showHelp() {
  m_out << "\nChoose from one of these options: \n";
  for (const auto &line : helpLines())
    m_out << line << '\n';
  m_out << '\n';
}

void RecordView::showPrompt() {
  m_out << "Please choose an option: " << shortcutList() << " ";
  m_out.flush();
}

void RecordView::showSuccess(const std::string &message) {
  m_out << "✓ " << message << '\n';
}

void RecordView::showWarning(const std::string &message) {
  m_out << "✗ " << message << '\n';
}

void RecordView::showNotice(const std::string &message) {
  m_out << message << '\n';
}

void RecordView::showSummary(const SessionSummary &summary) {
  auto row = [](const std::string &label, const std::string &value) {
    return hbox({text(label) | size(WIDTH, EQUAL, 22), text(value) | bold});
  };

  auto box = vbox({
                 text(summary.quit_early ? "Session ended early"
                                         : "All candidates reviewed") |
                     bold,
                 separator(),
                 row("Files presented", std::to_string(summary.presented)),
                 row("Files deleted", std::to_string(summary.deleted_files)),
                 row("Directories deleted",
                     std::to_string(summary.deleted_directories)),
                 row("Files skipped", std::to_string(summary.skipped_files)),
                 row("Directories skipped",
                     std::to_string(summary.skipped_directories)),
                 row("Pruned", std::to_string(summary.pruned)),
                 row("Gone before prompt", std::to_string(summary.vanished)),
                 row("Failed deletions", std::to_string(summary.failures)),
                 row("Space reclaimed", formatBytes(summary.bytes_reclaimed)),
             }) |
             border;

  m_out << '\n';
  print(m_out, box);
}
