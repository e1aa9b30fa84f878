#include <filesystem>
#include <iostream>
#include <utility>

#include <unistd.h>

#include "filescanner.hpp"
#include "filesystemdeleter.hpp"
#include "options.hpp"
#include "session.hpp"

/**
 * @class Application
 * @brief Scans the target directory and runs the interactive session
 *
 * The scan completes before the first prompt: both orders need every file
 * of the tree. The session then reads decisions from standard input until
 * every candidate has been reviewed or input ends.
 */
class Application {
public:
  int run(const Options &options) {
    if (::geteuid() != 0) {
      std::cerr << "Warning: not running as root; some files may not be "
                   "deletable. Consider running with sudo."
                << std::endl;
    }

    FileScanner scanner;
    auto root = FileScanner::normalizeRoot(options.root);

    std::cout << "Scan directory: " << root.string() << " (order by "
              << toString(options.order_by) << ")" << std::endl;
    auto records = scanner.scanDirectory(root, options.order_by, [](int count) {
      std::cout << "\rScanning... " << count << " files" << std::flush;
    });
    std::cout << "\nScan finished. " << records.size() << " files found."
              << std::endl;

    FilesystemDeleter deleter;
    Session session(std::move(records), root, deleter, std::cin, std::cout);
    session.run();
    return 0;
  }
};

int main(int argc, char *argv[]) {
  const std::string program =
      argc > 0 ? std::filesystem::path(argv[0]).filename().string()
               : "antichonk";

  Options options;
  try {
    options = parseArguments(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n\n" << usageText(program);
    return 1;
  }

  if (options.show_help) {
    std::cout << usageText(program);
    return 0;
  }

  try {
    Application app;
    return app.run(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
