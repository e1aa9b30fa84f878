#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <stdexcept>
#include <string>

#include "filescanner.hpp"

/**
 * @brief Bad command line; main() prints the usage text and exits 1
 */
class UsageError : public std::invalid_argument {
public:
  explicit UsageError(const std::string &what) : std::invalid_argument(what) {}
};

/**
 * @brief Parsed command line: antichonk DIRECTORY ORDER_BY
 */
struct Options {
  std::string root;
  OrderBy order_by = OrderBy::Size;
  bool show_help = false;
};

/**
 * @brief Parses the command line
 *
 * "-h" or "--help" anywhere short-circuits to show_help. Otherwise exactly
 * two positional arguments are required, the second being "age" or "size".
 *
 * @throws UsageError on a missing, extra or unknown argument
 */
Options parseArguments(int argc, const char *const argv[]);

/** @brief Multi-line usage text */
std::string usageText(const std::string &program);

#endif // OPTIONS_HPP
