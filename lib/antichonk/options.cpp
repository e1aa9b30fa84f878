#include "options.hpp"

#include <vector>

Options parseArguments(int argc, const char *const argv[]) {
  Options options;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      return options;
    }
    if (arg.size() > 1 && arg[0] == '-') {
      throw UsageError("Unknown option: " + arg);
    }
    positional.push_back(arg);
  }

  if (positional.size() < 2) {
    throw UsageError("Expected DIRECTORY and ORDER_BY");
  }
  if (positional.size() > 2) {
    throw UsageError("Unexpected argument: " + positional[2]);
  }

  auto order = parseOrderBy(positional[1]);
  if (!order) {
    throw UsageError("ORDER_BY must be 'age' or 'size', got: " + positional[1]);
  }

  options.root = positional[0];
  options.order_by = *order;
  return options;
}

std::string usageText(const std::string &program) {
  return "Interactive program to delete files based on certain "
         "characteristics\n"
         "usage: sudo " +
         program +
         " DIRECTORY ORDER_BY(age|size)\n"
         "\n"
         "  age   stalest files first\n"
         "  size  largest files first\n";
}
