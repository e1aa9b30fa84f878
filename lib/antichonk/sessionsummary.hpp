#ifndef SESSIONSUMMARY_HPP
#define SESSIONSUMMARY_HPP

#include <cstddef>
#include <cstdint>

/**
 * @brief Counters collected over one interactive run
 */
struct SessionSummary {
  /** @brief Records shown to the operator */
  std::size_t presented = 0;

  std::size_t deleted_files = 0;
  std::size_t deleted_directories = 0;
  std::size_t skipped_files = 0;
  std::size_t skipped_directories = 0;

  /** @brief Records dropped because their directory was skipped or deleted */
  std::size_t pruned = 0;

  /** @brief Records dropped because the file was gone when reached */
  std::size_t vanished = 0;

  /** @brief Delete calls that failed or were refused */
  std::size_t failures = 0;

  std::uintmax_t bytes_reclaimed = 0;

  /** @brief The input stream ended before the sequence was exhausted */
  bool quit_early = false;
};

#endif // SESSIONSUMMARY_HPP
