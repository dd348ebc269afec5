#ifndef INCLUDE_CONFIG_H
#define INCLUDE_CONFIG_H

#include <cstddef>
#include <optional>
#include <string>

namespace ask {

struct Options {
  // Show "<prompt> (<type>): " rather than the prompt as given.
  bool decorate{false};
  // Report every attempt on the diagnostic stream.
  bool trace{false};
  std::optional<std::string> historyFile{};
  std::size_t historySize{100};

  static constexpr std::size_t maxHistorySize{10000};

  // ASK_DECORATE, ASK_TRACE, ASK_HISTORY and ASK_HISTORY_SIZE; unset
  // variables keep the defaults.  Throws ConfigException on bad values,
  // including a history size outside [1, maxHistorySize].
  static Options fromEnvironment();
};

} // namespace ask

#endif // INCLUDE_CONFIG_H
