#include "ReadLine.h" // IWYU pragma: associated
#include "Parser.h"

#include <readline/readline.h>
#include <readline/history.h>
#include <readline/tilde.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <memory>
#include <print>
#include <string>

namespace {
static auto guardedString(char *str) {
  return std::unique_ptr<char[], void (*)(void *)>(str, &std::free);
}

std::size_t historyCapacity(const ask::Options &options) noexcept {
  return std::clamp<std::size_t>(options.historySize, 1,
                                 ask::Options::maxHistorySize);
}

std::shared_ptr<const char> expandedPath(const ask::Options &options) {
  if (!options.historyFile) {
    return nullptr;
  }
  return std::shared_ptr<const char>{tilde_expand(options.historyFile->c_str()),
                                     std::free};
}
} // namespace

namespace ask {

namespace detail {

ReadLineHistoryInit::ReadLineHistoryInit() noexcept {
  static bool initialised = []() {
    using_history();
    return true;
  }();
  (void)initialised;
}

} // namespace detail

ReadLine::ReadLine(const Options &options)
    : capacity{historyCapacity(options)}, lines{capacity},
      historyFile{expandedPath(options)} {
  if (!historyFile) {
    return;
  }
  clear_history();
  stifle_history(static_cast<int>(capacity));
  if (auto err = read_history(historyFile.get()); err != 0 && err != ENOENT) {
    std::print(stderr, "cannot read history file {}: {}\n", historyFile.get(),
               std::strerror(err));
  }
  for (auto entry = history_list(); entry && *entry; ++entry) {
    lines.push((*entry)->line);
  }
  last = id;
}

// readline keeps a single global history; load this instance's into it.
void ReadLine::activate() {
  clear_history();
  stifle_history(static_cast<int>(capacity));
  lines.forEach([](auto &&line) { add_history(line.c_str()); });
  last = id;
}

std::expected<std::string, StreamError>
ReadLine::readLine(const std::string &prompt) {
  if (last != id) {
    activate();
  }

  auto &&line = guardedString(readline(prompt.c_str()));
  if (!line) {
    auto *input = rl_instream ? rl_instream : stdin;
    return std::unexpected{std::ferror(input) ? StreamError::IOFailure
                                              : StreamError::EndOfInput};
  }

  if (!trim(line.get()).empty()) {
    lines.push(line.get());
    add_history(line.get());
    if (historyFile) {
      if (auto err = write_history(historyFile.get()); err != 0) {
        std::print(stderr, "cannot write history file {}: {}\n",
                   historyFile.get(), std::strerror(err));
      }
    }
  }

  return line.get();
}

} // namespace ask
