#include "Config.h" // IWYU pragma: associated
#include "Parser.h"
#include "Types.h"

#include <cstddef>
#include <cstdlib>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace {

std::optional<std::string_view> environment(const char *name) {
  const char *value = std::getenv(name); // NOLINT: not thread safe
  return value ? std::optional<std::string_view>{value} : std::nullopt;
}

bool flag(const char *name, bool fallback) {
  auto value = environment(name);
  if (!value) {
    return fallback;
  }
  auto text = ask::trim(*value);
  if (text == "1" || text == "true") {
    return true;
  }
  if (text.empty() || text == "0" || text == "false") {
    return false;
  }
  throw ask::ConfigException{
      std::format("invalid {} value '{}', expected 0 or 1", name, *value)};
}

} // namespace

namespace ask {

Options Options::fromEnvironment() {
  Options options;
  options.decorate = flag("ASK_DECORATE", options.decorate);
  options.trace = flag("ASK_TRACE", options.trace);

  if (auto path = environment("ASK_HISTORY"); path && !path->empty()) {
    options.historyFile = std::string{*path};
  }

  if (auto size = environment("ASK_HISTORY_SIZE")) {
    auto parsed = Parser<std::size_t>::parse(trim(*size));
    if (!parsed) {
      throw ConfigException{std::format("invalid ASK_HISTORY_SIZE value '{}': {}",
                                        *size, parsed.error())};
    }
    if (*parsed == 0 || *parsed > maxHistorySize) {
      throw ConfigException{
          std::format("invalid ASK_HISTORY_SIZE value '{}': must be between 1 "
                      "and {}",
                      *size, maxHistorySize)};
    }
    options.historySize = *parsed;
  }
  return options;
}

} // namespace ask
