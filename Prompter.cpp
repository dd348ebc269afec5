#include "Prompter.h" // IWYU pragma: associated
#include "Config.h"
#include "LineSource.h"
#include "ReadLine.h"

#include <unistd.h>

#include <format>
#include <iostream>
#include <memory>
#include <ostream>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace ask {

ErrorHandler diagnosticHandler(std::ostream &out) {
  return [&out](const ParseFailure &failure) {
    std::print(out, "'{}' is not a valid {} ({}), try again\n", failure.input,
               failure.type, failure.reason);
  };
}

std::string decorate(std::string_view prompt, std::string_view type) {
  if (prompt.empty()) {
    return std::format("({}): ", type);
  }
  return std::format("{} ({}): ", prompt, type);
}

Prompter::Prompter(LineSource &source, std::ostream &diagnostics,
                   Options options)
    : source{source}, diagnostics{diagnostics}, options{std::move(options)},
      defaultHandler{diagnosticHandler(diagnostics)} {}

Prompter &console() {
  static const Options options = Options::fromEnvironment();
  static const std::unique_ptr<LineSource> source =
      ::isatty(STDIN_FILENO)
          ? std::unique_ptr<LineSource>{std::make_unique<ReadLine>(options)}
          : std::make_unique<StreamLineSource>(std::cin, std::cout);
  static Prompter prompter{*source, std::cerr, options};
  return prompter;
}

} // namespace ask
