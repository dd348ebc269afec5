#ifndef INCLUDE_PROMPTER_H
#define INCLUDE_PROMPTER_H

#include "Config.h"
#include "LineSource.h"
#include "Parser.h"
#include "Types.h"

#include <cstddef>
#include <future>
#include <mutex>
#include <ostream>
#include <print>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace ask {

// The default error handler: tells the user what was wrong with the input
// on `out`.
ErrorHandler diagnosticHandler(std::ostream &out);

std::string decorate(std::string_view prompt, std::string_view type);

// Asks for values on a line source until they parse.  Parse failures are
// handed to an error handler and the prompt is shown again, with no limit on
// the number of attempts.  The end of the input, or a failure to read it,
// ends a request with a StreamException.
class Prompter {
public:
  Prompter(LineSource &source, std::ostream &diagnostics,
           Options options = {});

  template <Parsable T>
  T request(const std::string &prompt, const ErrorHandler &onError = {});

  // Bind the value to `destination`, so that several reads chain in one
  // expression.  They are processed left to right.
  template <Parsable T>
  Prompter &read(T &destination, const std::string &prompt,
                 const ErrorHandler &onError = {}) {
    destination = request<T>(prompt, onError);
    return *this;
  }

  // Runs the requests one after another, in the order given.  A stream
  // failure abandons the ones that did not run yet, and the values already
  // read are lost with the unfinished tuple; chain read() calls to keep them.
  template <Parsable... TS>
  std::tuple<TS...> requestAll(const Request<TS> &...requests) {
    // Braced initialisation evaluates the requests left to right.
    return std::tuple<TS...>{request<TS>(requests.prompt, requests.onError)...};
  }

  // As request(), but holds the prompter for the whole exchange, so callers
  // on other threads never interleave with it.
  template <Parsable T>
  T safeRequest(const std::string &prompt, const ErrorHandler &onError = {}) {
    std::scoped_lock lock{mutex};
    return request<T>(prompt, onError);
  }

  template <Parsable T>
  std::future<T> requestAsync(std::string prompt, ErrorHandler onError = {}) {
    return std::async(std::launch::async,
                      [this, prompt = std::move(prompt),
                       onError = std::move(onError)]() {
                        return safeRequest<T>(prompt, onError);
                      });
  }

  const Options &config() const noexcept { return options; }

private:
  LineSource &source;
  std::ostream &diagnostics;
  const Options options;
  const ErrorHandler defaultHandler;
  std::mutex mutex;
};

template <Parsable T>
T Prompter::request(const std::string &prompt, const ErrorHandler &onError) {
  const auto type = typeName<T>();
  const auto shown = options.decorate ? decorate(prompt, type) : prompt;
  const auto &handler = onError ? onError : defaultHandler;

  for (std::size_t attempt = 1;; ++attempt) {
    if (options.trace) {
      std::print(diagnostics, "REQUEST: {} attempt {}\n", type, attempt);
    }

    auto line = source.readLine(shown);
    if (!line) {
      throw StreamException{line.error()};
    }

    auto text = trim(*line);
    auto value = Parser<T>::parse(text);
    if (value) {
      return std::move(*value);
    }
    handler(ParseFailure{std::string{text}, type, std::move(value.error())});
  }
}

// The process wide prompter, reading from the console.
Prompter &console();

template <Parsable T>
T request(const std::string &prompt, const ErrorHandler &onError = {}) {
  return console().safeRequest<T>(prompt, onError);
}

} // namespace ask

#endif // INCLUDE_PROMPTER_H
