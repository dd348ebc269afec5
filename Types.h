#ifndef INCLUDE_TYPES_H
#define INCLUDE_TYPES_H

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ask {

enum class StreamError {
  EndOfInput,
  IOFailure,
};

std::string_view describe(StreamError error) noexcept;

// A parse attempt that did not produce a value.
struct ParseFailure {
  std::string input;
  std::string type;
  std::string reason;
};

// Called once for every failed parse attempt, before the prompt is shown
// again.  An empty handler stands for the prompter's default one.
using ErrorHandler = std::function<void(const ParseFailure &)>;

template <typename T> struct Request {
  std::string prompt;
  ErrorHandler onError{};
};

class StreamException : public std::runtime_error {
public:
  explicit StreamException(StreamError e)
      : std::runtime_error{std::string{describe(e)}}, err{e} {}

  StreamError error() const noexcept { return err; }

private:
  StreamError err;
};

class ConfigException : public std::runtime_error {
public:
  explicit ConfigException(const std::string &str) : std::runtime_error{str} {}
};

} // namespace ask

#endif // INCLUDE_TYPES_H
