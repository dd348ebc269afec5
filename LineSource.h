#ifndef INCLUDE_LINESOURCE_H
#define INCLUDE_LINESOURCE_H

#include "Types.h"

#include <expected>
#include <iosfwd>
#include <string>

namespace ask {

class LineSource {
public:
  // Show the prompt (nothing for an empty one) and read a single line,
  // without its terminator.  An empty line is a value, not an error.
  virtual std::expected<std::string, StreamError>
  readLine(const std::string &prompt) = 0;

  virtual ~LineSource() = default;

  LineSource(const LineSource &) = delete;
  LineSource(LineSource &&) = delete;
  LineSource &operator=(const LineSource &) = delete;
  LineSource &operator=(LineSource &&) = delete;

protected:
  LineSource() = default;
};

class StreamLineSource : public LineSource {
public:
  StreamLineSource(std::istream &in, std::ostream &out) noexcept
      : in{in}, out{out} {}

  std::expected<std::string, StreamError>
  readLine(const std::string &prompt) override;

private:
  std::istream &in;
  std::ostream &out;
};

} // namespace ask

#endif // INCLUDE_LINESOURCE_H
