#include "LineSource.h" // IWYU pragma: associated

#include <expected>
#include <istream>
#include <ostream>
#include <string>

namespace ask {

std::expected<std::string, StreamError>
StreamLineSource::readLine(const std::string &prompt) {
  if (!prompt.empty()) {
    out << prompt;
  }
  out.flush();

  std::string line;
  if (!std::getline(in, line)) {
    return std::unexpected{in.bad() ? StreamError::IOFailure
                                    : StreamError::EndOfInput};
  }
  return line;
}

} // namespace ask
