#include "Types.h" // IWYU pragma: associated

#include <string_view>

namespace ask {

std::string_view describe(StreamError error) noexcept {
  switch (error) {
  case StreamError::EndOfInput:
    return "end of input";
  case StreamError::IOFailure:
    return "input failure";
  }
  return "unknown stream error";
}

} // namespace ask
