#include "Parser.h" // IWYU pragma: associated

#include <expected>
#include <string>
#include <string_view>

namespace {
constexpr std::string_view whiteSpace{" \t\n\v\f\r"};
} // namespace

namespace ask {

std::string_view trim(std::string_view text) noexcept {
  auto first = text.find_first_not_of(whiteSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(whiteSpace);
  return text.substr(first, last - first + 1);
}

namespace detail {

std::string_view withoutPlus(std::string_view text) noexcept {
  if (text.size() > 1 && text[0] == '+' && text[1] != '+' && text[1] != '-') {
    text.remove_prefix(1);
  }
  return text;
}

} // namespace detail

std::expected<bool, std::string> Parser<bool>::parse(std::string_view text) {
  if (text == "true") {
    return true;
  }
  if (text == "false") {
    return false;
  }
  return std::unexpected{std::string{"expected 'true' or 'false'"}};
}

std::expected<char, std::string> Parser<char>::parse(std::string_view text) {
  if (text.size() != 1) {
    return std::unexpected{text.empty()
                               ? std::string{"empty input"}
                               : std::string{"more than one character"}};
  }
  return text.front();
}

} // namespace ask
