#ifndef INCLUDE_PARSER_H
#define INCLUDE_PARSER_H

#include <charconv>
#include <concepts>
#include <cstddef>
#include <expected>
#include <format>
#include <istream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace ask {

// Strip surrounding ASCII white space, line terminators included.
std::string_view trim(std::string_view text) noexcept;

// Specialise for a type to make it requestable.  A specialisation provides
//
//   static std::expected<T, std::string> parse(std::string_view);
//
// and, optionally, a `static constexpr std::string_view name` that is shown
// in diagnostics.
template <typename T> struct Parser {};

template <typename T>
concept Parsable = requires(std::string_view text) {
  { Parser<T>::parse(text) } -> std::same_as<std::expected<T, std::string>>;
};

template <typename T> std::string typeName() {
  if constexpr (requires { Parser<T>::name; }) {
    return std::string{Parser<T>::name};
  } else {
    return "value";
  }
}

namespace detail {

template <typename T, typename... OTHERS>
concept OneOf = (std::same_as<T, OTHERS> || ...);

template <typename T>
concept Integer = std::integral<T> && !OneOf<T, bool, char, wchar_t, char8_t,
                                             char16_t, char32_t>;

template <typename T>
concept Extractable = std::default_initializable<T> &&
                      requires(std::istream &in, T &value) { in >> value; };

template <Integer T> constexpr std::string_view integerName() noexcept {
  if constexpr (std::same_as<T, signed char>) return "signed char";
  else if constexpr (std::same_as<T, unsigned char>) return "unsigned char";
  else if constexpr (std::same_as<T, short>) return "short";
  else if constexpr (std::same_as<T, unsigned short>) return "unsigned short";
  else if constexpr (std::same_as<T, int>) return "int";
  else if constexpr (std::same_as<T, unsigned>) return "unsigned";
  else if constexpr (std::same_as<T, long>) return "long";
  else if constexpr (std::same_as<T, unsigned long>) return "unsigned long";
  else if constexpr (std::same_as<T, long long>) return "long long";
  else if constexpr (std::same_as<T, unsigned long long>)
    return "unsigned long long";
  else return "integer";
}

template <std::floating_point T>
constexpr std::string_view floatingName() noexcept {
  if constexpr (std::same_as<T, float>) return "float";
  else if constexpr (std::same_as<T, double>) return "double";
  else return "long double";
}

// std::from_chars takes no leading '+'; drop a single one, but never expose
// a second sign behind it.
std::string_view withoutPlus(std::string_view text) noexcept;

template <typename T>
std::expected<T, std::string> fromChars(std::string_view text) {
  if (text.empty()) {
    return std::unexpected{std::string{"empty input"}};
  }
  auto digits = withoutPlus(text);
  auto *const end = digits.data() + digits.size();
  T value{};
  auto [ptr, ec] = std::from_chars(digits.data(), end, value);
  if (ec == std::errc::result_out_of_range) {
    return std::unexpected{std::string{"out of range"}};
  }
  if (ec != std::errc{} || ptr != end) {
    return std::unexpected{std::format("unexpected character '{}'", *ptr)};
  }
  return value;
}

} // namespace detail

template <detail::Integer T> struct Parser<T> {
  static constexpr std::string_view name{detail::integerName<T>()};

  static std::expected<T, std::string> parse(std::string_view text) {
    return detail::fromChars<T>(text);
  }
};

template <std::floating_point T> struct Parser<T> {
  static constexpr std::string_view name{detail::floatingName<T>()};

  static std::expected<T, std::string> parse(std::string_view text) {
    return detail::fromChars<T>(text);
  }
};

template <> struct Parser<bool> {
  static constexpr std::string_view name{"bool"};
  static std::expected<bool, std::string> parse(std::string_view text);
};

template <> struct Parser<char> {
  static constexpr std::string_view name{"char"};
  static std::expected<char, std::string> parse(std::string_view text);
};

template <> struct Parser<std::string> {
  static constexpr std::string_view name{"string"};
  static std::expected<std::string, std::string> parse(std::string_view text) {
    return std::string{text};
  }
};

// Anything else that can be extracted from a stream, as long as the
// extraction consumes all of the text.
template <typename T>
  requires(!std::is_arithmetic_v<T> && detail::Extractable<T>)
struct Parser<T> {
  static std::expected<T, std::string> parse(std::string_view text) {
    std::istringstream in{std::string{text}};
    T value{};
    if (!(in >> value)) {
      return std::unexpected{std::string{"unreadable input"}};
    }
    in >> std::ws;
    if (!in.eof()) {
      return std::unexpected{
          std::format("unexpected trailing text '{}'",
                      text.substr(static_cast<std::size_t>(in.tellg())))};
    }
    return value;
  }
};

} // namespace ask

#endif // INCLUDE_PARSER_H
