#ifndef INCLUDE_READLINE_H
#define INCLUDE_READLINE_H

#include "Config.h"
#include "LineSource.h"
#include "Types.h"

#include <concepts>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector> // IWYU pragma: keep
// IWYU pragma: no_include <__vector/vector.h>

namespace ask {

namespace detail {

class ReadLineHistoryInit {
public:
  ReadLineHistoryInit() noexcept;
};

// Keeps the most recent `capacity` entries, oldest first.
template <typename VALUE> class CyclicBuffer {
public:
  explicit CyclicBuffer(std::size_t capacity)
      : data(capacity ? capacity : 1) {}

  template <typename T>
    requires std::convertible_to<T, VALUE>
  void push(T &&elt) {
    data[head] = std::forward<T>(elt);
    head = (head + 1) % data.size();
    if (count < data.size()) {
      ++count;
    }
  }

  template <typename FN> void forEach(FN &&fn) const {
    auto first = (head + data.size() - count) % data.size();
    for (std::size_t i = 0; i < count; ++i) {
      fn(data[(first + i) % data.size()]);
    }
  }

  bool empty() const noexcept { return count == 0; }
  std::size_t size() const noexcept { return count; }

private:
  std::vector<VALUE> data;
  std::size_t head{0};
  std::size_t count{0};
};

} // namespace detail

// GNU readline backed line source.  Every instance keeps its own history,
// which is swapped into readline's global one whenever a different instance
// reads a line.
class ReadLine : detail::ReadLineHistoryInit, public LineSource {
public:
  explicit ReadLine(const Options &options = {});

  std::expected<std::string, StreamError>
  readLine(const std::string &prompt) override;

  std::size_t historySize() const noexcept { return lines.size(); }

private:
  void activate();

  const std::size_t capacity;
  inline static std::size_t counter{};
  inline static std::size_t last{};
  detail::CyclicBuffer<std::string> lines;
  const std::shared_ptr<const char> historyFile;
  std::size_t id{++counter};
};

} // namespace ask

#endif // INCLUDE_READLINE_H
