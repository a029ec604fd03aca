#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_set>

namespace ri {

// Remembers the last `capacity` event tokens so the same native event is
// never processed twice. Token 0 is untracked and always accepted.
class EventTokenFilter {
public:
  explicit EventTokenFilter(std::size_t capacity = 256) : capacity_(capacity) {}

  // True if the token is new (and records it).
  bool accept(std::uint64_t token);

  bool seen(std::uint64_t token) const { return token != 0 && seen_.count(token) != 0; }
  std::size_t size() const { return order_.size(); }
  void clear();

private:
  std::size_t capacity_;
  std::deque<std::uint64_t> order_;
  std::unordered_set<std::uint64_t> seen_;
};

} // namespace ri
