#include "ri/session/EventTokenFilter.hpp"

namespace ri {

bool EventTokenFilter::accept(std::uint64_t token) {
  if (token == 0) return true;
  if (seen_.count(token)) return false;

  seen_.insert(token);
  order_.push_back(token);
  while (capacity_ > 0 && order_.size() > capacity_) {
    seen_.erase(order_.front());
    order_.pop_front();
  }
  return true;
}

void EventTokenFilter::clear() {
  order_.clear();
  seen_.clear();
}

} // namespace ri
