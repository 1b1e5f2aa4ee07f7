#include <custody/execution/history_cursor.hpp>

using namespace custody::schema;

namespace custody::execution {

history_cursor::history_cursor(const engine& engine,
                               const std::size_t page_size)
    : engine_{engine}, page_size_{page_size} {}

std::vector<history_entry_t> history_cursor::next() {
  if (page_size_ == 0) {
    return {};
  }
  auto page = engine_.history_page(position_, page_size_);
  position_ += page.size();
  return page;
}

bool history_cursor::done() const {
  return page_size_ == 0 || position_ >= engine_.history_size();
}

void history_cursor::reset() {
  position_ = 0;
}

uint64_t history_cursor::position() const {
  return position_;
}

}  // namespace custody::execution
