#pragma once

#include <custody/execution/engine.hpp>
#include <custody/schema/history_entry.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace custody::execution {

/// Lazy, oldest-first walk over a ledger's history in fixed-size pages.
///
/// The cursor holds only a position; entries are read on demand. Entries
/// appended after the walk started are picked up by later pages. `reset`
/// restarts the walk from the first entry.
class history_cursor final {
 public:
  history_cursor(const engine& engine, std::size_t page_size);

  /// Next page, empty once the end of the log has been reached.
  std::vector<custody::schema::history_entry_t> next();
  bool done() const;
  void reset();
  uint64_t position() const;

 private:
  const engine& engine_;
  std::size_t page_size_;
  uint64_t position_{0};
};

}  // namespace custody::execution
