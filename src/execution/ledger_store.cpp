#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <custody/common/critical.hpp>
#include <custody/execution/ledger_store.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace custody::schema;

namespace custody::execution {

ledger_store::scope::scope(ledger_store& store, const std::size_t depth)
    : store_{&store}, depth_{depth} {}

ledger_store::scope::scope(scope&& other) noexcept
    : store_{other.store_}, depth_{other.depth_}, open_{other.open_} {
  other.open_ = false;
}

ledger_store::scope::~scope() {
  if (open_) {
    store_->rollback_frame(depth_);
  }
}

std::vector<ledger_event_t> ledger_store::scope::commit() {
  if (!open_) {
    custody::common::critical("ledger scope committed twice");
  }
  open_ = false;
  return store_->commit_frame(depth_);
}

ledger_store::ledger_store(encoder_t& encoder,
                           storage_t& storage,
                           const ledger_id_t& ledger)
    : encoder_{encoder}, storage_{storage}, ledger_{ledger} {}

ledger_store::scope ledger_store::begin() {
  frames_.emplace_back();
  return scope{*this, frames_.size()};
}

std::size_t ledger_store::depth() const {
  return frames_.size();
}

const ledger_id_t& ledger_store::ledger_id() const {
  return ledger_;
}

ledger_store::frame& ledger_store::top() {
  if (frames_.empty()) {
    custody::common::critical("ledger write outside of an operation scope");
  }
  return frames_.back();
}

std::optional<bytes_t> ledger_store::read_bytes(const bytes_t& key) const {
  for (auto frame = std::rbegin(frames_); frame != std::rend(frames_);
       ++frame) {
    auto found = frame->writes.find(key);
    if (found != std::end(frame->writes)) {
      return found->second;
    }
  }
  return storage_.get_bytes(bytes_view_t{key.data(), key.size()});
}

std::vector<ledger_event_t> ledger_store::commit_frame(
    const std::size_t depth) {
  if (depth != frames_.size()) {
    custody::common::critical("ledger scope committed out of order");
  }
  auto committed = std::move(frames_.back());
  frames_.pop_back();

  if (!frames_.empty()) {
    auto& parent = frames_.back();
    for (auto& [key, value] : committed.writes) {
      parent.writes[key] = std::move(value);
    }
    std::move(std::begin(committed.events), std::end(committed.events),
              std::back_inserter(parent.events));
    return {};
  }

  auto entries = std::vector<custody::storage::key_value_entry_t>{};
  entries.reserve(committed.writes.size());
  for (auto& [key, value] : committed.writes) {
    entries.emplace_back(key, std::move(value));
  }
  if (!entries.empty()) {
    storage_.write(entries);
  }
  spdlog::debug("Committed {} ledger write(s) and {} event(s)", entries.size(),
                committed.events.size());
  return std::move(committed.events);
}

void ledger_store::rollback_frame(const std::size_t depth) {
  if (depth != frames_.size()) {
    custody::common::critical("ledger scope rolled back out of order");
  }
  spdlog::debug("Discarding {} staged ledger write(s) at depth {}",
                frames_.back().writes.size(), depth);
  frames_.pop_back();
}

std::optional<record_state_t> ledger_store::get(
    const record_key_t& key) const {
  return read<record_state_t>(key::make_record_key(encoder_, ledger_, key));
}

void ledger_store::put(const record_state_t& record) {
  write(key::make_record_key(encoder_, ledger_, record.key), record);
}

std::optional<principal_id_t> ledger_store::owner() const {
  return read<principal_id_t>(key::make_owner_key(encoder_, ledger_));
}

void ledger_store::set_owner(const principal_id_t& owner) {
  write(key::make_owner_key(encoder_, ledger_), owner);
}

bool ledger_store::is_member(const principal_id_t& principal) const {
  return read<bool>(key::make_member_key(encoder_, ledger_, principal))
      .value_or(false);
}

void ledger_store::set_member(const principal_id_t& principal,
                              const bool member) {
  write(key::make_member_key(encoder_, ledger_, principal), member);
}

amount_t ledger_store::custodied() const {
  return read<amount_t>(key::make_custodied_key(encoder_, ledger_))
      .value_or(amount_t{0});
}

void ledger_store::set_custodied(const amount_t& amount) {
  write(key::make_custodied_key(encoder_, ledger_), amount);
}

void ledger_store::index(const record_state_t& record) {
  auto scopes = std::array{
      key::index_scope_t{std::nullopt, std::nullopt},
      key::index_scope_t{record.kind, record.parent}};
  for (const auto& scope : scopes) {
    auto size = index_size(scope);
    write(key::make_index_key(encoder_, ledger_, scope, size), record.key);
    write(key::make_index_size_key(encoder_, ledger_, scope), size + 1);
  }
}

uint64_t ledger_store::index_size(const key::index_scope_t& scope) const {
  return read<uint64_t>(key::make_index_size_key(encoder_, ledger_, scope))
      .value_or(0);
}

std::optional<record_key_t> ledger_store::index_at(
    const key::index_scope_t& scope,
    const uint64_t ordinal) const {
  return read<record_key_t>(
      key::make_index_key(encoder_, ledger_, scope, ordinal));
}

uint64_t ledger_store::append(history_entry_t entry) {
  auto sequence = history_size();
  entry.sequence = sequence;
  write(key::make_history_key(encoder_, ledger_, sequence), entry);
  write(key::make_history_sequence_key(encoder_, ledger_), sequence + 1);
  return sequence;
}

uint64_t ledger_store::history_size() const {
  return read<uint64_t>(key::make_history_sequence_key(encoder_, ledger_))
      .value_or(0);
}

std::optional<history_entry_t> ledger_store::history_at(
    const uint64_t sequence) const {
  return read<history_entry_t>(
      key::make_history_key(encoder_, ledger_, sequence));
}

std::vector<history_entry_t> ledger_store::recent(const std::size_t n) const {
  auto size = history_size();
  auto count = std::min<uint64_t>(n, size);
  auto entries = std::vector<history_entry_t>{};
  entries.reserve(static_cast<std::size_t>(count));
  for (auto i = uint64_t{0}; i < count; ++i) {
    auto entry = history_at(size - 1 - i);
    if (!entry) {
      custody::common::critical("history log has a gap");
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

std::vector<history_entry_t> ledger_store::history_page(
    const uint64_t offset,
    const std::size_t limit) const {
  auto size = history_size();
  auto entries = std::vector<history_entry_t>{};
  for (auto sequence = offset; sequence < size && entries.size() < limit;
       ++sequence) {
    auto entry = history_at(sequence);
    if (!entry) {
      custody::common::critical("history log has a gap");
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

uint64_t ledger_store::stage_event(ledger_event_t& event) {
  auto event_id = last_event_id() + 1;
  event.event_id = event_id;
  write(key::make_event_key(encoder_, ledger_, event_id), event);
  write(key::make_event_sequence_key(encoder_, ledger_), event_id);
  top().events.push_back(event);
  return event_id;
}

uint64_t ledger_store::last_event_id() const {
  return read<uint64_t>(key::make_event_sequence_key(encoder_, ledger_))
      .value_or(0);
}

std::optional<ledger_event_t> ledger_store::event_at(
    const uint64_t event_id) const {
  return read<ledger_event_t>(key::make_event_key(encoder_, ledger_, event_id));
}

}  // namespace custody::execution
