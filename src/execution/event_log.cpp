#include <spdlog/spdlog.h>
#include <algorithm>
#include <custody/execution/event_log.hpp>
#include <exception>
#include <utility>

using namespace custody::schema;

namespace custody::execution {

event_log::event_log(ledger_store& store) : store_{store} {}

void event_log::subscribe(event_sink_t sink) {
  sinks_.push_back(std::move(sink));
}

ledger_event_t event_log::record(const event_kind_t kind,
                                 const record_key_t& key,
                                 const principal_id_t& actor,
                                 const principal_id_t& counterparty,
                                 const amount_t& amount,
                                 std::string reason,
                                 const timestamp_milliseconds_t timestamp) {
  store_.append(history_entry_t{.kind = kind,
                                .key = key,
                                .actor = actor,
                                .counterparty = counterparty,
                                .amount = amount,
                                .reason = reason,
                                .timestamp = timestamp});

  auto event = ledger_event_t{.kind = kind,
                              .key = key,
                              .principals = {actor},
                              .amount = amount,
                              .reason = std::move(reason),
                              .timestamp = timestamp};
  if (!is_null(counterparty) && counterparty != actor) {
    event.principals.push_back(counterparty);
  }
  store_.stage_event(event);
  return event;
}

void event_log::publish(const std::vector<ledger_event_t>& committed) {
  pending_.insert(pending_.end(), committed.begin(), committed.end());
  if (publishing_) {
    return;
  }

  publishing_ = true;
  struct publishing_guard final {
    bool& flag;
    ~publishing_guard() { flag = false; }
  } guard{publishing_};

  while (!pending_.empty()) {
    auto event = std::move(pending_.front());
    pending_.pop_front();
    spdlog::debug("Event {} {} amount={}", event.event_id,
                  to_string(event.kind), event.amount.str());
    // Observers may subscribe while being notified.
    for (auto i = std::size_t{0}; i < sinks_.size(); ++i) {
      auto sink = sinks_[i];
      try {
        sink(event);
      } catch (const std::exception& ex) {
        spdlog::error("Event observer failed on event {}: {}", event.event_id,
                      ex.what());
      }
    }
  }
}

std::vector<ledger_event_t> event_log::range(const uint64_t from_id,
                                             const uint64_t to_id) const {
  auto events = std::vector<ledger_event_t>{};
  auto last = std::min(to_id, store_.last_event_id());
  for (auto id = std::max<uint64_t>(from_id, 1); id <= last; ++id) {
    if (auto event = store_.event_at(id)) {
      events.push_back(std::move(*event));
    }
  }
  return events;
}

}  // namespace custody::execution
