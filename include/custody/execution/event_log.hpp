#pragma once

#include <custody/execution/collaborators.hpp>
#include <custody/execution/ledger_store.hpp>
#include <custody/schema/event_kind.hpp>
#include <custody/schema/ledger_event.hpp>
#include <custody/schema/primitives.hpp>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace custody::execution {

/// Audit trail of committed transitions.
///
/// `record` stages a history row and an event inside the caller's scope, so
/// both vanish with an aborted operation. Observers are only notified through
/// `publish`, after the outermost scope has committed. An observer may call
/// back into the engine; events committed by such a call are queued and
/// delivered after the current event has reached every observer.
class event_log final {
 public:
  explicit event_log(ledger_store& store);

  void subscribe(event_sink_t sink);

  custody::schema::ledger_event_t record(
      custody::schema::event_kind_t kind,
      const custody::schema::record_key_t& key,
      const custody::schema::principal_id_t& actor,
      const custody::schema::principal_id_t& counterparty,
      const custody::schema::amount_t& amount,
      std::string reason,
      custody::schema::timestamp_milliseconds_t timestamp);

  void publish(const std::vector<custody::schema::ledger_event_t>& committed);

  /// Persisted events with ids in [from_id, to_id].
  std::vector<custody::schema::ledger_event_t> range(uint64_t from_id,
                                                     uint64_t to_id) const;

 private:
  ledger_store& store_;
  std::vector<event_sink_t> sinks_;
  std::deque<custody::schema::ledger_event_t> pending_;
  bool publishing_{false};
};

}  // namespace custody::execution
