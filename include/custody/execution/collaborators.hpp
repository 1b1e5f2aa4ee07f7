#pragma once

#include <custody/schema/ledger_event.hpp>
#include <custody/schema/primitives.hpp>
#include <functional>

namespace custody::execution {

/// Current wall-clock time in milliseconds.
using clock_source_t = std::function<custody::schema::timestamp_milliseconds_t()>;

/// Move `amount` out of custody to `recipient`; `false` reports failure.
///
/// The callee may call back into the engine before returning.
using value_transfer_t =
    std::function<bool(const custody::schema::principal_id_t& recipient,
                       const custody::schema::amount_t& amount)>;

/// Observer of committed ledger events.
using event_sink_t = std::function<void(const custody::schema::ledger_event_t&)>;

}  // namespace custody::execution
