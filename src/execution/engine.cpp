#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <custody/common/critical.hpp>
#include <custody/execution/commitment.hpp>
#include <custody/execution/engine.hpp>
#include <custody/schema/key/engine_keys.hpp>
#include <utility>

using namespace custody::schema;

namespace {

error_code_t fail(operation_result_t& result,
                  const error_code_t code,
                  const std::string_view message) {
  result.code = code;
  result.log = std::string{message};
  return code;
}

bool is_transferable(const record_kind_t kind) {
  return kind == record_kind_t::warranty || kind == record_kind_t::gift_card;
}

bool is_voidable(const record_kind_t kind) {
  return kind == record_kind_t::warranty ||
         kind == record_kind_t::registry_item ||
         kind == record_kind_t::gift_card || kind == record_kind_t::event;
}

std::string key_text(const record_key_t& key) {
  return to_hex(bytes_view_t{key.data(), key.size()});
}

}  // namespace

namespace custody::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               engine_options options,
               clock_source_t clock,
               value_transfer_t transfer)
    : options_{std::move(options)},
      encoder_{encoder},
      clock_{std::move(clock)},
      store_{encoder, storage, options_.ledger_id},
      access_{store_},
      disbursement_{store_, std::move(transfer)},
      events_{store_} {
  auto lock = std::scoped_lock{mutex_};
  if (!clock_) {
    custody::common::critical("Ledger engine requires a clock source");
  }
  if (options_.history_page_limit == 0) {
    spdlog::warn("History page limit is 0; paginated reads return nothing");
  }
  if (!store_.owner().has_value()) {
    if (is_null(options_.owner)) {
      custody::common::critical("Ledger has no owner and none was configured");
    }
    auto scope = store_.begin();
    access_.initialize(options_.owner);
    scope.commit();
  }
  spdlog::info("Ledger {} ready with {} history entr(ies)",
               to_hex(options_.ledger_id), store_.history_size());
}

operation_result_t engine::run(const std::string_view codespace,
                               const step_t& step) {
  auto lock = std::scoped_lock{mutex_};
  auto result = operation_result_t{};
  result.codespace = std::string{codespace};

  auto scope = store_.begin();
  result.code = step(result);
  if (result.code != error_code_t::ok) {
    result.events.clear();
    spdlog::warn("{} rejected with {}: {}", codespace, to_string(result.code),
                 result.log);
    return result;
  }

  auto committed = scope.commit();
  events_.publish(committed);
  return result;
}

void engine::emit(operation_result_t& result,
                  const event_kind_t kind,
                  const record_key_t& key,
                  const principal_id_t& actor,
                  const principal_id_t& counterparty,
                  const amount_t& amount,
                  std::string reason,
                  const timestamp_milliseconds_t now) {
  result.events.push_back(events_.record(kind, key, actor, counterparty, amount,
                                         std::move(reason), now));
}

error_code_t engine::resolve_key(operation_result_t& result,
                                 const bytes_t& secret,
                                 const std::optional<record_key_t>& key,
                                 record_key_t& resolved,
                                 bool& proven) const {
  proven = false;
  if (!secret.empty()) {
    auto derived = make_commitment(bytes_view_t{secret.data(), secret.size()});
    if (key.has_value() &&
        !commitments_equal(bytes_view_t{derived.data(), derived.size()},
                           bytes_view_t{key->data(), key->size()})) {
      return fail(result, error_code_t::unauthorized,
                  "secret does not match commitment");
    }
    resolved = std::move(derived);
    proven = true;
    return error_code_t::ok;
  }
  if (!key.has_value() || key->empty()) {
    return fail(result, error_code_t::invalid_input,
                "either a secret or a record key is required");
  }
  resolved = *key;
  return error_code_t::ok;
}

bool engine::is_expired(const record_state_t& record,
                        const timestamp_milliseconds_t now) const {
  return record.expires_at.has_value() && now >= *record.expires_at;
}

record_view_t engine::make_view(const record_state_t& record,
                                const timestamp_milliseconds_t now) const {
  auto status = record.status;
  if (is_live(status) && is_expired(record, now)) {
    status = record_status_t::expired;
  }
  return record_view_t{.key = record.key,
                       .kind = record.kind,
                       .valid = is_live(status),
                       .status = status,
                       .status_text = std::string{to_string(status)},
                       .beneficiary = record.owner,
                       .depositor = record.depositor,
                       .value = record.value,
                       .unit_value = record.unit_value,
                       .expires_at = record.expires_at,
                       .capacity = record.capacity,
                       .admitted = record.admitted,
                       .has_checked_in = record.has_checked_in,
                       .payload = record.payload};
}

operation_result_t engine::transfer_ownership(const call_context_t& context,
                                              const principal_id_t& new_owner) {
  return run("custody.transfer_ownership", [&](operation_result_t& result) {
    auto previous = access_.owner();
    auto code = access_.transfer_ownership(context.caller, new_owner);
    if (code != error_code_t::ok) {
      return fail(result, code, "ownership transfer refused");
    }
    emit(result, event_kind_t::ownership_transferred, {}, previous, new_owner,
         amount_t{0}, "", clock_());
    spdlog::info("Ledger {} ownership moved to {}", to_hex(options_.ledger_id),
                 to_hex(new_owner));
    return error_code_t::ok;
  });
}

operation_result_t engine::add_member(const call_context_t& context,
                                      const principal_id_t& member) {
  return run("custody.add_member", [&](operation_result_t& result) {
    auto code = access_.add_member(context.caller, member);
    if (code != error_code_t::ok) {
      return fail(result, code, "member not added");
    }
    emit(result, event_kind_t::membership_changed, make_bytes(member),
         context.caller, member, amount_t{0}, "added", clock_());
    return error_code_t::ok;
  });
}

operation_result_t engine::remove_member(const call_context_t& context,
                                         const principal_id_t& member) {
  return run("custody.remove_member", [&](operation_result_t& result) {
    auto code = access_.remove_member(context.caller, member);
    if (code != error_code_t::ok) {
      return fail(result, code, "member not removed");
    }
    emit(result, event_kind_t::membership_changed, make_bytes(member),
         context.caller, member, amount_t{0}, "removed", clock_());
    return error_code_t::ok;
  });
}

operation_result_t engine::create(const call_context_t& context,
                                  const create_record_t& op) {
  return run("custody.create", [&](operation_result_t& result) {
    auto now = clock_();
    switch (op.kind) {
      case record_kind_t::gift_card:
        break;
      case record_kind_t::attendee:
        return fail(result, error_code_t::invalid_input,
                    "attendee records are created by rsvp");
      default:
        if (auto code = access_.require_owner(context.caller);
            code != error_code_t::ok) {
          return fail(result, code, "only the owner may create this record");
        }
        break;
    }
    if (op.key.empty()) {
      return fail(result, error_code_t::invalid_input, "record key is empty");
    }
    if (store_.get(op.key).has_value()) {
      return fail(result, error_code_t::already_exists,
                  "record key is already assigned");
    }

    auto record = record_state_t{.kind = op.kind,
                                 .key = op.key,
                                 .status = record_status_t::active,
                                 .owner = context.caller,
                                 .depositor = context.caller,
                                 .unit_value = op.unit_value,
                                 .created_at = now,
                                 .capacity = op.capacity,
                                 .access = op.access,
                                 .payload = op.payload};
    if (op.duration > std::numeric_limits<timestamp_milliseconds_t>::max() -
                          now) {
      return fail(result, error_code_t::invalid_input,
                  "duration overflows the expiry timestamp");
    }
    if (op.duration > 0) {
      record.expires_at = now + op.duration;
    }
    if (op.kind != record_kind_t::gift_card && context.attached_value != 0) {
      return fail(result, error_code_t::invalid_input,
                  "this record kind does not accept value on creation");
    }
    if (op.kind != record_kind_t::registry_item && op.parent.has_value()) {
      return fail(result, error_code_t::invalid_input,
                  "only registry items have a parent");
    }

    switch (op.kind) {
      case record_kind_t::warranty:
        if (is_null(op.beneficiary)) {
          return fail(result, error_code_t::invalid_input,
                      "warranty needs a beneficiary");
        }
        if (op.duration == 0) {
          return fail(result, error_code_t::invalid_input,
                      "warranty needs a positive duration");
        }
        record.owner = op.beneficiary;
        break;
      case record_kind_t::registry_item: {
        if (op.unit_value == 0) {
          return fail(result, error_code_t::invalid_input,
                      "item price must be positive");
        }
        if (op.payload.empty()) {
          return fail(result, error_code_t::invalid_input,
                      "item name is empty");
        }
        if (!op.parent.has_value()) {
          return fail(result, error_code_t::invalid_input,
                      "item needs a registry pool");
        }
        auto pool = store_.get(*op.parent);
        if (!pool || pool->kind != record_kind_t::pool) {
          return fail(result, error_code_t::not_found,
                      "registry pool does not exist");
        }
        record.parent = op.parent;
        break;
      }
      case record_kind_t::gift_card:
        if (op.key.size() != std::tuple_size_v<hash32_t>) {
          return fail(result, error_code_t::invalid_input,
                      "gift card key must be a 32-byte commitment");
        }
        if (context.attached_value == 0) {
          return fail(result, error_code_t::invalid_input,
                      "gift card needs a non-zero value");
        }
        record.owner = op.beneficiary;
        break;
      case record_kind_t::event:
        if (op.capacity == 0) {
          return fail(result, error_code_t::invalid_input,
                      "event capacity must be positive");
        }
        if (op.unit_value == 0) {
          return fail(result, error_code_t::invalid_input,
                      "event deposit must be positive");
        }
        if (op.duration == 0) {
          return fail(result, error_code_t::invalid_input,
                      "event needs a positive duration");
        }
        if (op.payload.empty()) {
          return fail(result, error_code_t::invalid_input,
                      "event name is empty");
        }
        break;
      case record_kind_t::pool:
      case record_kind_t::attendee:
        break;
    }

    if (context.attached_value > 0) {
      disbursement_.credit(record, context.attached_value);
    } else {
      store_.put(record);
    }
    store_.index(record);
    emit(result, event_kind_t::created, record.key, context.caller,
         record.owner, record.value, "", now);
    spdlog::info("Created {} {}", to_string(record.kind), key_text(record.key));
    return error_code_t::ok;
  });
}

operation_result_t engine::transfer(const call_context_t& context,
                                    const transfer_record_t& op) {
  return run("custody.transfer", [&](operation_result_t& result) {
    auto now = clock_();
    auto record = store_.get(op.key);
    if (!record) {
      return fail(result, error_code_t::not_found, "record does not exist");
    }
    if (is_null(record->owner) || context.caller != record->owner) {
      return fail(result, error_code_t::unauthorized,
                  "only the current beneficiary may transfer");
    }
    if (!is_transferable(record->kind)) {
      return fail(result, error_code_t::invalid_state,
                  "record kind is not transferable");
    }
    if (!is_live(record->status)) {
      return fail(result, error_code_t::invalid_state,
                  "record is " + std::string{to_string(record->status)});
    }
    if (is_expired(*record, now)) {
      return fail(result, error_code_t::expired, "record has expired");
    }
    if (is_null(op.new_beneficiary) || op.new_beneficiary == record->owner) {
      return fail(result, error_code_t::invalid_input,
                  "new beneficiary must be a different principal");
    }

    record->owner = op.new_beneficiary;
    record->status = record_status_t::transferred;
    store_.put(*record);
    emit(result, event_kind_t::transferred, record->key, context.caller,
         op.new_beneficiary, amount_t{0}, "", now);
    return error_code_t::ok;
  });
}

operation_result_t engine::void_record(const call_context_t& context,
                                       const void_record_t& op) {
  return run("custody.void", [&](operation_result_t& result) {
    auto now = clock_();
    if (auto code = access_.require_owner(context.caller);
        code != error_code_t::ok) {
      return fail(result, code, "only the owner may void");
    }
    auto record = store_.get(op.key);
    if (!record) {
      return fail(result, error_code_t::not_found, "record does not exist");
    }
    if (op.reason.empty()) {
      return fail(result, error_code_t::invalid_input, "void reason is empty");
    }
    if (!is_voidable(record->kind)) {
      return fail(result, error_code_t::invalid_state,
                  "record kind cannot be voided");
    }
    if (!is_live(record->status)) {
      return fail(result, error_code_t::invalid_state,
                  "record is " + std::string{to_string(record->status)});
    }
    if (record->kind == record_kind_t::event && record->admitted > 0) {
      return fail(result, error_code_t::invalid_state,
                  "event already holds attendee deposits");
    }

    record->status = record_status_t::voided;
    store_.put(*record);
    emit(result, event_kind_t::voided, record->key, context.caller,
         record->owner, record->value, op.reason, now);
    spdlog::info("Voided {} {}: {}", to_string(record->kind),
                 key_text(record->key), op.reason);
    return error_code_t::ok;
  });
}

operation_result_t engine::redeem(const call_context_t& context,
                                  const redeem_record_t& op) {
  return run("custody.redeem", [&](operation_result_t& result) {
    auto now = clock_();
    auto key = record_key_t{};
    auto proven = false;
    if (auto code = resolve_key(result, op.secret, op.key, key, proven);
        code != error_code_t::ok) {
      return code;
    }
    auto record = store_.get(key);
    if (!record) {
      return fail(result, error_code_t::not_found, "record does not exist");
    }
    auto is_beneficiary =
        !is_null(record->owner) && context.caller == record->owner;
    if (!proven && !is_beneficiary) {
      return fail(result, error_code_t::unauthorized,
                  "caller is neither secret holder nor beneficiary");
    }
    if (record->kind != record_kind_t::gift_card) {
      return fail(result, error_code_t::invalid_state,
                  "record is not redeemable");
    }
    if (!is_live(record->status)) {
      return fail(result, error_code_t::invalid_state,
                  "record is " + std::string{to_string(record->status)});
    }
    if (is_expired(*record, now)) {
      return fail(result, error_code_t::expired, "record has expired");
    }

    auto recipient = is_null(record->owner) ? context.caller : record->owner;
    auto amount = record->value;
    record->status = record_status_t::redeemed;
    if (auto code = disbursement_.payout(*record, amount, recipient);
        code != error_code_t::ok) {
      return fail(result, code, "payout failed");
    }
    emit(result, event_kind_t::redeemed, record->key, context.caller,
         recipient, amount, op.message, now);
    return error_code_t::ok;
  });
}

operation_result_t engine::cancel(const call_context_t& context,
                                  const cancel_record_t& op) {
  return run("custody.cancel", [&](operation_result_t& result) {
    auto now = clock_();
    auto key = record_key_t{};
    auto proven = false;
    if (auto code = resolve_key(result, op.secret, op.key, key, proven);
        code != error_code_t::ok) {
      return code;
    }
    auto record = store_.get(key);
    if (!record) {
      return fail(result, error_code_t::not_found, "record does not exist");
    }
    if (context.caller != record->depositor) {
      return fail(result, error_code_t::unauthorized,
                  "only the depositor may cancel");
    }
    if (record->kind != record_kind_t::gift_card) {
      return fail(result, error_code_t::invalid_state,
                  "record is not cancellable");
    }
    if (!is_live(record->status)) {
      return fail(result, error_code_t::invalid_state,
                  "record is " + std::string{to_string(record->status)});
    }

    auto amount = record->value;
    record->status = record_status_t::cancelled;
    if (auto code = disbursement_.payout(*record, amount, record->depositor);
        code != error_code_t::ok) {
      return fail(result, code, "refund failed");
    }
    emit(result, event_kind_t::cancelled, record->key, context.caller,
         record->depositor, amount, "", now);
    return error_code_t::ok;
  });
}

operation_result_t engine::deposit(const call_context_t& context,
                                   const deposit_funds_t& op) {
  return run("custody.deposit", [&](operation_result_t& result) {
    auto now = clock_();
    auto pool = store_.get(op.pool);
    if (!pool) {
      return fail(result, error_code_t::not_found, "pool does not exist");
    }
    if (pool->kind != record_kind_t::pool || !is_live(pool->status)) {
      return fail(result, error_code_t::invalid_state,
                  "record does not accept deposits");
    }
    if (context.attached_value == 0) {
      return fail(result, error_code_t::invalid_input,
                  "deposit must carry value");
    }
    disbursement_.credit(*pool, context.attached_value);
    emit(result, event_kind_t::funds_deposited, pool->key, context.caller,
         make_zero_hash(), context.attached_value, "", now);
    return error_code_t::ok;
  });
}

operation_result_t engine::withdraw(const call_context_t& context,
                                    const withdraw_funds_t& op) {
  return run("custody.withdraw", [&](operation_result_t& result) {
    auto now = clock_();
    auto pool = store_.get(op.pool);
    if (!pool) {
      return fail(result, error_code_t::not_found, "pool does not exist");
    }
    auto code = pool->access == access_policy_t::members
                    ? access_.require_group(context.caller)
                    : access_.require_owner(context.caller);
    if (code != error_code_t::ok) {
      return fail(result, code, "caller may not withdraw from this pool");
    }
    if (pool->kind != record_kind_t::pool || !is_live(pool->status)) {
      return fail(result, error_code_t::invalid_state,
                  "record does not hold withdrawable funds");
    }
    if (op.amount == 0 || is_null(op.recipient)) {
      return fail(result, error_code_t::invalid_input,
                  "withdrawal needs an amount and a recipient");
    }
    if (op.amount > pool->value) {
      return fail(result, error_code_t::invalid_state,
                  "pool balance does not cover the withdrawal");
    }
    if (auto payout = disbursement_.payout(*pool, op.amount, op.recipient);
        payout != error_code_t::ok) {
      return fail(result, payout, "withdrawal failed");
    }
    emit(result, event_kind_t::funds_withdrawn, pool->key, context.caller,
         op.recipient, op.amount, op.reason, now);
    return error_code_t::ok;
  });
}

operation_result_t engine::purchase(const call_context_t& context,
                                    const purchase_item_t& op) {
  return run("custody.purchase", [&](operation_result_t& result) {
    auto now = clock_();
    auto item = store_.get(op.key);
    if (!item) {
      return fail(result, error_code_t::not_found, "item does not exist");
    }
    if (item->kind != record_kind_t::registry_item) {
      return fail(result, error_code_t::invalid_state,
                  "record is not a registry item");
    }
    if (!is_live(item->status)) {
      return fail(result, error_code_t::invalid_state,
                  "item is " + std::string{to_string(item->status)});
    }
    if (context.attached_value != item->unit_value) {
      return fail(result, error_code_t::invalid_input,
                  "payment must equal the item price");
    }
    auto pool = item->parent ? store_.get(*item->parent) : std::nullopt;
    if (!pool) {
      return fail(result, error_code_t::not_found,
                  "registry pool does not exist");
    }

    item->status = record_status_t::redeemed;
    item->owner = context.caller;
    store_.put(*item);
    disbursement_.credit(*pool, context.attached_value);
    emit(result, event_kind_t::purchased, item->key, context.caller,
         item->depositor, context.attached_value, "", now);
    return error_code_t::ok;
  });
}

operation_result_t engine::rsvp(const call_context_t& context,
                                const rsvp_event_t& op) {
  return run("custody.rsvp", [&](operation_result_t& result) {
    auto now = clock_();
    auto event = store_.get(op.event);
    if (!event) {
      return fail(result, error_code_t::not_found, "event does not exist");
    }
    if (event->kind != record_kind_t::event || !is_live(event->status)) {
      return fail(result, error_code_t::invalid_state,
                  "event is not open for rsvp");
    }
    if (is_expired(*event, now)) {
      return fail(result, error_code_t::expired, "rsvp deadline has passed");
    }
    if (is_null(context.caller) ||
        context.attached_value != event->unit_value) {
      return fail(result, error_code_t::invalid_input,
                  "rsvp must carry exactly the event deposit");
    }
    auto key = key::make_attendee_record_key(encoder_, event->key,
                                             context.caller);
    if (store_.get(key).has_value()) {
      return fail(result, error_code_t::already_exists,
                  "principal already holds an rsvp");
    }
    if (event->admitted >= event->capacity) {
      return fail(result, error_code_t::capacity_exceeded, "event is full");
    }

    auto attendee = record_state_t{.kind = record_kind_t::attendee,
                                   .key = key,
                                   .status = record_status_t::active,
                                   .owner = context.caller,
                                   .depositor = context.caller,
                                   .unit_value = event->unit_value,
                                   .created_at = now,
                                   .parent = event->key};
    disbursement_.credit(attendee, context.attached_value);
    store_.index(attendee);
    event->admitted += 1;
    store_.put(*event);
    emit(result, event_kind_t::admitted, attendee.key, context.caller,
         event->depositor, context.attached_value, "", now);
    return error_code_t::ok;
  });
}

operation_result_t engine::check_in(const call_context_t& context,
                                    const check_in_t& op) {
  return run("custody.check_in", [&](operation_result_t& result) {
    auto now = clock_();
    if (auto code = access_.require_owner(context.caller);
        code != error_code_t::ok) {
      return fail(result, code, "only the organizer may check in");
    }
    auto event = store_.get(op.event);
    if (!event) {
      return fail(result, error_code_t::not_found, "event does not exist");
    }
    if (event->kind != record_kind_t::event || !is_live(event->status)) {
      return fail(result, error_code_t::invalid_state, "event is not open");
    }
    if (is_null(op.attendee)) {
      return fail(result, error_code_t::invalid_input, "attendee is null");
    }
    auto attendee = store_.get(
        key::make_attendee_record_key(encoder_, event->key, op.attendee));
    if (!attendee) {
      return fail(result, error_code_t::invalid_state,
                  "principal has not rsvp'd");
    }
    if (attendee->has_checked_in || !is_live(attendee->status)) {
      return fail(result, error_code_t::invalid_state,
                  "attendee already checked in");
    }

    attendee->has_checked_in = true;
    attendee->status = record_status_t::redeemed;
    auto amount = attendee->value;
    if (auto code = disbursement_.payout(*attendee, amount, op.attendee);
        code != error_code_t::ok) {
      return fail(result, code, "deposit refund failed");
    }
    emit(result, event_kind_t::checked_in, attendee->key, context.caller,
         op.attendee, amount, "", now);
    return error_code_t::ok;
  });
}

operation_result_t engine::close_event(const call_context_t& context,
                                       const close_event_t& op) {
  return run("custody.close_event", [&](operation_result_t& result) {
    auto now = clock_();
    if (auto code = access_.require_owner(context.caller);
        code != error_code_t::ok) {
      return fail(result, code, "only the organizer may close an event");
    }
    auto event = store_.get(op.event);
    if (!event) {
      return fail(result, error_code_t::not_found, "event does not exist");
    }
    if (event->kind != record_kind_t::event || !is_live(event->status)) {
      return fail(result, error_code_t::invalid_state, "event is not open");
    }
    if (!is_expired(*event, now)) {
      return fail(result, error_code_t::invalid_state,
                  "event has not ended");
    }

    auto scope =
        key::index_scope_t{record_kind_t::attendee, std::optional{event->key}};
    auto forfeited = amount_t{0};
    auto size = store_.index_size(scope);
    for (auto ordinal = uint64_t{0}; ordinal < size; ++ordinal) {
      auto key = store_.index_at(scope, ordinal);
      auto attendee = key ? store_.get(*key) : std::nullopt;
      if (!attendee) {
        custody::common::critical("attendee index points at a missing record");
      }
      if (attendee->has_checked_in || !is_live(attendee->status)) {
        continue;
      }
      auto amount = attendee->value;
      attendee->status = record_status_t::expired;
      if (auto code = disbursement_.debit(*attendee, amount);
          code != error_code_t::ok) {
        return fail(result, code, "attendee deposit could not be forfeited");
      }
      forfeited += amount;
      emit(result, event_kind_t::forfeited, attendee->key, context.caller,
           attendee->owner, amount, "", now);
    }

    event->status = record_status_t::redeemed;
    store_.put(*event);
    if (forfeited > 0) {
      if (auto code = disbursement_.transfer(context.caller, forfeited);
          code != error_code_t::ok) {
        return fail(result, code, "forfeited deposits could not be paid out");
      }
      emit(result, event_kind_t::funds_withdrawn, event->key, context.caller,
           context.caller, forfeited, "forfeited deposits", now);
    } else {
      // Everyone showed up; the closure itself is the only transition.
      emit(result, event_kind_t::redeemed, event->key, context.caller,
           context.caller, forfeited, "closed", now);
    }
    spdlog::info("Closed event {} with {} forfeited", key_text(event->key),
                 forfeited.str());
    return error_code_t::ok;
  });
}

principal_id_t engine::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return access_.owner();
}

bool engine::is_member(const principal_id_t& principal) const {
  auto lock = std::scoped_lock{mutex_};
  return access_.is_member(principal);
}

std::optional<record_view_t> engine::inspect(const record_key_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  auto record = store_.get(key);
  if (!record) {
    return std::nullopt;
  }
  return make_view(*record, clock_());
}

std::vector<record_view_t> engine::list(
    const std::optional<record_kind_t> kind,
    const std::optional<record_key_t>& parent,
    const uint64_t offset,
    const std::size_t limit) const {
  auto lock = std::scoped_lock{mutex_};
  auto scope = kind ? key::index_scope_t{kind, parent}
                    : key::index_scope_t{std::nullopt, std::nullopt};
  auto now = clock_();
  auto size = store_.index_size(scope);
  auto capped = std::min(limit, options_.history_page_limit);
  auto views = std::vector<record_view_t>{};
  for (auto ordinal = offset; ordinal < size && views.size() < capped;
       ++ordinal) {
    auto key = store_.index_at(scope, ordinal);
    auto record = key ? store_.get(*key) : std::nullopt;
    if (!record) {
      custody::common::critical("record index points at a missing record");
    }
    views.push_back(make_view(*record, now));
  }
  return views;
}

uint64_t engine::count(const std::optional<record_kind_t> kind,
                       const std::optional<record_key_t>& parent) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.index_size(kind ? key::index_scope_t{kind, parent}
                                : key::index_scope_t{std::nullopt,
                                                     std::nullopt});
}

std::vector<history_entry_t> engine::recent_history(const std::size_t n) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.recent(n);
}

std::vector<history_entry_t> engine::history_page(
    const uint64_t offset,
    const std::size_t limit) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.history_page(offset,
                             std::min(limit, options_.history_page_limit));
}

uint64_t engine::history_size() const {
  auto lock = std::scoped_lock{mutex_};
  return store_.history_size();
}

std::vector<ledger_event_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return events_.range(from_id, to_id);
}

void engine::subscribe(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  events_.subscribe(std::move(sink));
}

amount_t engine::custodied_total() const {
  auto lock = std::scoped_lock{mutex_};
  return store_.custodied();
}

amount_t engine::reconcile() const {
  auto lock = std::scoped_lock{mutex_};
  auto scope = key::index_scope_t{std::nullopt, std::nullopt};
  auto total = amount_t{0};
  auto size = store_.index_size(scope);
  for (auto ordinal = uint64_t{0}; ordinal < size; ++ordinal) {
    auto key = store_.index_at(scope, ordinal);
    auto record = key ? store_.get(*key) : std::nullopt;
    if (!record) {
      custody::common::critical("record index points at a missing record");
    }
    total += record->value;
  }
  if (total != store_.custodied()) {
    spdlog::error("Custody mismatch: records hold {} but total is {}",
                  total.str(), store_.custodied().str());
  }
  return total;
}

record_key_t engine::attendee_key(const record_key_t& event,
                                  const principal_id_t& attendee) const {
  return key::make_attendee_record_key(encoder_, event, attendee);
}

const engine_options& engine::options() const {
  return options_;
}

}  // namespace custody::execution
