#include <gtest/gtest.h>
#include <custody/execution/commitment.hpp>
#include <custody/testing/ledger_fixture.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace custody::schema;
using custody::testing::as;
using custody::testing::kStartTime;
using custody::testing::ledger_fixture;

namespace {

constexpr duration_milliseconds_t kDay{86'400'000};

record_key_t key_of(const std::string& text) {
  return make_bytes(text);
}

record_key_t commitment_of(const std::string& secret) {
  return custody::execution::make_commitment(make_bytes_view(secret));
}

create_record_t make_warranty(const std::string& serial,
                              const principal_id_t& customer,
                              const duration_milliseconds_t duration) {
  return create_record_t{.kind = record_kind_t::warranty,
                         .key = key_of(serial),
                         .beneficiary = customer,
                         .duration = duration,
                         .payload = key_of("model X, 2 year cover")};
}

create_record_t make_card(const std::string& secret,
                          const principal_id_t& beneficiary,
                          const duration_milliseconds_t duration = 0) {
  return create_record_t{.kind = record_kind_t::gift_card,
                         .key = commitment_of(secret),
                         .beneficiary = beneficiary,
                         .duration = duration,
                         .payload = key_of("happy birthday")};
}

redeem_record_t with_secret(const std::string& secret) {
  return redeem_record_t{.secret = make_bytes(secret)};
}

}  // namespace

TEST(engine, create_warranty_records_state_history_and_event) {
  auto fixture = ledger_fixture{"custody_engine_create"};
  auto& engine = fixture.engine();

  auto result = engine.create(as(ledger_fixture::owner()),
                              make_warranty("W1", ledger_fixture::alice(), 1000));
  ASSERT_EQ(result.code, error_code_t::ok) << result.log;
  EXPECT_EQ(result.codespace, "custody.create");
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].kind, event_kind_t::created);
  EXPECT_EQ(result.events[0].event_id, 1u);

  auto view = engine.inspect(key_of("W1"));
  ASSERT_TRUE(view.has_value());
  EXPECT_TRUE(view->valid);
  EXPECT_EQ(view->status, record_status_t::active);
  EXPECT_EQ(view->status_text, "active");
  EXPECT_EQ(view->beneficiary, ledger_fixture::alice());
  EXPECT_EQ(view->depositor, ledger_fixture::owner());
  EXPECT_EQ(view->expires_at, kStartTime + 1000);
  EXPECT_EQ(view->value, amount_t{0});
  EXPECT_EQ(make_string(view->payload), "model X, 2 year cover");

  auto history = engine.recent_history(10);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].kind, event_kind_t::created);
  EXPECT_EQ(history[0].actor, ledger_fixture::owner());
  EXPECT_EQ(history[0].counterparty, ledger_fixture::alice());
  EXPECT_EQ(history[0].timestamp, kStartTime);
}

TEST(engine, create_validates_privilege_and_inputs) {
  auto fixture = ledger_fixture{"custody_engine_create_checks"};
  auto& engine = fixture.engine();
  auto owner = as(ledger_fixture::owner());

  EXPECT_EQ(engine
                .create(as(ledger_fixture::mallory()),
                        make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(engine.create(owner, make_warranty("", ledger_fixture::alice(), 1))
                .code,
            error_code_t::invalid_input);
  EXPECT_EQ(engine.create(owner, make_warranty("W1", make_zero_hash(), 1000))
                .code,
            error_code_t::invalid_input);
  EXPECT_EQ(
      engine.create(owner, make_warranty("W1", ledger_fixture::alice(), 0))
          .code,
      error_code_t::invalid_input);
  EXPECT_EQ(engine
                .create(as(ledger_fixture::owner(), 5),
                        make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::invalid_input);

  auto attendee = create_record_t{.kind = record_kind_t::attendee,
                                  .key = key_of("A1")};
  EXPECT_EQ(engine.create(owner, attendee).code, error_code_t::invalid_input);

  auto orphan = create_record_t{.kind = record_kind_t::registry_item,
                                .key = key_of("I1"),
                                .unit_value = 10,
                                .parent = key_of("no-such-pool"),
                                .payload = key_of("kettle")};
  EXPECT_EQ(engine.create(owner, orphan).code, error_code_t::not_found);

  auto short_card = make_card("s", ledger_fixture::bob());
  short_card.key.pop_back();
  EXPECT_EQ(engine.create(as(ledger_fixture::alice(), 10), short_card).code,
            error_code_t::invalid_input);
  EXPECT_EQ(engine.create(as(ledger_fixture::alice()),
                          make_card("s", ledger_fixture::bob()))
                .code,
            error_code_t::invalid_input);

  EXPECT_EQ(engine.history_size(), 0u);
  EXPECT_EQ(engine.count(std::nullopt, std::nullopt), 0u);
  EXPECT_TRUE(engine.events(1, 100).empty());
}

TEST(engine, create_rejects_a_duration_past_the_end_of_time) {
  auto fixture = ledger_fixture{"custody_engine_create_overflow"};
  auto& engine = fixture.engine();
  auto owner = as(ledger_fixture::owner());
  constexpr auto kMax = std::numeric_limits<timestamp_milliseconds_t>::max();

  auto wrapped = engine.create(
      owner, make_warranty("W1", ledger_fixture::alice(), kMax - kStartTime + 2));
  EXPECT_EQ(wrapped.code, error_code_t::invalid_input);
  EXPECT_FALSE(engine.inspect(key_of("W1")).has_value());

  auto last = engine.create(
      owner, make_warranty("W2", ledger_fixture::alice(), kMax - kStartTime));
  ASSERT_EQ(last.code, error_code_t::ok) << last.log;
  auto view = engine.inspect(key_of("W2"));
  ASSERT_TRUE(view.has_value());
  EXPECT_TRUE(view->valid);
  EXPECT_EQ(view->expires_at, kMax);
}

TEST(engine, keys_are_never_reused_even_after_a_terminal_state) {
  auto fixture = ledger_fixture{"custody_engine_unique"};
  auto& engine = fixture.engine();
  auto owner = as(ledger_fixture::owner());

  ASSERT_EQ(engine.create(owner, make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::ok);
  auto before = engine.inspect(key_of("W1"));

  auto duplicate =
      engine.create(owner, make_warranty("W1", ledger_fixture::bob(), 5000));
  EXPECT_EQ(duplicate.code, error_code_t::already_exists);
  EXPECT_TRUE(duplicate.events.empty());
  EXPECT_EQ(engine.inspect(key_of("W1"))->beneficiary,
            before->beneficiary);
  EXPECT_EQ(engine.inspect(key_of("W1"))->expires_at, before->expires_at);

  ASSERT_EQ(engine.void_record(owner, void_record_t{.key = key_of("W1"),
                                                    .reason = "recall"})
                .code,
            error_code_t::ok);
  EXPECT_EQ(
      engine.create(owner, make_warranty("W1", ledger_fixture::bob(), 5000))
          .code,
      error_code_t::already_exists);
}

TEST(engine, transfer_is_bounded_by_expiry) {
  auto fixture = ledger_fixture{"custody_engine_expiry"};
  auto& engine = fixture.engine();
  auto owner = as(ledger_fixture::owner());
  ASSERT_EQ(engine.create(owner, make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::ok);
  ASSERT_EQ(engine.create(owner, make_warranty("W2", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::ok);

  fixture.clock().set(kStartTime + 999);
  auto in_time = engine.transfer(
      as(ledger_fixture::alice()),
      transfer_record_t{.key = key_of("W1"),
                        .new_beneficiary = ledger_fixture::bob()});
  ASSERT_EQ(in_time.code, error_code_t::ok) << in_time.log;
  EXPECT_EQ(engine.inspect(key_of("W1"))->status, record_status_t::transferred);

  fixture.clock().set(kStartTime + 1000);
  auto too_late = engine.transfer(
      as(ledger_fixture::alice()),
      transfer_record_t{.key = key_of("W2"),
                        .new_beneficiary = ledger_fixture::bob()});
  EXPECT_EQ(too_late.code, error_code_t::expired);
  EXPECT_TRUE(too_late.events.empty());

  auto view = engine.inspect(key_of("W2"));
  EXPECT_FALSE(view->valid);
  EXPECT_EQ(view->status, record_status_t::expired);
  EXPECT_EQ(view->status_text, "expired");
  EXPECT_EQ(view->beneficiary, ledger_fixture::alice());
}

TEST(engine, transfer_requires_the_current_beneficiary) {
  auto fixture = ledger_fixture{"custody_engine_transfer_auth"};
  auto& engine = fixture.engine();
  ASSERT_EQ(engine
                .create(as(ledger_fixture::owner()),
                        make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::ok);

  auto to_bob = transfer_record_t{.key = key_of("W1"),
                                  .new_beneficiary = ledger_fixture::bob()};
  EXPECT_EQ(engine.transfer(as(ledger_fixture::owner()), to_bob).code,
            error_code_t::unauthorized);
  EXPECT_EQ(engine.transfer(as(ledger_fixture::mallory()), to_bob).code,
            error_code_t::unauthorized);
  EXPECT_EQ(engine
                .transfer(as(ledger_fixture::alice()),
                          transfer_record_t{.key = key_of("W9"),
                                            .new_beneficiary =
                                                ledger_fixture::bob()})
                .code,
            error_code_t::not_found);
  EXPECT_EQ(engine
                .transfer(as(ledger_fixture::alice()),
                          transfer_record_t{.key = key_of("W1"),
                                            .new_beneficiary =
                                                make_zero_hash()})
                .code,
            error_code_t::invalid_input);

  ASSERT_EQ(engine.transfer(as(ledger_fixture::alice()), to_bob).code,
            error_code_t::ok);
  // Transferred stays transferable by the new holder.
  EXPECT_EQ(engine
                .transfer(as(ledger_fixture::bob()),
                          transfer_record_t{.key = key_of("W1"),
                                            .new_beneficiary =
                                                ledger_fixture::carol()})
                .code,
            error_code_t::ok);
  EXPECT_EQ(engine.transfer(as(ledger_fixture::alice()), to_bob).code,
            error_code_t::unauthorized);
}

TEST(engine, failed_privileged_operations_leave_no_trace) {
  auto fixture = ledger_fixture{"custody_engine_soundness"};
  auto& engine = fixture.engine();
  ASSERT_EQ(engine
                .create(as(ledger_fixture::owner()),
                        make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::ok);

  auto received = std::vector<ledger_event_t>{};
  engine.subscribe([&](const ledger_event_t& event) {
    received.push_back(event);
  });
  auto history_before = engine.history_size();
  auto view_before = engine.inspect(key_of("W1"));

  auto denied = engine.void_record(
      as(ledger_fixture::alice()),
      void_record_t{.key = key_of("W1"), .reason = "mine now"});
  EXPECT_EQ(denied.code, error_code_t::unauthorized);
  EXPECT_EQ(engine.add_member(as(ledger_fixture::mallory()),
                              ledger_fixture::mallory())
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(engine
                .check_in(as(ledger_fixture::mallory()),
                          check_in_t{.event = key_of("E1"),
                                     .attendee = ledger_fixture::mallory()})
                .code,
            error_code_t::unauthorized);

  EXPECT_TRUE(received.empty());
  EXPECT_EQ(engine.history_size(), history_before);
  EXPECT_EQ(engine.inspect(key_of("W1"))->status, view_before->status);
  EXPECT_EQ(engine.events(1, 100).size(), 1u);
}

TEST(engine, void_needs_a_reason_and_a_live_record) {
  auto fixture = ledger_fixture{"custody_engine_void"};
  auto& engine = fixture.engine();
  auto owner = as(ledger_fixture::owner());
  ASSERT_EQ(engine.create(owner, make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::ok);

  EXPECT_EQ(
      engine.void_record(owner, void_record_t{.key = key_of("W1")}).code,
      error_code_t::invalid_input);
  EXPECT_EQ(engine
                .void_record(owner, void_record_t{.key = key_of("nope"),
                                                  .reason = "x"})
                .code,
            error_code_t::not_found);

  auto voided = engine.void_record(
      owner, void_record_t{.key = key_of("W1"), .reason = "tamper"});
  ASSERT_EQ(voided.code, error_code_t::ok);
  EXPECT_EQ(voided.events[0].reason, "tamper");

  EXPECT_EQ(engine
                .void_record(owner, void_record_t{.key = key_of("W1"),
                                                  .reason = "again"})
                .code,
            error_code_t::invalid_state);
  EXPECT_EQ(engine
                .transfer(as(ledger_fixture::alice()),
                          transfer_record_t{.key = key_of("W1"),
                                            .new_beneficiary =
                                                ledger_fixture::bob()})
                .code,
            error_code_t::invalid_state);
  EXPECT_EQ(fixture.bank().calls(), 0u);
}

TEST(engine, gift_card_scenario_transfer_expire_then_void) {
  auto fixture = ledger_fixture{"custody_engine_k1"};
  auto& engine = fixture.engine();
  auto key = commitment_of("k1-secret");

  ASSERT_EQ(engine
                .create(as(ledger_fixture::carol(), 100),
                        make_card("k1-secret", ledger_fixture::bob(),
                                  365 * kDay))
                .code,
            error_code_t::ok);
  EXPECT_EQ(engine.custodied_total(), amount_t{100});

  fixture.clock().advance(10 * kDay);
  ASSERT_EQ(engine
                .transfer(as(ledger_fixture::bob()),
                          transfer_record_t{.key = key,
                                            .new_beneficiary =
                                                ledger_fixture::alice()})
                .code,
            error_code_t::ok);
  auto history = engine.recent_history(10);
  EXPECT_EQ(std::count_if(std::begin(history), std::end(history),
                          [](const history_entry_t& entry) {
                            return entry.kind == event_kind_t::transferred;
                          }),
            1);

  fixture.clock().advance(365 * kDay);
  auto late = engine.redeem(as(ledger_fixture::alice()),
                            with_secret("k1-secret"));
  EXPECT_EQ(late.code, error_code_t::expired);
  EXPECT_EQ(fixture.bank().calls(), 0u);

  ASSERT_EQ(engine
                .void_record(as(ledger_fixture::owner()),
                             void_record_t{.key = key, .reason = "tamper"})
                .code,
            error_code_t::ok);
  auto view = engine.inspect(key);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, record_status_t::voided);
  EXPECT_EQ(view->status_text, "voided");
  EXPECT_FALSE(view->valid);
  EXPECT_EQ(view->value, amount_t{100});
  EXPECT_EQ(engine.custodied_total(), amount_t{100});
  EXPECT_EQ(engine.reconcile(), engine.custodied_total());
}

TEST(engine, redeem_pays_out_exactly_once) {
  auto fixture = ledger_fixture{"custody_engine_redeem_once"};
  auto& engine = fixture.engine();
  ASSERT_EQ(engine
                .create(as(ledger_fixture::carol(), 250),
                        make_card("open sesame", ledger_fixture::bob()))
                .code,
            error_code_t::ok);

  auto first = engine.redeem(as(ledger_fixture::mallory()),
                             redeem_record_t{.secret = make_bytes(std::string{
                                                 "open sesame"}),
                                             .message = "thanks"});
  ASSERT_EQ(first.code, error_code_t::ok) << first.log;
  ASSERT_EQ(first.events.size(), 1u);
  EXPECT_EQ(first.events[0].kind, event_kind_t::redeemed);
  EXPECT_EQ(first.events[0].amount, amount_t{250});
  EXPECT_EQ(first.events[0].reason, "thanks");
  // A named beneficiary is paid no matter who presents the secret.
  EXPECT_EQ(fixture.bank().balance(ledger_fixture::bob()), amount_t{250});

  auto second =
      engine.redeem(as(ledger_fixture::bob()), with_secret("open sesame"));
  EXPECT_EQ(second.code, error_code_t::invalid_state);
  auto cancel = engine.cancel(
      as(ledger_fixture::carol()),
      cancel_record_t{.secret = make_bytes(std::string{"open sesame"})});
  EXPECT_EQ(cancel.code, error_code_t::invalid_state);

  EXPECT_EQ(fixture.bank().calls(), 1u);
  EXPECT_EQ(fixture.bank().total_paid(), amount_t{250});
  auto view = engine.inspect(commitment_of("open sesame"));
  EXPECT_EQ(view->status, record_status_t::redeemed);
  EXPECT_EQ(view->value, amount_t{0});
  EXPECT_EQ(engine.custodied_total(), amount_t{0});
}

TEST(engine, redeem_authorization_by_secret_or_beneficiary) {
  auto fixture = ledger_fixture{"custody_engine_redeem_auth"};
  auto& engine = fixture.engine();
  auto key = commitment_of("abc");
  ASSERT_EQ(engine
                .create(as(ledger_fixture::carol(), 10),
                        make_card("abc", ledger_fixture::bob()))
                .code,
            error_code_t::ok);

  EXPECT_EQ(engine.redeem(as(ledger_fixture::mallory()), with_secret("abd"))
                .code,
            error_code_t::not_found);
  EXPECT_EQ(engine
                .redeem(as(ledger_fixture::mallory()),
                        redeem_record_t{.secret = make_bytes(std::string{"abd"}),
                                        .key = key})
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(engine
                .redeem(as(ledger_fixture::mallory()),
                        redeem_record_t{.key = key})
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(engine.redeem(as(ledger_fixture::mallory()), redeem_record_t{})
                .code,
            error_code_t::invalid_input);
  EXPECT_EQ(fixture.bank().calls(), 0u);

  auto claimed =
      engine.redeem(as(ledger_fixture::bob()), redeem_record_t{.key = key});
  ASSERT_EQ(claimed.code, error_code_t::ok);
  EXPECT_EQ(fixture.bank().balance(ledger_fixture::bob()), amount_t{10});
}

TEST(engine, bearer_card_pays_whoever_presents_the_secret) {
  auto fixture = ledger_fixture{"custody_engine_bearer"};
  auto& engine = fixture.engine();
  ASSERT_EQ(engine
                .create(as(ledger_fixture::carol(), 7),
                        make_card("bearer", make_zero_hash()))
                .code,
            error_code_t::ok);

  EXPECT_EQ(engine
                .redeem(as(ledger_fixture::alice()),
                        redeem_record_t{.key = commitment_of("bearer")})
                .code,
            error_code_t::unauthorized);
  ASSERT_EQ(
      engine.redeem(as(ledger_fixture::alice()), with_secret("bearer")).code,
      error_code_t::ok);
  EXPECT_EQ(fixture.bank().balance(ledger_fixture::alice()), amount_t{7});
}

TEST(engine, depositor_cancels_and_is_refunded) {
  auto fixture = ledger_fixture{"custody_engine_cancel"};
  auto& engine = fixture.engine();
  auto cancel = cancel_record_t{.secret = make_bytes(std::string{"gift"})};
  ASSERT_EQ(engine
                .create(as(ledger_fixture::carol(), 30),
                        make_card("gift", ledger_fixture::bob(), kDay))
                .code,
            error_code_t::ok);

  EXPECT_EQ(engine.cancel(as(ledger_fixture::bob()), cancel).code,
            error_code_t::unauthorized);

  // Expiry strands the card for the beneficiary, not for the sender.
  fixture.clock().advance(2 * kDay);
  auto refunded = engine.cancel(as(ledger_fixture::carol()), cancel);
  ASSERT_EQ(refunded.code, error_code_t::ok) << refunded.log;
  EXPECT_EQ(refunded.events[0].kind, event_kind_t::cancelled);
  EXPECT_EQ(fixture.bank().balance(ledger_fixture::carol()), amount_t{30});
  EXPECT_EQ(engine.inspect(commitment_of("gift"))->status,
            record_status_t::cancelled);

  EXPECT_EQ(engine.cancel(as(ledger_fixture::carol()), cancel).code,
            error_code_t::invalid_state);
  EXPECT_EQ(fixture.bank().calls(), 1u);
}

TEST(engine, observers_see_only_committed_events_in_order) {
  auto fixture = ledger_fixture{"custody_engine_events"};
  auto& engine = fixture.engine();
  auto received = std::vector<ledger_event_t>{};
  engine.subscribe([&](const ledger_event_t& event) {
    received.push_back(event);
  });
  engine.subscribe([](const ledger_event_t&) {
    throw std::runtime_error{"observer crashed"};
  });

  auto owner = as(ledger_fixture::owner());
  ASSERT_EQ(engine.create(owner, make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::ok);
  EXPECT_EQ(engine.create(owner, make_warranty("W1", ledger_fixture::alice(), 1000))
                .code,
            error_code_t::already_exists);
  ASSERT_EQ(engine
                .transfer(as(ledger_fixture::alice()),
                          transfer_record_t{.key = key_of("W1"),
                                            .new_beneficiary =
                                                ledger_fixture::bob()})
                .code,
            error_code_t::ok);

  ASSERT_EQ(received.size(), 2u);
  EXPECT_EQ(received[0].event_id, 1u);
  EXPECT_EQ(received[0].kind, event_kind_t::created);
  EXPECT_EQ(received[1].event_id, 2u);
  EXPECT_EQ(received[1].kind, event_kind_t::transferred);
  ASSERT_EQ(received[1].principals.size(), 2u);
  EXPECT_EQ(received[1].principals[0], ledger_fixture::alice());
  EXPECT_EQ(received[1].principals[1], ledger_fixture::bob());

  auto persisted = engine.events(2, 2);
  ASSERT_EQ(persisted.size(), 1u);
  EXPECT_EQ(persisted[0].kind, event_kind_t::transferred);
  EXPECT_EQ(engine.events(1, 100).size(), 2u);
}

TEST(engine, listing_is_paginated_and_capped) {
  auto fixture = ledger_fixture{"custody_engine_list", 3};
  auto& engine = fixture.engine();
  auto owner = as(ledger_fixture::owner());
  for (const auto* serial : {"W1", "W2", "W3", "W4", "W5"}) {
    ASSERT_EQ(
        engine.create(owner, make_warranty(serial, ledger_fixture::alice(), 1000))
            .code,
        error_code_t::ok);
  }

  EXPECT_EQ(engine.count(record_kind_t::warranty, std::nullopt), 5u);
  auto page = engine.list(record_kind_t::warranty, std::nullopt, 1, 2);
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(make_string(page[0].key), "W2");
  EXPECT_EQ(make_string(page[1].key), "W3");

  EXPECT_EQ(engine.list(record_kind_t::warranty, std::nullopt, 0, 50).size(),
            3u);
  EXPECT_TRUE(engine.list(record_kind_t::warranty, std::nullopt, 5, 2).empty());
  EXPECT_TRUE(engine.list(record_kind_t::gift_card, std::nullopt, 0, 2).empty());
  EXPECT_EQ(engine.history_page(0, 50).size(), 3u);
}

TEST(engine, state_survives_reopening_the_ledger) {
  auto fixture = ledger_fixture{"custody_engine_reopen"};
  ASSERT_EQ(fixture.engine()
                .create(as(ledger_fixture::carol(), 40),
                        make_card("persist", ledger_fixture::bob()))
                .code,
            error_code_t::ok);

  fixture.reopen();
  auto& engine = fixture.engine();
  auto view = engine.inspect(commitment_of("persist"));
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->value, amount_t{40});
  EXPECT_EQ(engine.custodied_total(), amount_t{40});
  EXPECT_EQ(engine.history_size(), 1u);
  EXPECT_EQ(engine.events(1, 10).size(), 1u);

  ASSERT_EQ(
      engine.redeem(as(ledger_fixture::bob()), with_secret("persist")).code,
      error_code_t::ok);
  EXPECT_EQ(engine.events(1, 10).back().event_id, 2u);
}
