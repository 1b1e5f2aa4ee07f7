#include <gtest/gtest.h>
#include <custody/ledgers/shared_treasury.hpp>
#include <custody/testing/ledger_fixture.hpp>

using namespace custody::schema;
using custody::ledgers::shared_treasury;
using custody::testing::as;
using custody::testing::ledger_fixture;

namespace {

void open_treasury(shared_treasury& treasury) {
  ASSERT_EQ(treasury.initialize(as(ledger_fixture::owner())).code,
            error_code_t::ok);
  ASSERT_EQ(treasury.add_member(as(ledger_fixture::owner()),
                                ledger_fixture::alice())
                .code,
            error_code_t::ok);
}

}  // namespace

TEST(shared_treasury, anyone_deposits_and_members_withdraw) {
  auto fixture = ledger_fixture{"custody_treasury_flow"};
  auto treasury = shared_treasury{fixture.engine(), "club"};
  open_treasury(treasury);

  EXPECT_EQ(treasury.deposit(as(ledger_fixture::carol())).code,
            error_code_t::invalid_input);
  ASSERT_EQ(treasury.deposit(as(ledger_fixture::carol(), 500)).code,
            error_code_t::ok);
  ASSERT_EQ(treasury.deposit(as(ledger_fixture::bob(), 250)).code,
            error_code_t::ok);
  EXPECT_EQ(treasury.balance(), amount_t{750});

  EXPECT_EQ(treasury
                .withdraw(as(ledger_fixture::bob()), 100,
                          ledger_fixture::bob(), "snacks")
                .code,
            error_code_t::unauthorized);

  auto paid = treasury.withdraw(as(ledger_fixture::alice()), 300,
                                ledger_fixture::carol(), "venue");
  ASSERT_EQ(paid.code, error_code_t::ok) << paid.log;
  EXPECT_EQ(fixture.bank().balance(ledger_fixture::carol()), amount_t{300});
  ASSERT_EQ(treasury
                .withdraw(as(ledger_fixture::owner()), 50,
                          ledger_fixture::owner(), "fees")
                .code,
            error_code_t::ok);
  EXPECT_EQ(treasury.balance(), amount_t{400});

  EXPECT_EQ(treasury
                .withdraw(as(ledger_fixture::alice()), 401,
                          ledger_fixture::alice(), "all of it")
                .code,
            error_code_t::invalid_state);
  EXPECT_EQ(treasury
                .withdraw(as(ledger_fixture::alice()), 1, make_zero_hash(),
                          "nowhere")
                .code,
            error_code_t::invalid_input);
}

TEST(shared_treasury, removed_member_loses_access) {
  auto fixture = ledger_fixture{"custody_treasury_remove"};
  auto treasury = shared_treasury{fixture.engine(), "club"};
  open_treasury(treasury);
  ASSERT_EQ(treasury.deposit(as(ledger_fixture::carol(), 10)).code,
            error_code_t::ok);

  ASSERT_TRUE(treasury.is_member(ledger_fixture::alice()));
  ASSERT_EQ(treasury.remove_member(as(ledger_fixture::owner()),
                                   ledger_fixture::alice())
                .code,
            error_code_t::ok);
  EXPECT_FALSE(treasury.is_member(ledger_fixture::alice()));
  EXPECT_EQ(treasury
                .withdraw(as(ledger_fixture::alice()), 5,
                          ledger_fixture::alice(), "one more")
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(treasury.balance(), amount_t{10});
}

TEST(shared_treasury, recent_history_shows_the_latest_movements_first) {
  auto fixture = ledger_fixture{"custody_treasury_history"};
  auto treasury = shared_treasury{fixture.engine(), "club"};
  open_treasury(treasury);
  ASSERT_EQ(treasury.deposit(as(ledger_fixture::carol(), 80)).code,
            error_code_t::ok);
  ASSERT_EQ(treasury
                .withdraw(as(ledger_fixture::alice()), 30,
                          ledger_fixture::bob(), "tickets")
                .code,
            error_code_t::ok);

  auto recent = treasury.recent_history(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].kind, event_kind_t::funds_withdrawn);
  EXPECT_EQ(recent[0].actor, ledger_fixture::alice());
  EXPECT_EQ(recent[0].counterparty, ledger_fixture::bob());
  EXPECT_EQ(recent[0].amount, amount_t{30});
  EXPECT_EQ(recent[0].reason, "tickets");
  EXPECT_EQ(recent[1].kind, event_kind_t::funds_deposited);
  EXPECT_EQ(recent[1].actor, ledger_fixture::carol());

  // created, membership_changed, deposit, withdrawal
  EXPECT_EQ(treasury.recent_history(100).size(), 4u);
}
