#include <spdlog/spdlog.h>
#include <custody/common/critical.hpp>
#include <custody/execution/disbursement.hpp>
#include <exception>
#include <utility>

using namespace custody::schema;

namespace {

struct in_flight_guard final {
  bool& flag;
  ~in_flight_guard() { flag = false; }
};

}  // namespace

namespace custody::execution {

disbursement::disbursement(ledger_store& store, value_transfer_t transfer)
    : store_{store}, transfer_{std::move(transfer)} {}

void disbursement::credit(record_state_t& record, const amount_t& amount) {
  record.value += amount;
  store_.put(record);
  store_.set_custodied(store_.custodied() + amount);
}

error_code_t disbursement::debit(record_state_t& record,
                                 const amount_t& amount) {
  if (amount > record.value) {
    return error_code_t::invalid_state;
  }
  auto custodied = store_.custodied();
  if (amount > custodied) {
    custody::common::critical("custodied total is below a record balance");
  }
  record.value -= amount;
  store_.put(record);
  store_.set_custodied(custodied - amount);
  return error_code_t::ok;
}

error_code_t disbursement::transfer(const principal_id_t& recipient,
                                    const amount_t& amount) {
  if (!transfer_) {
    spdlog::error("No value transfer installed; refusing payout of {}",
                  amount.str());
    return error_code_t::transfer_failed;
  }
  if (in_flight_) {
    spdlog::warn("Refusing re-entrant transfer of {} to {}", amount.str(),
                 to_hex(recipient));
    return error_code_t::transfer_failed;
  }
  in_flight_ = true;
  auto clear = in_flight_guard{in_flight_};
  try {
    if (!transfer_(recipient, amount)) {
      spdlog::warn("Value transfer of {} to {} reported failure", amount.str(),
                   to_hex(recipient));
      return error_code_t::transfer_failed;
    }
  } catch (const std::exception& ex) {
    spdlog::warn("Value transfer of {} to {} threw: {}", amount.str(),
                 to_hex(recipient), ex.what());
    return error_code_t::transfer_failed;
  } catch (...) {
    spdlog::warn("Value transfer of {} to {} threw a non-standard exception",
                 amount.str(), to_hex(recipient));
    return error_code_t::transfer_failed;
  }
  return error_code_t::ok;
}

error_code_t disbursement::payout(record_state_t& record,
                                  const amount_t& amount,
                                  const principal_id_t& recipient) {
  if (auto code = debit(record, amount); code != error_code_t::ok) {
    return code;
  }
  return transfer(recipient, amount);
}

}  // namespace custody::execution
