#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <charconv>
#include <chrono>
#include <custody/blake3/hash.hpp>
#include <custody/execution/engine.hpp>
#include <custody/execution/history_cursor.hpp>
#include <custody/schema/primitives.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <tuple>

using namespace custody::schema;

namespace {

/// A 64-digit hex id is used as is; any other name is hashed.
ledger_id_t parse_ledger(const std::string& value) {
  if (auto id = try_make_hash32(std::string_view{value})) {
    return *id;
  }
  return custody::blake3::hash(std::string_view{value});
}

record_key_t parse_key(const std::string& value) {
  if (value.starts_with("0x")) {
    if (auto decoded = try_from_hex(value)) {
      return *decoded;
    }
  }
  return make_bytes(value);
}

std::optional<std::tuple<uint64_t, uint64_t>> parse_range(
    const std::string& value) {
  auto separator = value.find(':');
  if (separator == std::string::npos) {
    return std::nullopt;
  }
  auto from = uint64_t{};
  auto to = uint64_t{};
  auto begin = value.data();
  auto middle = begin + separator;
  auto end = begin + value.size();
  if (std::from_chars(begin, middle, from).ec != std::errc{} ||
      std::from_chars(middle + 1, end, to).ec != std::errc{}) {
    return std::nullopt;
  }
  return std::tuple{from, to};
}

timestamp_milliseconds_t system_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

void print_record(const record_view_t& view) {
  spdlog::info("{} {} status={} beneficiary={} depositor={} value={}",
               to_string(view.kind), to_hex(bytes_view_t{view.key}),
               view.status_text, to_hex(view.beneficiary),
               to_hex(view.depositor), view.value.str());
  if (view.expires_at) {
    spdlog::info("  expires_at={}", *view.expires_at);
  }
  if (view.capacity > 0) {
    spdlog::info("  admitted={}/{}", view.admitted, view.capacity);
  }
  if (!view.payload.empty()) {
    spdlog::info("  payload={}", make_string(view.payload));
  }
}

void print_history(const history_entry_t& entry) {
  spdlog::info("#{} {} key={} actor={} counterparty={} amount={} at={} {}",
               entry.sequence, to_string(entry.kind),
               to_hex(bytes_view_t{entry.key}), to_hex(entry.actor),
               to_hex(entry.counterparty), entry.amount.str(), entry.timestamp,
               entry.reason);
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "custody_audit.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "audit", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto db_path = std::string{};
  auto ledger = std::string{};
  auto history = std::size_t{};
  auto inspect = std::string{};
  auto events = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"Custody ledger audit"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "custody.db"),
      "Path of the ledger database")(
      "ledger,l", boost::program_options::value<std::string>(&ledger),
      "Ledger id (64 hex digits) or ledger name")(
      "history,n",
      boost::program_options::value<std::size_t>(&history)->default_value(10),
      "Show the N most recent history entries")(
      "inspect,i", boost::program_options::value<std::string>(&inspect),
      "Show one record (text key, or 0x-prefixed hex)")(
      "events,e", boost::program_options::value<std::string>(&events),
      "Show persisted events in the range FROM:TO")(
      "verbose,v", "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help") || !vm.contains("ledger")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return vm.contains("help") ? 0 : 1;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto encoder = custody::execution::encoder_t{};
  auto storage =
      custody::storage::make_storage<custody::storage::rocksdb_storage_tag>(
          db_path);
  auto ledger_id = parse_ledger(ledger);

  {
    auto probe = custody::execution::ledger_store{encoder, storage, ledger_id};
    if (!probe.owner()) {
      spdlog::error("Ledger {} does not exist in {}", to_hex(ledger_id),
                    db_path);
      spdlog::shutdown();
      return 1;
    }
  }

  // The audit tool never moves funds.
  auto refuse = [](const principal_id_t& recipient, const amount_t& amount) {
    spdlog::error("Refusing transfer of {} to {} from the audit tool",
                  amount.str(), to_hex(recipient));
    return false;
  };
  auto engine = custody::execution::engine{
      encoder, storage,
      custody::execution::engine_options{.ledger_id = ledger_id},
      system_now, refuse};

  spdlog::info("Ledger {} owner={}", to_hex(ledger_id), to_hex(engine.owner()));
  spdlog::info("Records: {}  history: {}  custodied: {}",
               engine.count(std::nullopt, std::nullopt), engine.history_size(),
               engine.custodied_total().str());
  auto reconciled = engine.reconcile();
  if (reconciled != engine.custodied_total()) {
    spdlog::error("Reconciliation failed: records hold {}", reconciled.str());
  }

  if (vm.contains("inspect")) {
    if (auto view = engine.inspect(parse_key(inspect))) {
      print_record(*view);
    } else {
      spdlog::warn("No record under {}", inspect);
    }
  }

  if (history > 0) {
    for (const auto& entry : engine.recent_history(history)) {
      print_history(entry);
    }
  } else if (vm.contains("verbose")) {
    auto cursor = custody::execution::history_cursor{
        engine, engine.options().history_page_limit};
    while (!cursor.done()) {
      for (const auto& entry : cursor.next()) {
        print_history(entry);
      }
    }
  }

  if (vm.contains("events")) {
    auto range = parse_range(events);
    if (!range) {
      spdlog::error("Expected --events FROM:TO, got '{}'", events);
    } else {
      auto [from, to] = *range;
      for (const auto& event : engine.events(from, to)) {
        spdlog::info("event {} {} key={} amount={} principals={} {}",
                     event.event_id, to_string(event.kind),
                     to_hex(bytes_view_t{event.key}), event.amount.str(),
                     event.principals.size(), event.reason);
      }
    }
  }

  spdlog::shutdown();
  return 0;
}
