#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/execution/vault.hpp>
#include <strongbox/ledger/memory_token_ledger.hpp>
#include <strongbox/schema/key/vault_keys.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

namespace po = boost::program_options;
using encoder_t = strongbox::execution::vault::encoder_t;

constexpr int kExitScriptError = 2;

/// Accounts are written as 32-byte hex or as a name; a name stands for
/// blake3(name) so scripts can say `alice` instead of 64 hex digits.
strongbox::schema::address_t resolve_account(const std::string_view text) {
  if (auto address = strongbox::schema::try_make_address(text)) {
    return *address;
  }
  return strongbox::blake3::hash(text);
}

std::optional<uint64_t> parse_u64(const std::string_view text) {
  auto value = uint64_t{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string make_unique_db_path() {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  auto path = std::filesystem::temp_directory_path() /
              ("strongbox-" + std::to_string(stamp));
  return path.string();
}

void print_info(const strongbox::execution::vault& vault) {
  auto info = vault.info();
  std::cout << "vault_address=" << strongbox::schema::to_string(info.vault_address)
            << '\n'
            << "token=" << strongbox::schema::to_string(info.token) << '\n'
            << "owner=" << strongbox::schema::to_string(info.owner) << '\n'
            << "fee_collector="
            << strongbox::schema::to_string(info.fee_collector) << '\n'
            << "fee_percentage=" << info.fee_percentage << '\n'
            << "withdrawal_limit="
            << strongbox::schema::to_string(info.withdrawal_limit) << '\n'
            << "withdrawal_timelock=" << info.withdrawal_timelock << '\n'
            << "total_deposited="
            << strongbox::schema::to_string(info.total_deposited) << '\n'
            << "vault_balance="
            << strongbox::schema::to_string(vault.vault_balance()) << '\n'
            << "version=" << info.config_version << '\n'
            << "pause_state="
            << strongbox::schema::to_string(info.pause_state)
            << '\n'
            << "operators=" << vault.operators().size() << '\n'
            << "events=" << vault.event_count() << '\n';
  if (info.label) {
    std::cout << "label=" << strongbox::schema::make_string(*info.label)
              << '\n';
  }
}

void print_result(const std::size_t line_number,
                  const std::string& command,
                  const strongbox::schema::operation_result_t& result) {
  if (!strongbox::schema::succeeded(result)) {
    std::cout << line_number << ' ' << command << ": error " << result.log
              << " (" << result.code << ")\n";
    return;
  }
  std::cout << line_number << ' ' << command << ": ok\n";
  for (const auto& record : result.events) {
    std::cout << "  event " << record.sequence << ' '
              << strongbox::schema::event_name(record.event) << '\n';
  }
}

/// Run one script. Returns false on a malformed line.
bool run_script(std::istream& input,
                strongbox::execution::vault& vault,
                strongbox::ledger::memory_token_ledger& ledger,
                strongbox::schema::timestamp_seconds_t& now) {
  auto line = std::string{};
  auto line_number = std::size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    auto tokens = std::vector<std::string>{};
    auto stream = std::istringstream{line};
    for (auto token = std::string{}; stream >> token;) {
      if (token.starts_with('#')) {
        break;
      }
      tokens.push_back(token);
    }
    if (tokens.empty()) {
      continue;
    }

    const auto& command = tokens[0];
    auto fail = [&](const std::string_view reason) {
      std::cerr << "line " << line_number << ": " << reason << '\n';
      return false;
    };
    auto expect_args = [&](const std::size_t count) {
      return tokens.size() == count + 1;
    };

    if (command == "info") {
      if (!expect_args(0)) {
        return fail("usage: info");
      }
      print_info(vault);
      continue;
    }
    if (command == "advance") {
      auto seconds = expect_args(1) ? parse_u64(tokens[1]) : std::nullopt;
      if (!seconds) {
        return fail("usage: advance <seconds>");
      }
      if (*seconds >
          std::numeric_limits<strongbox::schema::timestamp_seconds_t>::max() -
              now) {
        return fail("advance moves the clock past its range");
      }
      now += *seconds;
      std::cout << line_number << " advance: now=" << now << '\n';
      continue;
    }
    if (command == "pause" || command == "unpause") {
      if (!expect_args(1)) {
        return fail("usage: pause|unpause <caller>");
      }
      auto caller = resolve_account(tokens[1]);
      print_result(line_number, command,
                   command == "pause" ? vault.pause(caller)
                                      : vault.unpause(caller));
      continue;
    }

    if (!expect_args(2)) {
      return fail("expected: <command> <account> <argument>");
    }
    auto account = resolve_account(tokens[1]);
    const auto& argument = tokens[2];

    if (command == "credit" || command == "approve" || command == "deposit" ||
        command == "withdraw" || command == "emergency-withdraw" ||
        command == "set-limit") {
      auto amount = strongbox::schema::try_make_amount(argument);
      if (!amount) {
        return fail("invalid amount");
      }
      if (command == "credit") {
        ledger.credit(account, *amount);
        std::cout << line_number << " credit: balance="
                  << strongbox::schema::to_string(ledger.balance_of(account))
                  << '\n';
      } else if (command == "approve") {
        ledger.approve(account, vault.vault_address(), *amount);
        std::cout << line_number << " approve: allowance="
                  << strongbox::schema::to_string(
                         ledger.allowance(account, vault.vault_address()))
                  << '\n';
      } else if (command == "deposit") {
        print_result(line_number, command, vault.deposit(account, *amount));
      } else if (command == "withdraw") {
        print_result(line_number, command, vault.withdraw(account, *amount));
      } else if (command == "emergency-withdraw") {
        print_result(line_number, command,
                     vault.emergency_withdraw(account, *amount));
      } else {
        print_result(line_number, command,
                     vault.set_withdrawal_limit(account, *amount));
      }
    } else if (command == "set-fee" || command == "set-timelock") {
      auto value = parse_u64(argument);
      if (!value) {
        return fail("invalid number");
      }
      if (command == "set-fee") {
        // Oversized fees saturate and are refused by the vault itself.
        auto fee = std::min<uint64_t>(
            *value,
            std::numeric_limits<strongbox::schema::basis_points_t>::max());
        print_result(line_number, command,
                     vault.set_fee_percentage(
                         account,
                         static_cast<strongbox::schema::basis_points_t>(fee)));
      } else {
        print_result(line_number, command,
                     vault.set_withdrawal_timelock(account, *value));
      }
    } else if (command == "set-fee-collector") {
      print_result(line_number, command,
                   vault.set_fee_collector(account, resolve_account(argument)));
    } else if (command == "add-operator") {
      print_result(line_number, command,
                   vault.add_operator(account, resolve_account(argument)));
    } else if (command == "remove-operator") {
      print_result(line_number, command,
                   vault.remove_operator(account, resolve_account(argument)));
    } else if (command == "transfer-ownership") {
      print_result(line_number, command,
                   vault.transfer_ownership(account, resolve_account(argument)));
    } else {
      return fail("unknown command " + command);
    }
  }
  return true;
}

}  // namespace

int main(int argc, const char** argv) {
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto log_path = std::string{};
  auto script_path = std::string{};

  auto description = po::options_description{"strongbox options"};
  description.add_options()("help,h", "show help")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style file with any of these options")(
      "db-path", po::value<std::string>(&db_path),
      "RocksDB directory; defaults to a fresh temporary directory")(
      "log-file", po::value<std::string>(&log_path)->default_value(
                      "strongbox.log"),
      "log file path")("verbose,v", "enable debug logging")(
      "token", po::value<std::string>(), "token account (name or hex)")(
      "owner", po::value<std::string>(), "deployer account (name or hex)")(
      "fee-collector", po::value<std::string>(),
      "fee collector account (name or hex)")(
      "fee-bps", po::value<uint16_t>()->default_value(0),
      "withdrawal fee in basis points")(
      "withdrawal-limit", po::value<std::string>()->default_value("0"),
      "per-call withdrawal limit")(
      "timelock", po::value<uint64_t>()->default_value(0),
      "seconds between withdrawals per depositor")(
      "label", po::value<std::string>(), "vault label")(
      "start-time", po::value<uint64_t>(),
      "initial clock in unix seconds; defaults to now")(
      "script", po::value<std::string>(&script_path),
      "script file; reads stdin when omitted or '-'");

  auto positional = po::positional_options_description{};
  positional.add("script", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return kExitScriptError;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "strongbox", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  for (const auto* required : {"token", "owner", "fee-collector"}) {
    if (!vm.contains(required)) {
      spdlog::error("--{} is required", required);
      spdlog::shutdown();
      return kExitScriptError;
    }
  }
  auto withdrawal_limit = strongbox::schema::try_make_amount(
      vm["withdrawal-limit"].as<std::string>());
  if (!withdrawal_limit) {
    spdlog::error("--withdrawal-limit is not a decimal amount");
    spdlog::shutdown();
    return kExitScriptError;
  }

  auto params = strongbox::schema::create_vault_t{};
  params.token = resolve_account(vm["token"].as<std::string>());
  params.fee_collector = resolve_account(vm["fee-collector"].as<std::string>());
  params.fee_percentage = vm["fee-bps"].as<uint16_t>();
  params.withdrawal_limit = *withdrawal_limit;
  params.withdrawal_timelock = vm["timelock"].as<uint64_t>();
  if (vm.contains("label")) {
    params.label =
        strongbox::schema::make_bytes(vm["label"].as<std::string>());
  }
  auto owner = resolve_account(vm["owner"].as<std::string>());

  if (auto error = strongbox::execution::validate_create_vault(owner, params)) {
    spdlog::error("Invalid vault parameters: {}",
                  strongbox::schema::to_string(*error));
    spdlog::shutdown();
    return kExitScriptError;
  }

  auto script_file = std::optional<std::ifstream>{};
  if (!script_path.empty() && script_path != "-") {
    script_file.emplace(script_path);
    if (!*script_file) {
      spdlog::error("Cannot open script {}", script_path);
      spdlog::shutdown();
      return kExitScriptError;
    }
  }

  auto temporary_db = db_path.empty();
  if (temporary_db) {
    db_path = make_unique_db_path();
  }

  auto exit_code = 0;
  {
    auto encoder = encoder_t{};
    auto storage = strongbox::storage::make_storage<
        strongbox::storage::rocksdb_storage_tag>(db_path);
    if (storage.get<strongbox::schema::vault_state_t>(
            encoder, strongbox::schema::key::make_vault_state_key())) {
      // The reference ledger lives in memory, so persisted custody totals
      // could not be matched against balances.
      spdlog::error("{} already holds a vault; use a fresh --db-path",
                    db_path);
      spdlog::shutdown();
      return kExitScriptError;
    }

    auto now = vm.contains("start-time")
                   ? vm["start-time"].as<uint64_t>()
                   : strongbox::execution::system_time_source()();
    auto ledger = strongbox::ledger::memory_token_ledger{};
    auto vault = strongbox::execution::vault{
        encoder, storage, ledger, [&now] { return now; }, owner, params};

    auto ok = script_file ? run_script(*script_file, vault, ledger, now)
                          : run_script(std::cin, vault, ledger, now);

    print_info(vault);
    auto verified = vault.verify_events();
    std::cout << "event_chain=" << (verified ? "verified" : "broken")
              << std::endl;
    if (!ok) {
      exit_code = kExitScriptError;
    } else if (!verified) {
      exit_code = 1;
    }
  }

  if (temporary_db) {
    auto error = std::error_code{};
    std::filesystem::remove_all(db_path, error);
    if (error) {
      spdlog::warn("Failed to remove {}: {}", db_path, error.message());
    }
  }
  spdlog::shutdown();
  return exit_code;
}
