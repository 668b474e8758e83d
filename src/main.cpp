#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <medtrust/audit/audit_sink.hpp>
#include <medtrust/config/config.hpp>
#include <medtrust/crypto/keys.hpp>
#include <medtrust/crypto/verify.hpp>
#include <medtrust/issuance/signing_service.hpp>
#include <medtrust/ledger/storage_ledger.hpp>
#include <medtrust/ledger/timed_anchor_client.hpp>
#include <medtrust/registry/storage_key_registry.hpp>
#include <medtrust/schema/calendar_date.hpp>
#include <medtrust/service/authenticator.hpp>
#include <medtrust/service/key_store.hpp>
#include <medtrust/storage/rocksdb/storage.hpp>
#include <medtrust/verification/engine.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

inline constexpr auto kUsage =
    "Usage: medtrust_cli <command> [options]\n"
    "Commands: keygen, register-key, revoke, keys, sign, verify, ledger-info";

void setup_logging(const medtrust::config::engine_config& config) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (config.log_file.has_value()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.log_file->string(), false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "medtrust", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(config.log_level));
}

/// Long-lived collaborators opened from the data directory.
struct runtime final {
  medtrust::config::engine_config config;
  std::shared_ptr<medtrust::storage::rocksdb_storage_t> store;
  std::shared_ptr<medtrust::registry::key_registry> registry;
  std::shared_ptr<medtrust::ledger::anchor_client> ledger;
  std::shared_ptr<medtrust::service::file_key_store> keys;
};

runtime open_runtime(const medtrust::config::engine_config& config) {
  auto error = std::error_code{};
  std::filesystem::create_directories(config.data_dir, error);
  if (error) {
    spdlog::error("Cannot create data directory {}: {}",
                  config.data_dir.string(), error.message());
  }
  auto store = std::make_shared<medtrust::storage::rocksdb_storage_t>(
      medtrust::storage::make_storage<medtrust::storage::rocksdb_storage_tag>(
          (config.data_dir / "medtrust.db").string()));
  auto local_ledger = std::make_shared<medtrust::ledger::storage_ledger>(
      store, config.network);
  return runtime{
      .config = config,
      .store = store,
      .registry =
          std::make_shared<medtrust::registry::storage_key_registry>(store),
      .ledger = std::make_shared<medtrust::ledger::timed_anchor_client>(
          local_ledger, config.ledger_timeout),
      .keys = std::make_shared<medtrust::service::file_key_store>(
          config.key_dir)};
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    throw po::required_option{name};
  }
  return vm[name].as<std::string>();
}

int run_keygen(const runtime& rt, const po::variables_map& vm) {
  auto issuer = require(vm, "issuer");
  auto key = medtrust::crypto::private_key::generate();
  if (!key.has_value()) {
    spdlog::error("Key generation failed");
    return 1;
  }
  if (!rt.keys->store(issuer, *key)) {
    return 1;
  }
  std::cout << "private key: " << rt.keys->private_key_path(issuer).string()
            << "\npublic key:  " << rt.keys->public_key_path(issuer).string()
            << "\nkey:         "
            << medtrust::schema::to_hex(key->public_key()) << std::endl;
  return 0;
}

int run_register_key(const runtime& rt, const po::variables_map& vm) {
  auto issuer = require(vm, "issuer");
  auto public_key = std::optional<medtrust::schema::public_key_t>{};
  if (vm.contains("public-key")) {
    auto bytes =
        medtrust::schema::try_from_hex(vm["public-key"].as<std::string>());
    if (bytes.has_value()) {
      public_key = medtrust::schema::try_make_public_key(
          medtrust::schema::bytes_view_t{*bytes});
    }
  } else {
    auto key = rt.keys->resolve(issuer);
    if (key.has_value()) {
      public_key = key->public_key();
    }
  }
  if (!public_key.has_value()) {
    spdlog::error("No usable public key for issuer '{}'", issuer);
    return 1;
  }
  auto added = rt.registry->register_key(issuer, *public_key);
  std::cout << (added ? "registered " : "already registered ")
            << medtrust::schema::to_hex(*public_key) << " for " << issuer
            << std::endl;
  return 0;
}

int run_revoke(const runtime& rt, const po::variables_map& vm) {
  auto issuer = require(vm, "issuer");
  auto changed = rt.registry->revoke(issuer);
  std::cout << (changed ? "revoked " : "nothing to revoke for ") << issuer
            << std::endl;
  return 0;
}

int run_keys(const runtime& rt, const po::variables_map& vm) {
  auto issuer = require(vm, "issuer");
  for (const auto& record : rt.registry->keys_of(issuer)) {
    std::cout << medtrust::schema::to_hex(record.public_key) << " "
              << medtrust::schema::to_string(record.status())
              << " registered_at=" << record.registered_at;
    if (record.revoked_at.has_value()) {
      std::cout << " revoked_at=" << *record.revoked_at;
    }
    std::cout << std::endl;
  }
  return 0;
}

int run_sign(const runtime& rt,
             const po::variables_map& vm,
             const std::shared_ptr<medtrust::audit::audit_sink>& audit) {
  auto fields = medtrust::service::payload_fields{
      .medicine_id = require(vm, "medicine"),
      .batch_number = require(vm, "batch"),
      .manufacture_date = require(vm, "mfg"),
      .expiry_date = require(vm, "exp"),
      .issuer_id = require(vm, "issuer"),
      .sequence = vm["sequence"].as<uint64_t>()};
  auto reference =
      vm.contains("key") ? vm["key"].as<std::string>() : fields.issuer_id;

  auto signer = std::make_shared<medtrust::issuance::signing_service>(
      rt.registry, rt.ledger, rt.config.anchor_mode);
  auto verifier =
      std::make_shared<medtrust::verification::engine>(rt.registry, rt.ledger);
  auto service = medtrust::service::authenticator{signer, verifier, rt.keys,
                                                  audit};

  auto response = service.request_signing(fields, reference);
  signer->drain();
  return std::visit(
      overloaded{
          [&](const medtrust::service::issued_record& issued) {
            std::cout << issued.qr_text << std::endl;
            auto record = signer->attach_anchor(issued.record);
            if (record.anchor.has_value()) {
              spdlog::info("Anchored as {}",
                           medtrust::config::explorer_link(
                               rt.config, record.anchor->ledger_reference));
            }
            return 0;
          },
          [&](const medtrust::schema::issuance_error& error) {
            spdlog::error("Signing refused ({}): {}",
                          medtrust::schema::to_string(error.code),
                          error.message);
            return 1;
          }},
      response);
}

int run_verify(const runtime& rt,
               const po::variables_map& vm,
               const std::shared_ptr<medtrust::audit::audit_sink>& audit) {
  auto qr_text = require(vm, "qr");
  auto as_of = medtrust::common::system_now();
  if (vm.contains("as-of")) {
    auto date = medtrust::schema::try_parse_iso_date(
        vm["as-of"].as<std::string>());
    if (!date.has_value()) {
      spdlog::error("--as-of must be YYYY-MM-DD");
      return 1;
    }
    as_of = medtrust::schema::start_of_day(*date);
  }
  auto ledger_check =
      vm.contains("ledger-check") ? true : rt.config.ledger_check;

  auto verifier =
      std::make_shared<medtrust::verification::engine>(rt.registry, rt.ledger);
  auto service =
      medtrust::service::authenticator{nullptr, verifier, nullptr, audit};
  auto result = service.request_verification(qr_text, as_of, ledger_check);

  std::cout << medtrust::schema::to_string(result.outcome);
  if (result.reduced_confidence()) {
    std::cout << " (reduced confidence)";
  }
  std::cout << std::endl;
  if (result.payload.has_value()) {
    std::cout << "medicine " << result.payload->medicine_id << " batch "
              << result.payload->batch_number << " expires "
              << medtrust::schema::to_iso_string(result.payload->expiry_date)
              << std::endl;
  }
  if (result.evidence.ledger_reference.has_value()) {
    std::cout << medtrust::config::explorer_link(
                     rt.config, *result.evidence.ledger_reference)
              << std::endl;
  }
  return result.outcome == medtrust::schema::verification_outcome_t::verified
             ? 0
             : 2;
}

int run_ledger_info(const runtime& rt) {
  auto info = rt.ledger->info();
  std::cout << "network " << info.network << "\navailable "
            << (info.available ? "yes" : "no") << "\nanchored "
            << info.anchored_count << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto config_file = std::string{};

  auto general = po::options_description{"medtrust"};
  general.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command), "Command to run")(
      "config,c", po::value<std::string>(&config_file),
      "INI-style configuration file")("issuer,i", po::value<std::string>(),
                                      "Issuer id")(
      "key,k", po::value<std::string>(), "Signing key reference")(
      "public-key", po::value<std::string>(), "Compressed public key, hex")(
      "medicine", po::value<std::string>(), "Medicine id")(
      "batch", po::value<std::string>(), "Batch number")(
      "mfg", po::value<std::string>(), "Manufacture date, YYYY-MM-DD")(
      "exp", po::value<std::string>(), "Expiry date, YYYY-MM-DD")(
      "sequence", po::value<uint64_t>()->default_value(0),
      "Unit sequence within the batch")("qr", po::value<std::string>(),
                                        "Scanned QR text")(
      "as-of", po::value<std::string>(), "Verify as of this date, YYYY-MM-DD")(
      "ledger-check", "Consult the ledger during verification");

  auto description = po::options_description{};
  description.add(general).add(medtrust::config::config_options());

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (!config_file.empty()) {
      // Values already on the command line take precedence.
      auto stream = std::ifstream{config_file};
      if (!stream) {
        std::cerr << "cannot open config file " << config_file << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(stream, medtrust::config::config_options()),
                vm);
      po::notify(vm);
    }
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << kUsage << std::endl;
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << kUsage << "\n" << description << std::endl;
    return command.empty() && !vm.contains("help") ? 1 : 0;
  }

  auto loaded = medtrust::config::make_config(vm);
  if (const auto* error = std::get_if<medtrust::config::config_error>(&loaded)) {
    std::cerr << error->message << std::endl;
    return 1;
  }
  const auto& config = std::get<medtrust::config::engine_config>(loaded);
  setup_logging(config);

  if (!medtrust::crypto::available()) {
    spdlog::critical("OpenSSL does not provide P-256");
    spdlog::shutdown();
    return 1;
  }

  auto audit = std::make_shared<medtrust::audit::log_audit_sink>();
  auto status = 0;
  try {
    auto rt = open_runtime(config);
    if (command == "keygen") {
      status = run_keygen(rt, vm);
    } else if (command == "register-key") {
      status = run_register_key(rt, vm);
    } else if (command == "revoke") {
      status = run_revoke(rt, vm);
    } else if (command == "keys") {
      status = run_keys(rt, vm);
    } else if (command == "sign") {
      status = run_sign(rt, vm, audit);
    } else if (command == "verify") {
      status = run_verify(rt, vm, audit);
    } else if (command == "ledger-info") {
      status = run_ledger_info(rt);
    } else {
      std::cerr << "unknown command '" << command << "'\n"
                << kUsage << std::endl;
      status = 1;
    }
  } catch (const po::error& e) {
    spdlog::error("{}", e.what());
    status = 1;
  } catch (const medtrust::registry::registry_unavailable& e) {
    spdlog::error("Key registry unavailable: {}", e.what());
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
