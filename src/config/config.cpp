#include <medtrust/config/config.hpp>
#include <medtrust/ledger/explorer.hpp>

#include <spdlog/spdlog.h>

#include <fstream>

namespace po = boost::program_options;

namespace medtrust::config {

po::options_description config_options() {
  auto defaults = engine_config{};
  auto description = po::options_description{"Engine configuration"};
  description.add_options()(
      "anchor.mode",
      po::value<std::string>()->default_value(
          std::string{medtrust::schema::to_string(defaults.anchor_mode)}),
      "Ledger anchoring on issuance: disabled, sync or async")(
      "ledger.timeout_ms",
      po::value<int64_t>()->default_value(defaults.ledger_timeout.count()),
      "Upper bound on every ledger call, in milliseconds")(
      "ledger.network", po::value<std::string>()->default_value(defaults.network),
      "Ledger network name")(
      "ledger.explorer", po::value<std::string>(),
      "Block explorer base URL, overriding the network default")(
      "ledger.check",
      po::value<bool>()->default_value(defaults.ledger_check),
      "Consult the ledger during verification by default")(
      "keys.dir",
      po::value<std::string>()->default_value(defaults.key_dir.string()),
      "Directory holding issuer key files")(
      "data.dir",
      po::value<std::string>()->default_value(defaults.data_dir.string()),
      "Directory holding the registry and local ledger")(
      "log.level", po::value<std::string>()->default_value(defaults.log_level),
      "trace, debug, info, warn, error or critical")(
      "log.file", po::value<std::string>(), "Also write logs to this file");
  return description;
}

config_result_t make_config(const po::variables_map& vm) {
  auto config = engine_config{};

  if (vm.contains("anchor.mode")) {
    auto text = vm["anchor.mode"].as<std::string>();
    auto mode = medtrust::schema::from_string(
        std::string_view{text}, medtrust::schema::kAnchorModeMappings);
    if (!mode.has_value()) {
      return config_error{"unknown anchor.mode '" + text + "'"};
    }
    config.anchor_mode = *mode;
  }
  if (vm.contains("ledger.timeout_ms")) {
    auto timeout = vm["ledger.timeout_ms"].as<int64_t>();
    if (timeout <= 0) {
      return config_error{"ledger.timeout_ms must be positive"};
    }
    config.ledger_timeout = std::chrono::milliseconds{timeout};
  }
  if (vm.contains("ledger.network")) {
    config.network = vm["ledger.network"].as<std::string>();
  }
  if (vm.contains("ledger.explorer")) {
    config.explorer_base = vm["ledger.explorer"].as<std::string>();
  }
  if (vm.contains("ledger.check")) {
    config.ledger_check = vm["ledger.check"].as<bool>();
  }
  if (vm.contains("keys.dir")) {
    config.key_dir = vm["keys.dir"].as<std::string>();
  }
  if (vm.contains("data.dir")) {
    config.data_dir = vm["data.dir"].as<std::string>();
  }
  if (vm.contains("log.level")) {
    config.log_level = vm["log.level"].as<std::string>();
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
      return config_error{"unknown log.level '" + config.log_level + "'"};
    }
  }
  if (vm.contains("log.file")) {
    config.log_file = vm["log.file"].as<std::string>();
  }
  return config;
}

config_result_t parse_config(std::istream& stream) {
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(stream, config_options()), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    return config_error{e.what()};
  }
  return make_config(vm);
}

config_result_t load_config_file(const std::filesystem::path& path) {
  auto stream = std::ifstream{path};
  if (!stream) {
    return config_error{"cannot open config file " + path.string()};
  }
  spdlog::debug("Loading configuration from {}", path.string());
  return parse_config(stream);
}

std::string explorer_link(const engine_config& config,
                          const std::string& ledger_reference) {
  if (config.explorer_base.has_value()) {
    return *config.explorer_base + ledger_reference;
  }
  return medtrust::ledger::explorer_url(config.network, ledger_reference);
}

}  // namespace medtrust::config
