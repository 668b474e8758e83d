#pragma once
#include <medtrust/schema/anchor_mode.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <variant>

namespace medtrust::config {

/// Runtime settings for the engine and CLI. Every field has a default, so an
/// empty or missing config file is valid.
struct engine_config final {
  medtrust::schema::anchor_mode_t anchor_mode{
      medtrust::schema::anchor_mode_t::disabled};
  std::chrono::milliseconds ledger_timeout{2000};
  std::string network{"polygon-mumbai"};
  // Overrides the built-in explorer for `network` when set.
  std::optional<std::string> explorer_base;
  std::filesystem::path key_dir{"keys"};
  std::filesystem::path data_dir{"data"};
  std::string log_level{"info"};
  std::optional<std::filesystem::path> log_file;
  // Default for scans that do not say whether to consult the ledger.
  bool ledger_check{false};
};

struct config_error final {
  std::string message;
};

using config_result_t = std::variant<engine_config, config_error>;

/// Option set shared by config files and command lines. Keys use dotted
/// sections in files (`ledger.timeout_ms`) and the same names as flags
/// (`--ledger.timeout_ms`).
boost::program_options::options_description config_options();

/// Build a config from parsed options, validating enumerations and ranges.
config_result_t make_config(const boost::program_options::variables_map& vm);

/// Parse an INI-style config stream.
config_result_t parse_config(std::istream& stream);

/// Parse an INI-style config file. A missing file is an error.
config_result_t load_config_file(const std::filesystem::path& path);

/// Explorer link for a ledger reference under this configuration.
std::string explorer_link(const engine_config& config,
                          const std::string& ledger_reference);

}  // namespace medtrust::config
