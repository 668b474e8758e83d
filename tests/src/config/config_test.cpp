#include <gtest/gtest.h>
#include <medtrust/config/config.hpp>
#include <medtrust/testing/common.hpp>

#include <fstream>
#include <sstream>
#include <variant>

using medtrust::config::config_error;
using medtrust::config::engine_config;

TEST(config, empty_stream_yields_defaults) {
  auto stream = std::istringstream{""};
  auto result = medtrust::config::parse_config(stream);
  ASSERT_TRUE(std::holds_alternative<engine_config>(result));
  const auto& config = std::get<engine_config>(result);
  EXPECT_EQ(config.anchor_mode, medtrust::schema::anchor_mode_t::disabled);
  EXPECT_EQ(config.ledger_timeout.count(), 2000);
  EXPECT_EQ(config.network, "polygon-mumbai");
  EXPECT_FALSE(config.explorer_base.has_value());
  EXPECT_FALSE(config.ledger_check);
  EXPECT_EQ(config.log_level, "info");
}

TEST(config, parses_sections) {
  auto stream = std::istringstream{
      "[anchor]\n"
      "mode = async\n"
      "[ledger]\n"
      "timeout_ms = 750\n"
      "network = sepolia\n"
      "check = true\n"
      "[keys]\n"
      "dir = /var/lib/medtrust/keys\n"
      "[log]\n"
      "level = debug\n"};
  auto result = medtrust::config::parse_config(stream);
  ASSERT_TRUE(std::holds_alternative<engine_config>(result));
  const auto& config = std::get<engine_config>(result);
  EXPECT_EQ(config.anchor_mode, medtrust::schema::anchor_mode_t::asynchronous);
  EXPECT_EQ(config.ledger_timeout.count(), 750);
  EXPECT_EQ(config.network, "sepolia");
  EXPECT_TRUE(config.ledger_check);
  EXPECT_EQ(config.key_dir.string(), "/var/lib/medtrust/keys");
  EXPECT_EQ(config.log_level, "debug");
}

TEST(config, rejects_unknown_anchor_mode) {
  auto stream = std::istringstream{"[anchor]\nmode = sometimes\n"};
  auto result = medtrust::config::parse_config(stream);
  ASSERT_TRUE(std::holds_alternative<config_error>(result));
  EXPECT_NE(std::get<config_error>(result).message.find("anchor.mode"),
            std::string::npos);
}

TEST(config, rejects_non_positive_timeout) {
  auto stream = std::istringstream{"[ledger]\ntimeout_ms = 0\n"};
  EXPECT_TRUE(std::holds_alternative<config_error>(
      medtrust::config::parse_config(stream)));
}

TEST(config, rejects_unknown_keys) {
  auto stream = std::istringstream{"[ledger]\nspeed = fast\n"};
  EXPECT_TRUE(std::holds_alternative<config_error>(
      medtrust::config::parse_config(stream)));
}

TEST(config, rejects_unknown_log_level) {
  auto stream = std::istringstream{"[log]\nlevel = chatty\n"};
  EXPECT_TRUE(std::holds_alternative<config_error>(
      medtrust::config::parse_config(stream)));
}

TEST(config, missing_file_is_an_error) {
  auto result = medtrust::config::load_config_file(
      medtrust::testing::make_temp_path("medtrust_missing_config"));
  EXPECT_TRUE(std::holds_alternative<config_error>(result));
}

TEST(config, loads_file) {
  auto path = medtrust::testing::make_temp_path("medtrust_config") + ".ini";
  {
    auto out = std::ofstream{path};
    out << "[anchor]\nmode = sync\n";
  }
  auto result = medtrust::config::load_config_file(path);
  medtrust::testing::remove_path(path);
  ASSERT_TRUE(std::holds_alternative<engine_config>(result));
  EXPECT_EQ(std::get<engine_config>(result).anchor_mode,
            medtrust::schema::anchor_mode_t::synchronous);
}

TEST(config, explorer_override_wins) {
  auto config = engine_config{};
  EXPECT_EQ(medtrust::config::explorer_link(config, "0x01"),
            "https://mumbai.polygonscan.com/tx/0x01");
  config.explorer_base = "https://explorer.example/tx/";
  EXPECT_EQ(medtrust::config::explorer_link(config, "0x01"),
            "https://explorer.example/tx/0x01");
}
