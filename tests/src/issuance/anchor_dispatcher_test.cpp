#include <gtest/gtest.h>
#include <medtrust/issuance/anchor_dispatcher.hpp>
#include <medtrust/ledger/memory_ledger.hpp>
#include <medtrust/testing/common.hpp>

#include <memory>
#include <variant>
#include <vector>

using medtrust::schema::anchor_error;
using medtrust::schema::anchor_receipt;

TEST(anchor_dispatcher, reports_outcomes_after_drain) {
  auto ledger = std::make_shared<medtrust::ledger::memory_ledger>();
  auto coordinator =
      std::make_shared<medtrust::ledger::batch_coordinator>(ledger);
  auto dispatcher = medtrust::issuance::anchor_dispatcher{ledger, coordinator};
  auto good = medtrust::testing::make_hash(1);
  auto bad = medtrust::testing::make_hash(2);
  ledger->reject(bad);

  dispatcher.submit(good);
  dispatcher.submit(bad);
  dispatcher.drain();

  auto status = dispatcher.status(good);
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(std::holds_alternative<anchor_receipt>(*status));
  EXPECT_TRUE(coordinator->known_receipt(good).has_value());

  status = dispatcher.status(bad);
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(std::holds_alternative<anchor_error>(*status));
  EXPECT_EQ(coordinator->pending(), std::vector{bad});
}

TEST(anchor_dispatcher, retains_only_the_latest_outcomes) {
  auto ledger = std::make_shared<medtrust::ledger::memory_ledger>();
  auto coordinator =
      std::make_shared<medtrust::ledger::batch_coordinator>(ledger);
  auto dispatcher =
      medtrust::issuance::anchor_dispatcher{ledger, coordinator, 1, 3};

  for (auto seed = uint8_t{10}; seed < 40; ++seed) {
    dispatcher.submit(medtrust::testing::make_hash(seed));
  }
  dispatcher.drain();

  EXPECT_EQ(dispatcher.retained_results(), 3u);
  EXPECT_FALSE(dispatcher.status(medtrust::testing::make_hash(10)).has_value());
  EXPECT_TRUE(dispatcher.status(medtrust::testing::make_hash(39)).has_value());
  EXPECT_EQ(ledger->info().anchored_count, 30u);
}

TEST(anchor_dispatcher, resubmission_replaces_the_old_outcome) {
  auto ledger = std::make_shared<medtrust::ledger::memory_ledger>();
  auto coordinator =
      std::make_shared<medtrust::ledger::batch_coordinator>(ledger);
  auto dispatcher =
      medtrust::issuance::anchor_dispatcher{ledger, coordinator, 1, 2};
  auto hash = medtrust::testing::make_hash(50);
  ledger->reject(hash);
  dispatcher.submit(hash);
  dispatcher.drain();

  ledger->accept(hash);
  dispatcher.submit(hash);
  dispatcher.drain();
  EXPECT_EQ(dispatcher.retained_results(), 1u);
  auto status = dispatcher.status(hash);
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(std::holds_alternative<anchor_receipt>(*status));
}
