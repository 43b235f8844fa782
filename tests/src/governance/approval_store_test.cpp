#include <tollgate/governance/approval_store.hpp>
#include <tollgate/schema/encoding/scale/encoder.hpp>
#include <tollgate/storage/rocksdb/storage.hpp>
#include <tollgate/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

using tollgate::schema::approval_outcome_t;
using tollgate::schema::approval_status_t;
using tollgate::schema::error_code;

class approval_store_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = tollgate::testing::make_db_path("tollgate_approvals");
    storage_ = tollgate::storage::make_storage<
        tollgate::storage::rocksdb_storage_tag>(db_path_);
  }

  void TearDown() override {
    storage_.database.reset();
    tollgate::testing::remove_path(db_path_);
  }

  std::string db_path_;
  tollgate::schema::encoding::scale_encoder_t encoder_;
  tollgate::storage::rocksdb_storage_t storage_;
};

}  // namespace

TEST_F(approval_store_test, create_issues_pending_approval) {
  auto store = tollgate::governance::approval_store{encoder_, storage_};
  auto approval = store.create("exec-1");
  EXPECT_EQ(approval.approval_id, "a1");
  EXPECT_EQ(approval.execution_id, "exec-1");
  EXPECT_EQ(approval.status, approval_status_t::pending);
  EXPECT_FALSE(approval.decided_at.has_value());
}

TEST_F(approval_store_test, create_is_idempotent_per_execution) {
  auto store = tollgate::governance::approval_store{encoder_, storage_};
  auto first = store.create("exec-1");
  auto second = store.create("exec-1");
  EXPECT_EQ(first.approval_id, second.approval_id);
  EXPECT_EQ(store.list_pending().size(), 1u);
}

TEST_F(approval_store_test, decide_is_final) {
  auto store = tollgate::governance::approval_store{encoder_, storage_};
  auto approval = store.create("exec-1");

  auto decided = store.decide(approval.approval_id, approval_outcome_t::approve,
                              "operator");
  ASSERT_EQ(decided.code, 0u);
  ASSERT_TRUE(decided.approval.has_value());
  EXPECT_EQ(decided.approval->status, approval_status_t::approved);
  EXPECT_EQ(decided.approval->decided_by, std::optional<std::string>{"operator"});

  auto again = store.decide(approval.approval_id, approval_outcome_t::reject,
                            "someone-else");
  EXPECT_EQ(again.code, tollgate::schema::to_code(error_code::approval_conflict));
  EXPECT_EQ(store.get(approval.approval_id)->status, approval_status_t::approved);
}

TEST_F(approval_store_test, unknown_approval_is_not_found) {
  auto store = tollgate::governance::approval_store{encoder_, storage_};
  auto result = store.decide("a999", approval_outcome_t::approve, "operator");
  EXPECT_EQ(result.code,
            tollgate::schema::to_code(error_code::approval_not_found));
  EXPECT_FALSE(result.approval.has_value());
}

TEST_F(approval_store_test, list_pending_is_in_creation_order) {
  auto store = tollgate::governance::approval_store{encoder_, storage_};
  for (auto i = 1; i <= 11; ++i) {
    store.create("exec-" + std::to_string(i));
  }
  store.decide("a2", approval_outcome_t::reject, "operator");

  auto pending = store.list_pending();
  ASSERT_EQ(pending.size(), 10u);
  EXPECT_EQ(pending.front().approval_id, "a1");
  EXPECT_EQ(pending[1].approval_id, "a3");
  EXPECT_EQ(pending.back().approval_id, "a11");
}

TEST_F(approval_store_test, created_approval_is_visible_from_other_threads) {
  auto store = tollgate::governance::approval_store{encoder_, storage_};
  auto approval_id = std::string{};
  auto creator = std::thread{[&] { approval_id = store.create("exec-1").approval_id; }};
  creator.join();

  auto seen = std::optional<tollgate::schema::approval_record_t>{};
  auto reader = std::thread{[&] { seen = store.get(approval_id); }};
  reader.join();
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(seen->execution_id, "exec-1");
  EXPECT_EQ(store.find_by_execution("exec-1")->approval_id, approval_id);
}

TEST_F(approval_store_test, concurrent_decisions_have_one_winner) {
  auto store = tollgate::governance::approval_store{encoder_, storage_};
  auto approval = store.create("exec-1");

  auto winners = std::atomic<int>{0};
  auto conflicts = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      auto outcome =
          i % 2 == 0 ? approval_outcome_t::approve : approval_outcome_t::reject;
      auto result = store.decide(approval.approval_id, outcome,
                                 "operator-" + std::to_string(i));
      if (result.code == 0) {
        ++winners;
      } else if (result.code ==
                 tollgate::schema::to_code(error_code::approval_conflict)) {
        ++conflicts;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(conflicts.load(), 7);
}

TEST_F(approval_store_test, sequence_survives_reopen) {
  {
    auto store = tollgate::governance::approval_store{encoder_, storage_};
    store.create("exec-1");
    store.create("exec-2");
  }
  storage_.database.reset();
  storage_ = tollgate::storage::make_storage<
      tollgate::storage::rocksdb_storage_tag>(db_path_);

  auto store = tollgate::governance::approval_store{encoder_, storage_};
  EXPECT_EQ(store.create("exec-3").approval_id, "a3");
  EXPECT_EQ(store.get("a1")->execution_id, "exec-1");
}
