#include "taskweave/graph/repair.hpp"
#include "taskweave/graph/validator.hpp"

#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskweave;
using taskweave::test::deps_of;
using taskweave::test::DocumentBuilder;
using taskweave::test::ref;
using taskweave::test::refs;

class GraphRepairTest : public ::testing::Test {
protected:
  auto repair(Document& doc, RepairOptions options = {}) -> RepairReport {
    return GraphRepair::repair(doc, options, [this](const RepairAction& a) {
      seen_.push_back(a);
    });
  }

  std::vector<RepairAction> seen_;
};

TEST_F(GraphRepairTest, ValidDocumentIsUnchanged) {
  auto doc = DocumentBuilder{}.task(1).task(2, {"1"}).subtask(2, 1, {"1"}).build();
  auto report = repair(doc);
  EXPECT_FALSE(report.changed);
  EXPECT_EQ(report.stats.total(), 0u);
  EXPECT_TRUE(report.actions.empty());
  EXPECT_TRUE(seen_.empty());
}

TEST_F(GraphRepairTest, SelfLoopAndDuplicate) {
  auto doc = DocumentBuilder{}.task(1, {"2", "2", "1"}).task(2).build();

  auto report = repair(doc);

  EXPECT_TRUE(report.changed);
  EXPECT_EQ(deps_of(doc, "1"), refs({"2"}));
  EXPECT_EQ(report.stats.duplicates, 1u);
  EXPECT_EQ(report.stats.self_loops, 1u);
  EXPECT_EQ(report.stats.tasks_fixed, 1u);
  EXPECT_EQ(report.stats.subtasks_fixed, 0u);
  ASSERT_EQ(report.actions.size(), 2u);
  EXPECT_EQ(report.actions[0].reason, RepairReason::Duplicate);
  EXPECT_EQ(report.actions[1].reason, RepairReason::SelfLoop);
  EXPECT_EQ(report.actions[1].removed, ref("1"));
}

TEST_F(GraphRepairTest, DuplicatesKeptWhenDisabled) {
  auto doc = DocumentBuilder{}.task(1, {"2", "2"}).task(2).build();
  auto report = repair(doc, RepairOptions{.remove_duplicates = false});
  EXPECT_FALSE(report.changed);
  EXPECT_EQ(deps_of(doc, "1"), refs({"2", "2"}));
}

TEST_F(GraphRepairTest, DanglingSubtaskReference) {
  auto doc = DocumentBuilder{}.task(5).subtask(5, 1, {"5.2"}).build();

  auto report = repair(doc);

  EXPECT_TRUE(report.changed);
  EXPECT_TRUE(deps_of(doc, "5.1").empty());
  EXPECT_EQ(report.stats.dangling, 1u);
  EXPECT_EQ(report.stats.subtasks_fixed, 1u);
  ASSERT_EQ(seen_.size(), 1u);
  EXPECT_EQ(seen_[0].node, ref("5.1"));
  EXPECT_EQ(seen_[0].removed, ref("5.2"));
  EXPECT_EQ(seen_[0].reason, RepairReason::Dangling);
}

TEST_F(GraphRepairTest, CycleLosesOnlyFirstEdgeInDocumentOrder) {
  auto doc = DocumentBuilder{}
                 .task(1, {"2"})
                 .task(2, {"3"})
                 .task(3, {"1"})
                 .build();

  auto report = repair(doc);

  EXPECT_EQ(report.stats.cyclic, 1u);
  EXPECT_TRUE(deps_of(doc, "1").empty());
  EXPECT_EQ(deps_of(doc, "2"), refs({"3"}));
  EXPECT_EQ(deps_of(doc, "3"), refs({"1"}));
  EXPECT_TRUE(test::all_edges_valid(doc));
}

TEST_F(GraphRepairTest, EdgeIntoCycleSurvives) {
  auto doc = DocumentBuilder{}
                 .task(1, {"2"})
                 .task(2, {"3"})
                 .task(3, {"2"})
                 .build();

  auto report = repair(doc);

  EXPECT_EQ(report.stats.cyclic, 1u);
  EXPECT_EQ(deps_of(doc, "1"), refs({"2"}));
  EXPECT_TRUE(deps_of(doc, "2").empty());
  EXPECT_EQ(deps_of(doc, "3"), refs({"2"}));
}

TEST_F(GraphRepairTest, MixedProblemsLeaveAValidGraph) {
  auto doc = DocumentBuilder{}
                 .task(1, {"1", "4", "2"})
                 .task(2, {"3", "3", "2.7"})
                 .task(3, {"1", "3.1"})
                 .subtask(3, 1, {"3.1", "3", "2"})
                 .build();

  auto report = repair(doc);

  EXPECT_TRUE(report.changed);
  EXPECT_TRUE(test::all_edges_valid(doc));
  EXPECT_TRUE(GraphValidator::validate(doc).has_value());
}

TEST_F(GraphRepairTest, Idempotent) {
  auto doc = DocumentBuilder{}
                 .task(1, {"2", "9"})
                 .task(2, {"1", "2"})
                 .subtask(2, 1, {"2.2", "1"})
                 .build();

  auto first = repair(doc);
  EXPECT_TRUE(first.changed);

  auto second = repair(doc);
  EXPECT_FALSE(second.changed);
  EXPECT_TRUE(second.actions.empty());
}

TEST_F(GraphRepairTest, NeverDeletesNodes) {
  auto doc = DocumentBuilder{}
                 .task(1, {"2"})
                 .task(2, {"1"})
                 .subtask(2, 1, {"9.9"})
                 .build();
  (void)repair(doc);
  EXPECT_EQ(doc.task_count(), 2u);
  EXPECT_EQ(doc.subtask_count(), 1u);
}

TEST_F(GraphRepairTest, DrainsDecodeNormalizations) {
  auto doc = DocumentBuilder{}.task(1).task(2).subtask(2, 1).build();
  doc.pending_normalizations.push_back(Normalization{
      .node = ref("1"),
      .kind = NormalizationKind::Malformed,
      .ref = std::nullopt,
      .detail = "dependencies was not a list, reset to []",
  });
  doc.pending_normalizations.push_back(Normalization{
      .node = ref("2.1"),
      .kind = NormalizationKind::Migrated,
      .ref = std::nullopt,
      .detail = "bare 1 read as sibling 2.1",
  });

  auto report = repair(doc);

  EXPECT_TRUE(report.changed);
  EXPECT_EQ(report.stats.malformed, 1u);
  EXPECT_EQ(report.stats.migrated, 1u);
  EXPECT_EQ(report.stats.edges_removed(), 0u);
  EXPECT_EQ(report.stats.tasks_fixed, 1u);
  EXPECT_EQ(report.stats.subtasks_fixed, 1u);
  EXPECT_TRUE(doc.pending_normalizations.empty());
  ASSERT_EQ(seen_.size(), 2u);
  EXPECT_EQ(seen_[0].reason, RepairReason::Malformed);
  EXPECT_EQ(seen_[1].reason, RepairReason::Migrated);

  EXPECT_FALSE(repair(doc).changed);
}

TEST(GraphRepairSinkTest, EmptySinkIsAllowed) {
  auto doc = DocumentBuilder{}.task(1, {"1"}).build();
  auto report = GraphRepair::repair(doc);
  EXPECT_TRUE(report.changed);
  EXPECT_EQ(report.actions.size(), 1u);
}
