#include "taskweave/graph/editor.hpp"
#include "taskweave/graph/resolver.hpp"
#include "taskweave/storage/document_store.hpp"

#include <limits>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskweave;
using taskweave::test::deps_of;
using taskweave::test::DocumentBuilder;
using taskweave::test::ref;
using taskweave::test::refs;

class TaskGraphEditorTest : public ::testing::Test {
protected:
  // Snapshot for "document unchanged" checks
  [[nodiscard]] static auto snapshot(const Document& doc) -> std::string {
    return DocumentCodec::to_string(doc);
  }

  TaskGraphEditor editor_;
};

TEST_F(TaskGraphEditorTest, AddDependency) {
  auto doc = DocumentBuilder{}.task(1).task(2).subtask(2, 1).build();

  auto r = editor_.add_dependency(doc, ref("2.1"), ref("1"));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(*r);
  EXPECT_EQ(deps_of(doc, "2.1"), refs({"1"}));
  EXPECT_FALSE(editor_.last_repair().changed);
}

TEST_F(TaskGraphEditorTest, AddExistingDependencyIsNoOp) {
  auto doc = DocumentBuilder{}.task(1).task(2, {"1"}).build();
  auto r = editor_.add_dependency(doc, ref("2"), ref("1"));
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(*r);
  EXPECT_EQ(deps_of(doc, "2"), refs({"1"}));
}

TEST_F(TaskGraphEditorTest, AddDependencyRejectsMissingEnds) {
  auto doc = DocumentBuilder{}.task(1).build();
  auto before = snapshot(doc);

  auto missing_from = editor_.add_dependency(doc, ref("3"), ref("1"));
  ASSERT_FALSE(missing_from.has_value());
  EXPECT_EQ(missing_from.error(), make_error_code(Error::NotFound));

  auto missing_to = editor_.add_dependency(doc, ref("1"), ref("1.4"));
  ASSERT_FALSE(missing_to.has_value());
  EXPECT_EQ(missing_to.error(), make_error_code(Error::NotFound));

  EXPECT_EQ(snapshot(doc), before);
}

TEST_F(TaskGraphEditorTest, AddDependencyRejectsSelfReference) {
  auto doc = DocumentBuilder{}.task(1).build();
  auto r = editor_.add_dependency(doc, ref("1"), ref("1"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidOperation));
}

TEST_F(TaskGraphEditorTest, AddDependencyRejectsCycle) {
  auto doc = DocumentBuilder{}
                 .task(1, {"2"})
                 .task(2, {"3"})
                 .task(3)
                 .build();
  auto before = snapshot(doc);

  auto r = editor_.add_dependency(doc, ref("3"), ref("1"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::WouldCreateCycle));
  EXPECT_EQ(snapshot(doc), before);
}

TEST_F(TaskGraphEditorTest, RemoveDependency) {
  auto doc = DocumentBuilder{}.task(1).task(2, {"1", "1"}).build();
  // Duplicate removal is off so both copies reach remove_dependency
  TaskGraphEditor editor(RepairOptions{.remove_duplicates = false});

  auto r = editor.remove_dependency(doc, ref("2"), ref("1"));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(*r);
  EXPECT_TRUE(deps_of(doc, "2").empty());

  auto again = editor.remove_dependency(doc, ref("2"), ref("1"));
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(*again);

  auto missing = editor.remove_dependency(doc, ref("8"), ref("1"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskGraphEditorTest, PromoteSubtask) {
  auto doc = DocumentBuilder{}
                 .task(3)
                 .task(5, {}, TaskPriority::High)
                 .subtask(5, 1)
                 .subtask(5, 2, {"5.1", "3"})
                 .task(6, {"5.2"})
                 .build();
  doc.find_task(5)->find_subtask(2)->status = TaskStatus::InProgress;

  auto r = editor_.promote_subtask(doc, 5, 2);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, 7u);

  const auto* promoted = doc.find_task(7);
  ASSERT_NE(promoted, nullptr);
  EXPECT_EQ(promoted->title, "Subtask 5.2");
  EXPECT_EQ(promoted->status, TaskStatus::InProgress);
  EXPECT_EQ(promoted->priority, TaskPriority::High);
  EXPECT_EQ(promoted->dependencies, refs({"5.1", "3"}));

  EXPECT_EQ(doc.find_task(5)->find_subtask(2), nullptr);
  EXPECT_EQ(deps_of(doc, "6"), refs({"7"}));
  EXPECT_TRUE(test::all_edges_valid(doc));
}

TEST_F(TaskGraphEditorTest, PromoteMissingSubtask) {
  auto doc = DocumentBuilder{}.task(5).subtask(5, 1).build();
  EXPECT_EQ(editor_.promote_subtask(doc, 5, 3).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(editor_.promote_subtask(doc, 4, 1).error(),
            make_error_code(Error::NotFound));
}

TEST_F(TaskGraphEditorTest, ConvertTaskToSubtask) {
  auto doc = DocumentBuilder{}
                 .task(1)
                 .task(2, {"1"})
                 .subtask(2, 1)
                 .task(4, {"1"})
                 .task(5, {"4"})
                 .build();
  doc.find_task(4)->test_strategy = "unit tests";

  auto r = editor_.convert_task_to_subtask(doc, ref("4"), ref("2"));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, ref("2.2"));

  EXPECT_EQ(doc.find_task(4), nullptr);
  const auto* sub = doc.find_task(2)->find_subtask(2);
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(sub->title, "Task 4");
  EXPECT_EQ(sub->dependencies, refs({"1"}));
  EXPECT_EQ(sub->extra["testStrategy"], "unit tests");
  EXPECT_EQ(deps_of(doc, "5"), refs({"2.2"}));
}

TEST_F(TaskGraphEditorTest, ConvertRejectsInvalidTargets) {
  auto doc = DocumentBuilder{}
                 .task(1)
                 .subtask(1, 1)
                 .task(2)
                 .subtask(2, 1)
                 .task(3)
                 .build();
  auto before = snapshot(doc);

  auto expect_error = [&](std::string_view task, std::string_view parent,
                          Error expected) {
    auto r = editor_.convert_task_to_subtask(doc, ref(task), ref(parent));
    ASSERT_FALSE(r.has_value()) << task << " under " << parent;
    EXPECT_EQ(r.error(), make_error_code(expected)) << task << " under " << parent;
  };

  expect_error("3", "3", Error::InvalidOperation);
  expect_error("3", "2.1", Error::InvalidOperation);
  expect_error("1", "1.1", Error::InvalidOperation);
  expect_error("1", "2", Error::InvalidOperation);  // still owns subtasks
  expect_error("2.1", "3", Error::InvalidOperation);
  expect_error("9", "3", Error::NotFound);
  expect_error("3", "9", Error::NotFound);

  EXPECT_EQ(snapshot(doc), before);
}

TEST_F(TaskGraphEditorTest, PromoteThenConvertRoundTrip) {
  auto doc = DocumentBuilder{}
                 .task(3)
                 .task(5, {}, TaskPriority::High)
                 .subtask(5, 1)
                 .subtask(5, 2, {"5.1", "3"})
                 .task(6, {"5.2"})
                 .build();
  auto before = snapshot(doc);

  auto promoted = editor_.promote_subtask(doc, 5, 2);
  ASSERT_TRUE(promoted.has_value());
  auto back = editor_.convert_task_to_subtask(doc, TaskRef::task(*promoted),
                                              ref("5"));
  ASSERT_TRUE(back.has_value());

  // The freed id 2 is reused, so the document comes back exactly
  EXPECT_EQ(*back, ref("5.2"));
  EXPECT_EQ(snapshot(doc), before);
}

TEST_F(TaskGraphEditorTest, RemoveSubtaskDeletePrunesReferences) {
  auto doc = DocumentBuilder{}
                 .task(5)
                 .subtask(5, 1)
                 .subtask(5, 2, {"5.1"})
                 .task(6, {"5.2", "5.1"})
                 .build();

  auto r = editor_.remove_subtask(doc, 5, 2, RemoveMode::Delete);
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_value());

  EXPECT_EQ(doc.find_task(5)->find_subtask(2), nullptr);
  EXPECT_EQ(deps_of(doc, "6"), refs({"5.1"}));
  EXPECT_EQ(editor_.last_repair().stats.dangling, 1u);
}

TEST_F(TaskGraphEditorTest, RemoveSubtaskConvertPromotes) {
  auto doc = DocumentBuilder{}.task(5).subtask(5, 1).task(6, {"5.1"}).build();

  auto r = editor_.remove_subtask(doc, 5, 1, RemoveMode::Convert);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->has_value());
  EXPECT_EQ(**r, 7u);
  EXPECT_EQ(deps_of(doc, "6"), refs({"7"}));
  EXPECT_TRUE(doc.find_task(5)->subtasks.empty());
}

TEST_F(TaskGraphEditorTest, RemoveMissingSubtask) {
  auto doc = DocumentBuilder{}.task(5).build();
  auto r = editor_.remove_subtask(doc, 5, 1, RemoveMode::Delete);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskGraphEditorTest, ClearSubtasks) {
  auto doc = DocumentBuilder{}
                 .task(1)
                 .subtask(1, 1)
                 .subtask(1, 2, {"1.1"})
                 .task(2, {"1.2", "1"})
                 .build();

  auto r = editor_.clear_subtasks(doc, ref("1"));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, 2u);
  EXPECT_TRUE(doc.find_task(1)->subtasks.empty());
  EXPECT_EQ(deps_of(doc, "2"), refs({"1"}));

  EXPECT_EQ(editor_.clear_subtasks(doc, ref("1.1")).error(),
            make_error_code(Error::InvalidOperation));
  EXPECT_EQ(editor_.clear_subtasks(doc, ref("9")).error(),
            make_error_code(Error::NotFound));
}

TEST_F(TaskGraphEditorTest, AddTask) {
  auto doc = DocumentBuilder{}.task(1).task(4).build();

  auto r = editor_.add_task(doc, NewTask{
                                     .title = "Write docs",
                                     .priority = TaskPriority::Low,
                                     .dependencies = refs({"1", "4"}),
                                 });
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, 5u);
  const auto* task = doc.find_task(5);
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->title, "Write docs");
  EXPECT_EQ(task->priority, TaskPriority::Low);
  EXPECT_EQ(task->status, TaskStatus::Pending);

  auto bad = editor_.add_task(doc, NewTask{.title = "x",
                                           .dependencies = refs({"12"})});
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), make_error_code(Error::NotFound));
  EXPECT_EQ(doc.task_count(), 3u);
}

TEST_F(TaskGraphEditorTest, AddSubtask) {
  auto doc = DocumentBuilder{}.task(1).subtask(1, 1).subtask(1, 3).build();

  auto r = editor_.add_subtask(doc, ref("1"),
                               NewSubtask{.title = "step",
                                          .dependencies = refs({"1.3"})});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, ref("1.4"));
  EXPECT_EQ(deps_of(doc, "1.4"), refs({"1.3"}));

  EXPECT_EQ(editor_.add_subtask(doc, ref("1.1"), NewSubtask{}).error(),
            make_error_code(Error::InvalidOperation));
  EXPECT_EQ(editor_.add_subtask(doc, ref("2"), NewSubtask{}).error(),
            make_error_code(Error::NotFound));
}

TEST_F(TaskGraphEditorTest, RemoveTaskPrunesReferences) {
  auto doc = DocumentBuilder{}
                 .task(1)
                 .subtask(1, 1)
                 .task(2, {"1", "1.1"})
                 .task(3, {"2"})
                 .build();

  ASSERT_TRUE(editor_.remove_task(doc, ref("1")).has_value());
  EXPECT_EQ(doc.find_task(1), nullptr);
  EXPECT_TRUE(deps_of(doc, "2").empty());
  EXPECT_EQ(editor_.last_repair().stats.dangling, 2u);

  ASSERT_TRUE(editor_.remove_task(doc, ref("2")).has_value());
  EXPECT_TRUE(deps_of(doc, "3").empty());

  EXPECT_EQ(editor_.remove_task(doc, ref("2")).error(),
            make_error_code(Error::NotFound));
}

TEST_F(TaskGraphEditorTest, EditsRunRepairOnPreexistingDamage) {
  auto doc = DocumentBuilder{}.task(1, {"9"}).task(2).build();

  auto r = editor_.add_dependency(doc, ref("2"), ref("1"));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(editor_.last_repair().changed);
  EXPECT_TRUE(deps_of(doc, "1").empty());
}

TEST_F(TaskGraphEditorTest, TaskIdsExhausted) {
  constexpr NodeId kMax = std::numeric_limits<NodeId>::max();
  auto doc = DocumentBuilder{}.task(2).subtask(2, 1).task(kMax).build();
  auto before = snapshot(doc);

  auto added = editor_.add_task(doc, NewTask{.title = "one too many"});
  ASSERT_FALSE(added.has_value());
  EXPECT_EQ(added.error(), make_error_code(Error::InvalidOperation));

  auto promoted = editor_.promote_subtask(doc, 2, 1);
  ASSERT_FALSE(promoted.has_value());
  EXPECT_EQ(promoted.error(), make_error_code(Error::InvalidOperation));

  EXPECT_EQ(snapshot(doc), before);
  ASSERT_TRUE(DocumentCodec::load_from_string(before).has_value());
}

TEST_F(TaskGraphEditorTest, SubtaskIdsExhausted) {
  constexpr NodeId kMax = std::numeric_limits<NodeId>::max();
  auto doc = DocumentBuilder{}.task(1).subtask(1, kMax).task(3).build();
  auto before = snapshot(doc);

  auto added = editor_.add_subtask(doc, ref("1"), NewSubtask{.title = "x"});
  ASSERT_FALSE(added.has_value());
  EXPECT_EQ(added.error(), make_error_code(Error::InvalidOperation));

  auto converted = editor_.convert_task_to_subtask(doc, ref("3"), ref("1"));
  ASSERT_FALSE(converted.has_value());
  EXPECT_EQ(converted.error(), make_error_code(Error::InvalidOperation));

  EXPECT_EQ(snapshot(doc), before);
}

TEST_F(TaskGraphEditorTest, PromoteKeepsNonStringExtras) {
  auto doc = DocumentBuilder{}.task(1, {}, TaskPriority::Low).subtask(1, 1).build();
  auto& extra = doc.find_task(1)->find_subtask(1)->extra;
  extra["testStrategy"] = 3;
  extra["priority"] = nlohmann::json{{"level", "high"}};

  auto id = editor_.promote_subtask(doc, 1, 1);
  ASSERT_TRUE(id.has_value());

  const auto* task = doc.find_task(*id);
  ASSERT_NE(task, nullptr);
  EXPECT_TRUE(task->test_strategy.empty());
  EXPECT_EQ(task->priority, TaskPriority::Low);
  EXPECT_EQ(task->extra["testStrategy"], 3);
  EXPECT_EQ(task->extra["priority"]["level"], "high");
}

TEST_F(TaskGraphEditorTest, SinkReceivesRepairActions) {
  std::vector<RepairAction> actions;
  TaskGraphEditor editor({}, [&](const RepairAction& a) { actions.push_back(a); });
  auto doc = DocumentBuilder{}.task(5).subtask(5, 1).task(6, {"5.1"}).build();

  ASSERT_TRUE(editor.remove_subtask(doc, 5, 1, RemoveMode::Delete).has_value());
  ASSERT_EQ(actions.size(), 1u);
  EXPECT_EQ(actions[0].node, ref("6"));
  EXPECT_EQ(actions[0].removed, ref("5.1"));
}

TEST(RewriteReferencesTest, RewritesEveryOccurrence) {
  auto doc = DocumentBuilder{}
                 .task(1, {"2.1"})
                 .task(2)
                 .subtask(2, 1)
                 .subtask(2, 2, {"2.1", "2.1"})
                 .build();
  EXPECT_EQ(rewrite_references(doc, ref("2.1"), ref("7")), 3u);
  EXPECT_EQ(deps_of(doc, "1"), refs({"7"}));
  EXPECT_EQ(deps_of(doc, "2.2"), refs({"7", "7"}));
}
