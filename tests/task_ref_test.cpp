#include "taskweave/graph/task_ref.hpp"

#include <format>
#include <sstream>
#include <unordered_set>

#include "gtest/gtest.h"

using namespace taskweave;

TEST(TaskRefTest, ParseTaskAddress) {
  auto r = TaskRef::parse("12");
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->is_task());
  EXPECT_EQ(r->task_id(), 12u);
  EXPECT_EQ(r->subtask_id(), 0u);
  EXPECT_EQ(r->str(), "12");
}

TEST(TaskRefTest, ParseSubtaskAddress) {
  auto r = TaskRef::parse("12.3");
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->is_subtask());
  EXPECT_EQ(r->task_id(), 12u);
  EXPECT_EQ(r->subtask_id(), 3u);
  EXPECT_EQ(r->str(), "12.3");
}

TEST(TaskRefTest, ParseTrimsWhitespace) {
  auto r = TaskRef::parse("  4.1\t");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, TaskRef::subtask(4, 1));
}

TEST(TaskRefTest, ParseRejectsMalformedInput) {
  for (auto text : {"", "   ", "abc", "1.", ".1", "1.2.3", "0", "3.0", "-1",
                    "1.x", "99999999999"}) {
    auto r = TaskRef::parse(text);
    ASSERT_FALSE(r.has_value()) << "accepted '" << text << "'";
    EXPECT_EQ(r.error(), make_error_code(Error::ParseError));
  }
}

TEST(TaskRefTest, TaskAndSubtaskWithSameNumbersDiffer) {
  EXPECT_NE(TaskRef::task(1), TaskRef::subtask(1, 1));
  EXPECT_NE(TaskRef::subtask(1, 2), TaskRef::subtask(2, 1));
  EXPECT_EQ(TaskRef::subtask(1, 2), TaskRef::subtask(1, 2));
}

TEST(TaskRefTest, TasksOrderBeforeSubtasks) {
  EXPECT_LT(TaskRef::task(9), TaskRef::subtask(1, 1));
  EXPECT_LT(TaskRef::task(2), TaskRef::task(10));
  EXPECT_LT(TaskRef::subtask(1, 9), TaskRef::subtask(2, 1));
}

TEST(TaskRefTest, HashDistinguishesKinds) {
  std::unordered_set<TaskRef> set;
  set.insert(TaskRef::task(1));
  set.insert(TaskRef::subtask(1, 1));
  set.insert(TaskRef::task(1));
  EXPECT_EQ(set.size(), 2u);
}

TEST(TaskRefTest, FormatAndStream) {
  EXPECT_EQ(std::format("{}", TaskRef::subtask(5, 2)), "5.2");

  std::ostringstream os;
  os << TaskRef::task(7);
  EXPECT_EQ(os.str(), "7");
}

TEST(TaskRefTest, ParseRefList) {
  auto r = parse_ref_list("1, 2.3,4");
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 3u);
  EXPECT_EQ((*r)[0], TaskRef::task(1));
  EXPECT_EQ((*r)[1], TaskRef::subtask(2, 3));
  EXPECT_EQ((*r)[2], TaskRef::task(4));
}

TEST(TaskRefTest, ParseRefListRejectsEmptySegments) {
  EXPECT_FALSE(parse_ref_list("").has_value());
  EXPECT_FALSE(parse_ref_list("1,,2").has_value());
  EXPECT_FALSE(parse_ref_list("1,").has_value());
  EXPECT_FALSE(parse_ref_list("1,x").has_value());
}

TEST(TaskRefTest, ParseNodeId) {
  EXPECT_EQ(parse_node_id("42").value(), 42u);
  EXPECT_FALSE(parse_node_id("0").has_value());
  EXPECT_FALSE(parse_node_id(" 1").has_value());
  EXPECT_FALSE(parse_node_id("1a").has_value());
}
