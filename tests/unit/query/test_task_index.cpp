#include <gtest/gtest.h>

#include "taskr/query/task_index.hpp"
#include "test_helpers.hpp"

using namespace taskr::query;
using namespace taskr::test;
using taskr::tasks::LabelMatcher;

namespace {

Task withPriority(Task task, int priority) {
  task.priority = priority;
  return task;
}

}  // namespace

TEST(TagIndexTest, CountsCaseInsensitively) {
  TagIndex index;
  index.add({"Home", "phone"});
  index.add({"home"});
  index.add({});

  EXPECT_EQ(index.count("HOME"), 2);
  EXPECT_EQ(index.count("phone"), 1);
  EXPECT_EQ(index.count("missing"), 0);
  EXPECT_EQ(index.untagged(), 1);
  ASSERT_EQ(index.entries().size(), 2);
  EXPECT_EQ(index.entries().at("home").display, "Home");
}

TEST(TagIndexTest, FoldsNonAsciiTags) {
  LabelMatcher labels({"TODO"}, "");
  TaskFilter filter(labels, false);
  auto snapshot = Snapshot::fromRows(
      {makeTask(1, 0, "a @Über"), makeTask(2, 0, "b @über"), makeTask(3, 0, "c @café")},
      {{1, "Page"}});

  auto index = buildTagIndex(snapshot, filter);
  EXPECT_EQ(index.count("über"), 2);
  EXPECT_EQ(index.count("CAFÉ"), 1);
  EXPECT_EQ(index.count("caf"), 0);
}

TEST(TagIndexTest, BuildsFromOpenTasks) {
  LabelMatcher labels({"TODO"}, "");
  TaskFilter filter(labels, false);
  auto snapshot = Snapshot::fromRows(
      {makeTask(1, 0, "a @x"), makeTask(2, 0, "b @x", false), makeTask(3, 0, "c")}, {{1, "Page"}});

  auto index = buildTagIndex(snapshot, filter);
  EXPECT_EQ(index.count("x"), 1);
  EXPECT_EQ(index.untagged(), 1);
}

TEST(LabelIndexTest, FollowsConfiguredOrder) {
  LabelMatcher labels({"FIXME", "TODO", "XXX"}, "Next:");
  auto snapshot = Snapshot::fromRows({makeTask(1, 0, "TODO one"), makeTask(2, 0, "TODO two"),
                                      makeTask(3, 0, "FIXME three"), makeTask(4, 0, "Next: four"),
                                      makeTask(5, 0, "TODO closed", false)},
                                     {{1, "Page"}});

  auto index = buildLabelIndex(snapshot, labels);
  EXPECT_EQ(index, (LabelIndex{{"FIXME", 1}, {"TODO", 2}}));
}

TEST(StatisticsTest, CountsOpenTasksByPriority) {
  auto snapshot = Snapshot::fromRows({withPriority(makeTask(1, 0, "a"), 2),
                                      withPriority(makeTask(2, 0, "b"), 0),
                                      withPriority(makeTask(3, 0, "c"), 0),
                                      withPriority(makeTask(4, 0, "d", false), 3)},
                                     {{1, "Page"}});

  auto stats = buildStatistics(snapshot);
  EXPECT_EQ(stats.total, 3);
  EXPECT_EQ(stats.by_priority, (std::vector<size_t>{1, 0, 2}));
}

TEST(StatisticsTest, EmptySnapshot) {
  auto stats = buildStatistics(Snapshot{});
  EXPECT_EQ(stats.total, 0);
  EXPECT_TRUE(stats.by_priority.empty());
}

TEST(VisibleTreeTest, OrdersByDocumentThenPriority) {
  auto snapshot = Snapshot::fromRows({withPriority(makeTask(1, 0, "zeta low", true, 2), 0),
                                      withPriority(makeTask(2, 0, "alpha low"), 0),
                                      withPriority(makeTask(3, 2, "child low"), 0),
                                      withPriority(makeTask(4, 2, "child high"), 2),
                                      withPriority(makeTask(5, 0, "alpha high"), 1)},
                                     {{1, "Alpha"}, {2, "Zeta"}});

  auto rows = visibleTree(snapshot, {1, 2, 3, 4, 5});
  ASSERT_EQ(rows.size(), 5);
  EXPECT_EQ(rows[0].task.id, 5);
  EXPECT_EQ(rows[1].task.id, 2);
  EXPECT_EQ(rows[2].task.id, 4);
  EXPECT_EQ(rows[2].depth, 1);
  EXPECT_EQ(rows[3].task.id, 3);
  EXPECT_EQ(rows[4].task.id, 1);
  EXPECT_EQ(rows[4].document, "Zeta");
}

TEST(VisibleTreeTest, SkipsHiddenRows) {
  auto snapshot = Snapshot::fromRows({makeTask(1, 0, "root"), makeTask(2, 1, "hidden"),
                                      makeTask(3, 1, "shown")},
                                     {{1, "Page"}});

  auto rows = visibleTree(snapshot, {1, 3});
  ASSERT_EQ(rows.size(), 2);
  EXPECT_EQ(rows[1].task.id, 3);
  EXPECT_EQ(rows[1].depth, 1);
}
