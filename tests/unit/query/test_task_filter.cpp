#include <gtest/gtest.h>

#include "taskr/query/task_filter.hpp"
#include "test_helpers.hpp"

using namespace taskr::query;
using namespace taskr::test;
using taskr::tasks::LabelMatcher;

class TaskFilterTest : public ::testing::Test {
 protected:
  Snapshot sampleSnapshot() {
    std::vector<Task> rows{
        makeTask(1, 0, "TODO: plan trip"),
        makeTask(2, 1, "book hotel"),
        makeTask(3, 2, "call agency @phone @urgent"),
        makeTask(4, 0, "FIXME: leaking tap @home", true, 2),
        makeTask(5, 0, "done already @urgent", false, 2),
    };
    return Snapshot::fromRows(std::move(rows), {{1, "Travel"}, {2, "Home:Repairs"}});
  }

  FilterCriteria tagged(std::vector<std::string> tags) {
    FilterCriteria criteria;
    criteria.tags = std::move(tags);
    return criteria;
  }

  LabelMatcher labels_{{"FIXME", "TODO"}, "Next:"};
  TaskFilter filter_{labels_, false};
};

TEST(ParseTextFilterTest, HandlesNegationAndBlank) {
  auto plain = parseTextFilter("  Hotel ");
  ASSERT_TRUE(plain.has_value());
  EXPECT_FALSE(plain->negated);
  EXPECT_EQ(plain->needle, "hotel");

  auto negated = parseTextFilter("not @Waiting");
  ASSERT_TRUE(negated.has_value());
  EXPECT_TRUE(negated->negated);
  EXPECT_EQ(negated->needle, "@waiting");

  EXPECT_FALSE(parseTextFilter("   ").has_value());
  EXPECT_FALSE(parseTextFilter("not  ").has_value());
}

TEST_F(TaskFilterTest, EmptyCriteriaShowOpenTasks) {
  auto snapshot = sampleSnapshot();
  auto visible = filter_.visibleIds(snapshot, FilterCriteria{});

  EXPECT_EQ(visible, (std::unordered_set<TaskId>{1, 2, 3, 4}));
}

TEST_F(TaskFilterTest, GrandchildMatchMakesAncestorsVisible) {
  auto snapshot = sampleSnapshot();
  auto visible = filter_.visibleIds(snapshot, tagged({"phone"}));

  EXPECT_EQ(visible, (std::unordered_set<TaskId>{1, 2, 3}));
}

TEST_F(TaskFilterTest, ClosedAncestorBecomesVisible) {
  std::vector<Task> rows{makeTask(1, 0, "closed parent", false), makeTask(2, 1, "open @x")};
  auto snapshot = Snapshot::fromRows(std::move(rows), {{1, "Page"}});

  EXPECT_EQ(filter_.visibleIds(snapshot, tagged({"x"})), (std::unordered_set<TaskId>{1, 2}));
}

TEST_F(TaskFilterTest, TagsAreCaseInsensitive) {
  auto snapshot = sampleSnapshot();
  EXPECT_EQ(filter_.visibleIds(snapshot, tagged({"HOME"})), (std::unordered_set<TaskId>{4}));
}

TEST_F(TaskFilterTest, NoTagsSelectsUntaggedTasks) {
  auto snapshot = sampleSnapshot();
  auto visible = filter_.visibleIds(snapshot, tagged({std::string(kNoTags), "urgent"}));

  // 1 and 2 are untagged, 3 carries @urgent, 5 is closed
  EXPECT_EQ(visible, (std::unordered_set<TaskId>{1, 2, 3}));
}

TEST_F(TaskFilterTest, LabelFilter) {
  auto snapshot = sampleSnapshot();
  FilterCriteria criteria;
  criteria.labels = std::vector<std::string>{"fixme"};

  EXPECT_EQ(filter_.visibleIds(snapshot, criteria), (std::unordered_set<TaskId>{4}));
}

TEST_F(TaskFilterTest, TextFilterSearchesDescriptionAndPage) {
  auto snapshot = sampleSnapshot();
  FilterCriteria criteria;
  criteria.text = parseTextFilter("repairs");
  EXPECT_EQ(filter_.visibleIds(snapshot, criteria), (std::unordered_set<TaskId>{4}));

  // 2 fails on its own but stays visible above 3
  criteria.text = parseTextFilter("not hotel");
  EXPECT_EQ(filter_.visibleIds(snapshot, criteria), (std::unordered_set<TaskId>{1, 2, 3, 4}));
}

TEST_F(TaskFilterTest, ActionableOnly) {
  std::vector<Task> rows{makeTask(1, 0, "first"), makeTask(2, 0, "Next: second")};
  rows[1].actionable = false;
  auto snapshot = Snapshot::fromRows(std::move(rows), {{1, "Page"}});

  FilterCriteria criteria;
  criteria.actionable_only = true;
  EXPECT_EQ(filter_.visibleIds(snapshot, criteria), (std::unordered_set<TaskId>{1}));
}

TEST_F(TaskFilterTest, TagByPageAddsNameParts) {
  TaskFilter by_page(labels_, true);
  Task task = makeTask(4, 0, "fix tap @home");

  EXPECT_EQ(by_page.tagsOf(task, "Home:Repairs"),
            (std::vector<std::string>{"home", "Home", "Repairs"}));
  EXPECT_EQ(filter_.tagsOf(task, "Home:Repairs"), (std::vector<std::string>{"home"}));
}

TEST(SnapshotTest, DropsRowsOfUnknownDocumentsAndTheirChildren) {
  std::vector<Task> rows{
      makeTask(1, 0, "kept"),
      makeTask(2, 0, "orphan source", true, 9),
      makeTask(3, 2, "below orphan", true, 9),
      makeTask(4, 77, "missing parent"),
  };
  auto snapshot = Snapshot::fromRows(std::move(rows), {{1, "Page"}});

  ASSERT_EQ(snapshot.tasks.size(), 1);
  EXPECT_EQ(snapshot.tasks[0].id, 1);
  EXPECT_EQ(snapshot.documentName(snapshot.tasks[0]), "Page");
}
