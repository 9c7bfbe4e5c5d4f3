#include <gtest/gtest.h>

#include "taskr/store/sqlite_task_store.hpp"
#include "taskr/tasks/task_list.hpp"
#include "test_helpers.hpp"

using namespace taskr::tasks;
using namespace taskr::test;
using taskr::config::TaskListConfig;
using taskr::core::Document;

class TaskListTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    open(TaskListConfig{});
  }

  void TearDown() override {
    task_list_.reset();
    store_.reset();
    TempDirTest::TearDown();
  }

  void open(TaskListConfig config) {
    task_list_.reset();
    store_.reset();
    store_ = std::make_unique<taskr::store::SqliteTaskStore>(temp_dir_ / "tasks.db");
    task_list_ = std::make_unique<TaskList>(*store_, std::move(config));
    task_list_->subscribe([this]() { ++changes_; });
    ASSERT_OK(task_list_->initialize());
  }

  Document document(const std::string& name, const std::string& content) {
    auto parsed = Document::fromFileContent(name, content);
    EXPECT_TRUE(parsed.has_value());
    return parsed.value_or(Document{});
  }

  size_t storedTasks() {
    auto all = task_list_->allTasks();
    EXPECT_TRUE(all.has_value());
    return all ? all->size() : 0;
  }

  std::unique_ptr<taskr::store::SqliteTaskStore> store_;
  std::unique_ptr<TaskList> task_list_;
  int changes_ = 0;
};

TEST_F(TaskListTest, FreshStoreRecordsFormatWithoutRebuild) {
  EXPECT_FALSE(task_list_->needsRebuild());

  auto format = store_->property("tasklist_format");
  ASSERT_OK(format);
  EXPECT_EQ(*format, std::string(kTableFormat));

  auto preferences = store_->property("tasklist_preferences");
  ASSERT_OK(preferences);
  EXPECT_EQ(*preferences, TaskListConfig{}.rebuildFingerprint());
}

TEST_F(TaskListTest, IndexDocumentStoresTasks) {
  auto outcome = task_list_->indexDocument(document("Home", "TODO: water plants\n[ ] dig\n\t[ ] rake\n"));
  ASSERT_OK(outcome);
  EXPECT_FALSE(outcome->excluded);
  EXPECT_GT(outcome->document, 0);
  EXPECT_EQ(outcome->tasks, 3);
  EXPECT_EQ(storedTasks(), 3);
  EXPECT_EQ(changes_, 1);

  auto roots = task_list_->listTasks();
  ASSERT_OK(roots);
  ASSERT_EQ(roots->size(), 2);

  auto source = task_list_->documentOf((*roots)[0]);
  ASSERT_OK(source);
  ASSERT_TRUE(source->has_value());
  EXPECT_EQ((*source)->name, "Home");
}

TEST_F(TaskListTest, DocumentWithoutTasksNotifiesNothing) {
  ASSERT_OK(task_list_->indexDocument(document("Notes", "just some text\n")));
  ASSERT_OK(task_list_->indexDocument(document("Notes", "just some text\n")));
  EXPECT_EQ(changes_, 0);
}

TEST_F(TaskListTest, ReindexReplacesRows) {
  ASSERT_OK(task_list_->indexDocument(document("Home", "[ ] one\n[ ] two\n")));
  ASSERT_OK(task_list_->indexDocument(document("Home", "[ ] three\n")));

  auto all = task_list_->allTasks();
  ASSERT_OK(all);
  ASSERT_EQ(all->size(), 1);
  EXPECT_EQ((*all)[0].description, "three");
}

TEST_F(TaskListTest, RemoveDocumentReportsRows) {
  ASSERT_OK(task_list_->indexDocument(document("Home", "[ ] one\n")));
  ASSERT_OK(task_list_->setDocumentStamp("Home", "123"));

  auto removed = task_list_->removeDocument("Home");
  ASSERT_OK(removed);
  EXPECT_TRUE(*removed);
  EXPECT_EQ(storedTasks(), 0);

  auto stamp = task_list_->documentStamp("Home");
  ASSERT_OK(stamp);
  EXPECT_FALSE(stamp->has_value());

  removed = task_list_->removeDocument("Home");
  ASSERT_OK(removed);
  EXPECT_FALSE(*removed);
}

TEST_F(TaskListTest, ChangedPreferencesDropRows) {
  ASSERT_OK(task_list_->indexDocument(document("Home", "[ ] one\n")));
  ASSERT_EQ(storedTasks(), 1);

  TaskListConfig config;
  config.labels = {"TODO", "WAIT"};
  open(config);

  EXPECT_TRUE(task_list_->needsRebuild());
  EXPECT_EQ(storedTasks(), 0);
  EXPECT_EQ(changes_, 2);

  auto preferences = store_->property("tasklist_preferences");
  ASSERT_OK(preferences);
  EXPECT_EQ(*preferences, config.rebuildFingerprint());

  ASSERT_OK(task_list_->markRebuilt());
  EXPECT_FALSE(task_list_->needsRebuild());
}

TEST_F(TaskListTest, DisplayPreferencesKeepRows) {
  ASSERT_OK(task_list_->indexDocument(document("Home", "[ ] one\n")));

  TaskListConfig config;
  config.tag_by_page = true;
  config.use_workweek = false;
  open(config);

  EXPECT_FALSE(task_list_->needsRebuild());
  EXPECT_EQ(storedTasks(), 1);
}

TEST_F(TaskListTest, SubtreeSelection) {
  TaskListConfig config;
  config.included_subtrees = {"Projects"};
  config.excluded_subtrees = {"Projects:Archive"};
  open(config);

  EXPECT_TRUE(task_list_->isIncluded("Projects"));
  EXPECT_TRUE(task_list_->isIncluded("Projects:Garden"));
  EXPECT_FALSE(task_list_->isIncluded("ProjectsOld"));
  EXPECT_FALSE(task_list_->isIncluded("Home"));
  EXPECT_FALSE(task_list_->isIncluded("Projects:Archive:2019"));
}

TEST_F(TaskListTest, ExcludedDocumentLosesRows) {
  ASSERT_OK(task_list_->indexDocument(document("Archive:Old", "[ ] stale\n")));
  ASSERT_EQ(storedTasks(), 1);

  TaskListConfig config;
  config.excluded_subtrees = {"Archive"};
  open(config);

  auto outcome = task_list_->indexDocument(document("Archive:Old", "[ ] stale\n"));
  ASSERT_OK(outcome);
  EXPECT_TRUE(outcome->excluded);
  EXPECT_EQ(outcome->tasks, 0);
  EXPECT_EQ(storedTasks(), 0);
}

TEST_F(TaskListTest, DeadlineByPage) {
  TaskListConfig config;
  config.deadline_by_page = true;
  open(config);

  EXPECT_EQ(task_list_->defaultDueFor(document("Journal:2024:03:01", "")), "2024-03-01");
  EXPECT_EQ(task_list_->defaultDueFor(document("Journal:2024:03", "")), "2024-03-31");
  EXPECT_EQ(task_list_->defaultDueFor(document("Journal:2024:Week 10", "")), "2024-03-10");
  EXPECT_FALSE(task_list_->defaultDueFor(document("Home", "")).has_value());

  auto with_front_matter = document("Journal:2024:03:01", "---\ndue: 2024-03-05\n---\n");
  EXPECT_EQ(task_list_->defaultDueFor(with_front_matter), "2024-03-05");

  ASSERT_OK(task_list_->indexDocument(document("Journal:2024:03:01", "[ ] call mum\n")));
  auto all = task_list_->allTasks();
  ASSERT_OK(all);
  ASSERT_EQ(all->size(), 1);
  EXPECT_EQ((*all)[0].due, "2024-03-01");
}

TEST_F(TaskListTest, DeadlineByPageOffIgnoresName) {
  EXPECT_FALSE(task_list_->defaultDueFor(document("Journal:2024:03:01", "")).has_value());
}
