#include <gtest/gtest.h>

#include "taskr/store/notebook.hpp"
#include "taskr/store/sqlite_task_store.hpp"
#include "taskr/tasks/indexer.hpp"
#include "test_helpers.hpp"

using namespace taskr::tasks;
using namespace taskr::test;
using taskr::ErrorCode;

class IndexerTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    writeFile("notes/Home.md", "TODO: water plants\n");
    writeFile("notes/Projects/Garden.md", "[ ] dig\n\t[ ] rake\n");
    writeFile("notes/Notes.txt", "nothing to do\n");

    store_ = std::make_unique<taskr::store::SqliteTaskStore>(temp_dir_ / "tasks.db");
    task_list_ = std::make_unique<TaskList>(*store_, taskr::config::TaskListConfig{});
    ASSERT_OK(task_list_->initialize());
    notebook_ = std::make_unique<taskr::store::Notebook>(temp_dir_ / "notes");
    indexer_ = std::make_unique<Indexer>(*notebook_, *task_list_);
  }

  void TearDown() override {
    indexer_.reset();
    task_list_.reset();
    store_.reset();
    TempDirTest::TearDown();
  }

  std::unique_ptr<taskr::store::SqliteTaskStore> store_;
  std::unique_ptr<TaskList> task_list_;
  std::unique_ptr<taskr::store::Notebook> notebook_;
  std::unique_ptr<Indexer> indexer_;
};

TEST_F(IndexerTest, IndexesEveryDocument) {
  auto report = indexer_->indexAll(false);
  ASSERT_OK(report);
  EXPECT_EQ(report->scanned, 3);
  EXPECT_EQ(report->indexed, 3);
  EXPECT_EQ(report->tasks, 3);
  EXPECT_EQ(report->failed, 0);

  auto all = task_list_->allTasks();
  ASSERT_OK(all);
  EXPECT_EQ(all->size(), 3);
}

TEST_F(IndexerTest, SkipsUnchangedDocuments) {
  ASSERT_OK(indexer_->indexAll(false));

  auto report = indexer_->indexAll(false);
  ASSERT_OK(report);
  EXPECT_EQ(report->unchanged, 3);
  EXPECT_EQ(report->indexed, 0);

  report = indexer_->indexAll(true);
  ASSERT_OK(report);
  EXPECT_EQ(report->unchanged, 0);
  EXPECT_EQ(report->indexed, 3);
}

TEST_F(IndexerTest, RemovesVanishedDocuments) {
  ASSERT_OK(indexer_->indexAll(false));
  std::filesystem::remove(temp_dir_ / "notes" / "Projects" / "Garden.md");

  auto report = indexer_->indexAll(false);
  ASSERT_OK(report);
  EXPECT_EQ(report->removed, 1);

  auto all = task_list_->allTasks();
  ASSERT_OK(all);
  ASSERT_EQ(all->size(), 1);
  EXPECT_EQ((*all)[0].description, "TODO: water plants");
}

TEST_F(IndexerTest, BrokenDocumentIsReportedNotFatal) {
  writeFile("notes/Broken.md", "---\ntitle: [oops\n---\nTODO: hidden\n");

  auto report = indexer_->indexAll(false);
  ASSERT_OK(report);
  EXPECT_EQ(report->failed, 1);
  EXPECT_EQ(report->indexed, 3);
  ASSERT_EQ(report->errors.size(), 1);
  EXPECT_TRUE(report->errors[0].starts_with("Broken: "));
}

TEST_F(IndexerTest, IndexOneByNameOrPath) {
  auto outcome = indexer_->indexOne("Projects:Garden");
  ASSERT_OK(outcome);
  EXPECT_EQ(outcome->tasks, 2);

  outcome = indexer_->indexOne((temp_dir_ / "notes" / "Home.md").string());
  ASSERT_OK(outcome);
  EXPECT_EQ(outcome->tasks, 1);

  auto stamp = task_list_->documentStamp("Home");
  ASSERT_OK(stamp);
  EXPECT_TRUE(stamp->has_value());
}

TEST_F(IndexerTest, IndexOneUnknownDocument) {
  EXPECT_ERROR(indexer_->indexOne("Nowhere"), ErrorCode::kNotFound);
}

TEST_F(IndexerTest, PendingRebuildSurvivesRestart) {
  ASSERT_OK(indexer_->indexAll(false));

  taskr::config::TaskListConfig config;
  config.labels = {"TODO", "WAIT"};
  auto reopen = [&]() {
    indexer_.reset();
    task_list_.reset();
    store_ = std::make_unique<taskr::store::SqliteTaskStore>(temp_dir_ / "tasks.db");
    task_list_ = std::make_unique<TaskList>(*store_, config);
    ASSERT_OK(task_list_->initialize());
    indexer_ = std::make_unique<Indexer>(*notebook_, *task_list_);
  };

  // Preferences changed, then a second run before any reindex
  reopen();
  reopen();
  EXPECT_TRUE(task_list_->needsRebuild());
  auto all = task_list_->allTasks();
  ASSERT_OK(all);
  EXPECT_TRUE(all->empty());

  auto report = indexer_->indexAll(false);
  ASSERT_OK(report);
  EXPECT_EQ(report->unchanged, 0);
  EXPECT_EQ(report->indexed, 3);
  EXPECT_FALSE(task_list_->needsRebuild());

  all = task_list_->allTasks();
  ASSERT_OK(all);
  EXPECT_EQ(all->size(), 3);

  reopen();
  EXPECT_FALSE(task_list_->needsRebuild());
}
