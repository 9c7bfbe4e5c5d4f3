#include <gtest/gtest.h>

#include "taskr/store/notebook.hpp"
#include "test_helpers.hpp"

using namespace taskr::store;
using namespace taskr::test;
using taskr::ErrorCode;

class NotebookTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    writeFile("notes/Home.md", "TODO: water plants\n");
    writeFile("notes/Projects/Garden.txt", "[ ] dig\n");
    writeFile("notes/Journal/2024/03/01.md", "[ ] call mum\n");
    writeFile("notes/.hidden/Secret.md", "TODO: never\n");
    writeFile("notes/image.png", "binary");
    notebook_ = std::make_unique<Notebook>(temp_dir_ / "notes");
  }

  std::unique_ptr<Notebook> notebook_;
};

TEST_F(NotebookTest, ScanFindsDocumentsSortedByName) {
  auto entries = notebook_->scan();
  ASSERT_OK(entries);
  ASSERT_EQ(entries->size(), 3);
  EXPECT_EQ((*entries)[0].name, "Home");
  EXPECT_EQ((*entries)[1].name, "Journal:2024:03:01");
  EXPECT_EQ((*entries)[2].name, "Projects:Garden");
}

TEST_F(NotebookTest, NameForPathJoinsWithColons) {
  auto name = notebook_->nameForPath(temp_dir_ / "notes" / "Projects" / "Garden.txt");
  ASSERT_OK(name);
  EXPECT_EQ(*name, "Projects:Garden");
}

TEST_F(NotebookTest, NameForPathRejectsOutsidePaths) {
  EXPECT_ERROR(notebook_->nameForPath(temp_dir_ / "elsewhere.md"), ErrorCode::kInvalidArgument);
}

TEST_F(NotebookTest, PathForNameFindsEitherExtension) {
  auto md = notebook_->pathForName("Home");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->filename(), "Home.md");

  auto txt = notebook_->pathForName("Projects:Garden");
  ASSERT_TRUE(txt.has_value());
  EXPECT_EQ(txt->filename(), "Garden.txt");

  EXPECT_FALSE(notebook_->pathForName("Nowhere").has_value());
}

TEST_F(NotebookTest, LoadParsesDocument) {
  auto document = notebook_->load("Journal:2024:03:01");
  ASSERT_OK(document);
  EXPECT_EQ(document->name(), "Journal:2024:03:01");
  EXPECT_EQ(document->path().filename(), "01.md");
  EXPECT_FALSE(document->tree().empty());
}

TEST_F(NotebookTest, LoadUnknownNameIsNotFound) {
  EXPECT_ERROR(notebook_->load("Nowhere"), ErrorCode::kNotFound);
}

TEST_F(NotebookTest, MissingRootFailsScan) {
  Notebook missing(temp_dir_ / "absent");
  EXPECT_FALSE(missing.scan().has_value());
}
