#include <gtest/gtest.h>

#include "taskr/core/document.hpp"
#include "test_helpers.hpp"

using namespace taskr::core;
using taskr::ErrorCode;

TEST(DocumentTest, ParsesContentWithoutFrontMatter) {
  auto document = Document::fromFileContent("Home", "TODO: water plants\n");

  ASSERT_OK(document);
  EXPECT_EQ(document->name(), "Home");
  EXPECT_FALSE(document->title().has_value());
  EXPECT_FALSE(document->defaultDue().has_value());
  EXPECT_EQ(document->tree().blocks.size(), 1);
}

TEST(DocumentTest, ReadsTitleAndDueFromFrontMatter) {
  auto document = Document::fromFileContent(
      "Projects:Garden", "---\ntitle: Garden\ndue: 2024-04-15\n---\n[ ] dig\n");

  ASSERT_OK(document);
  EXPECT_EQ(document->title(), "Garden");
  EXPECT_EQ(document->defaultDue(), "2024-04-15");
  EXPECT_EQ(document->tree().blocks.size(), 1);
}

TEST(DocumentTest, UnknownFrontMatterKeysAreIgnored) {
  auto document = Document::fromFileContent("Page", "---\ntags: [a, b]\n---\ntext\n");

  ASSERT_OK(document);
  EXPECT_FALSE(document->title().has_value());
}

TEST(DocumentTest, MissingEndDelimiterIsParseError) {
  EXPECT_ERROR(Document::fromFileContent("Page", "---\ntitle: x\ntext\n"), ErrorCode::kParseError);
}

TEST(DocumentTest, MalformedYamlIsParseError) {
  EXPECT_ERROR(Document::fromFileContent("Page", "---\ntitle: [unclosed\n---\ntext\n"),
               ErrorCode::kParseError);
}

TEST(DocumentTest, InvalidDueDateIsParseError) {
  EXPECT_ERROR(Document::fromFileContent("Page", "---\ndue: someday\n---\ntext\n"),
               ErrorCode::kParseError);
}

TEST(ErrorTest, ToStringNamesCode) {
  auto error = taskr::makeError(ErrorCode::kParseError, "YAML parse error in Page");
  EXPECT_EQ(error.toString(), "Parse error: YAML parse error in Page");
}
