#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "taskr/core/parse_tree.hpp"
#include "taskr/tasks/task.hpp"

namespace taskr::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Write a file below temp_dir_, creating parent directories
  std::filesystem::path writeFile(const std::filesystem::path& relative, const std::string& content);

  std::filesystem::path temp_dir_;
};

// Parse outline markup into a tree
taskr::core::ParseTree parseOutline(const std::string& text);

// Task node with the given description and children, other fields default
taskr::tasks::TaskNode makeNode(const std::string& description,
                                std::vector<taskr::tasks::TaskNode> children = {});

// Stored row for query tests
taskr::tasks::Task makeTask(taskr::tasks::TaskId id, taskr::tasks::TaskId parent,
                            const std::string& description, bool open = true,
                            taskr::tasks::DocumentId source = 1);

// Generate random string for testing
std::string randomString(size_t length);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace taskr::test
