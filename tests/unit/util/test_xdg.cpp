#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

#include "taskr/util/xdg.hpp"

using taskr::util::Xdg;

namespace {

// Sets an environment variable for the lifetime of the object
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    if (const char* old = std::getenv(name)) {
      old_ = old;
    }
    if (value) {
      setenv(name, value, 1);
    } else {
      unsetenv(name);
    }
  }

  ~ScopedEnv() {
    if (old_) {
      setenv(name_, old_->c_str(), 1);
    } else {
      unsetenv(name_);
    }
  }

 private:
  const char* name_;
  std::optional<std::string> old_;
};

}  // namespace

TEST(XdgTest, HonorsXdgVariables) {
  ScopedEnv data("XDG_DATA_HOME", "/tmp/xdg-data");
  ScopedEnv config("XDG_CONFIG_HOME", "/tmp/xdg-config");
  ScopedEnv notes("TASKR_NOTES_DIR", nullptr);

  EXPECT_EQ(Xdg::dataHome(), "/tmp/xdg-data/taskr");
  EXPECT_EQ(Xdg::notesDir(), "/tmp/xdg-data/taskr/notes");
  EXPECT_EQ(Xdg::indexFile(), "/tmp/xdg-data/taskr/.taskr/tasks.sqlite");
  EXPECT_EQ(Xdg::logDir(), "/tmp/xdg-data/taskr/logs");
  EXPECT_EQ(Xdg::configFile(), "/tmp/xdg-config/taskr/config.toml");
}

TEST(XdgTest, FallsBackToHome) {
  ScopedEnv home("HOME", "/home/tester");
  ScopedEnv data("XDG_DATA_HOME", nullptr);
  ScopedEnv config("XDG_CONFIG_HOME", nullptr);

  EXPECT_EQ(Xdg::dataHome(), "/home/tester/.local/share/taskr");
  EXPECT_EQ(Xdg::configHome(), "/home/tester/.config/taskr");
}

TEST(XdgTest, NotesDirOverride) {
  ScopedEnv notes("TASKR_NOTES_DIR", "/srv/notes");
  EXPECT_EQ(Xdg::notesDir(), "/srv/notes");
}
