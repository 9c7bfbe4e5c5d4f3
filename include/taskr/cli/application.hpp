#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "taskr/common.hpp"
#include "taskr/config/config.hpp"
#include "taskr/store/notebook.hpp"
#include "taskr/store/task_store.hpp"
#include "taskr/tasks/task_list.hpp"

namespace taskr::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string notes_dir;       // --notes-dir: Override notes directory
  bool no_color = false;       // --no-color: Disable colored output
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration and open the task store
   */
  Result<void> initialize();

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  taskr::config::Config& config();
  taskr::tasks::TaskList& taskList();
  taskr::store::Notebook& notebook();

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);
  void reportError(const Error& error) const;

  // Initialization
  Result<void> loadConfig();
  Result<void> initializeServices();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;
  bool services_initialized_ = false;

  // Services
  taskr::config::Config config_;
  std::unique_ptr<taskr::store::TaskStore> store_;
  std::unique_ptr<taskr::tasks::TaskList> task_list_;
  std::unique_ptr<taskr::store::Notebook> notebook_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace taskr::cli
