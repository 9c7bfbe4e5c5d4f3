#include "taskr/cli/application.hpp"

#include <algorithm>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "taskr/util/logging.hpp"

// Command includes
#include "taskr/cli/commands/index_command.hpp"
#include "taskr/cli/commands/update_command.hpp"
#include "taskr/cli/commands/forget_command.hpp"
#include "taskr/cli/commands/list_command.hpp"
#include "taskr/cli/commands/tags_command.hpp"
#include "taskr/cli/commands/stats_command.hpp"
#include "taskr/cli/commands/show_command.hpp"
#include "taskr/cli/commands/config_command.hpp"

namespace taskr::cli {

Application::Application()
    : app_("taskr", "Task lists extracted from outline notes") {

  // Set up the application
  app_.set_version_flag("--version", taskr::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::RuntimeError& e) {
    // Raised by a command callback after the error was reported
    return e.get_exit_code();
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize() {
  return initializeServices();
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (repeat for more)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--notes-dir", global_options_.notes_dir, "Override notes directory");
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored output");
}

void Application::setupCommands() {
  // Indexing
  registerCommand(std::make_unique<IndexCommand>(*this));
  registerCommand(std::make_unique<UpdateCommand>(*this));
  registerCommand(std::make_unique<ForgetCommand>(*this));

  // Queries
  registerCommand(std::make_unique<ListCommand>(*this));
  registerCommand(std::make_unique<TagsCommand>(*this));
  registerCommand(std::make_unique<StatsCommand>(*this));
  registerCommand(std::make_unique<ShowCommand>(*this));

  // Configuration
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  taskr index                     # Scan the notes directory
  taskr list @home                # Open tasks mentioning @home
  taskr list "not @waiting" -a    # Actionable tasks not waiting on anyone
  taskr list -t urgent --untagged
  taskr tags
  taskr show 42 --json

For more information on a specific command, run:
  taskr <command> --help)");
}

void Application::reportError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    std::cout << output.dump() << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    // Initialize services before running command
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }
    if (task_list_->needsRebuild() && cmd_ptr->name() != "index" && !global_options_.quiet) {
      std::cerr << "Warning: task list preferences changed, run 'taskr index' to rebuild the tasks"
                << std::endl;
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::loadConfig() {
  if (!global_options_.config_file.empty()) {
    // An explicitly requested file has to load
    return config_.load(global_options_.config_file);
  }

  auto default_path = taskr::config::Config::defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = config_.load(default_path);
    if (!result.has_value()) {
      std::cerr << "Warning: ignoring " << default_path.string() << ": "
                << result.error().message() << std::endl;
      config_ = taskr::config::Config();
    }
  }
  return {};
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  if (auto result = loadConfig(); !result.has_value()) {
    return result;
  }

  // Override config with command line options if needed
  if (!global_options_.notes_dir.empty()) {
    config_.notes_dir = global_options_.notes_dir;
  }

  if (auto result = config_.validate(); !result.has_value()) {
    return result;
  }

  auto level = taskr::util::parseLogLevel(config_.log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }
  auto console_level = *level;
  if (global_options_.quiet) {
    console_level = spdlog::level::err;
  } else if (global_options_.verbose >= 3) {
    console_level = spdlog::level::trace;
  } else if (global_options_.verbose == 2) {
    console_level = std::min(console_level, spdlog::level::debug);
  } else if (global_options_.verbose == 1) {
    console_level = std::min(console_level, spdlog::level::info);
  }
  taskr::util::setupLogging(console_level, config_.log_dir, !global_options_.no_color);

  store_ = taskr::store::TaskStoreFactory::createSqliteStore(config_.index_file);
  task_list_ = std::make_unique<taskr::tasks::TaskList>(*store_, config_.tasklist);
  if (auto result = task_list_->initialize(); !result.has_value()) {
    return result;
  }
  notebook_ = std::make_unique<taskr::store::Notebook>(config_.notes_dir);

  spdlog::debug("Notes in {}, index in {}", config_.notes_dir.string(), config_.index_file.string());
  services_initialized_ = true;
  return {};
}

// Getters for services (to be used by commands)
const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

taskr::config::Config& Application::config() {
  return config_;
}

taskr::tasks::TaskList& Application::taskList() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *task_list_;
}

taskr::store::Notebook& Application::notebook() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *notebook_;
}

} // namespace taskr::cli
