#include "taskr/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace taskr::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {
}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  cmd->add_flag("--init", init_, "Write the current settings to the config file");
  cmd->add_flag("--force", force_, "Overwrite an existing config file");
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  auto& config = app_.config();

  std::filesystem::path path = options.config_file.empty()
                                   ? taskr::config::Config::defaultConfigPath()
                                   : std::filesystem::path(options.config_file);

  if (init_) {
    if (std::filesystem::exists(path) && !force_) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Config file exists, use --force to overwrite: " + path.string()));
    }
    if (auto result = config.save(path); !result.has_value()) {
      return std::unexpected(result.error());
    }
    if (!options.quiet) {
      std::cout << "Wrote " << path.string() << std::endl;
    }
    return 0;
  }

  const auto& tasklist = config.tasklist;
  if (options.json) {
    nlohmann::json output;
    output["config_file"] = path.string();
    output["notes_dir"] = config.notes_dir.string();
    output["index_file"] = config.index_file.string();
    output["log_dir"] = config.log_dir.string();
    output["log_level"] = config.log_level;
    output["tasklist"] = {
      {"all_checkboxes", tasklist.all_checkboxes},
      {"tag_by_page", tasklist.tag_by_page},
      {"deadline_by_page", tasklist.deadline_by_page},
      {"use_workweek", tasklist.use_workweek},
      {"labels", tasklist.labels},
      {"next_label", tasklist.next_label},
      {"included_subtrees", tasklist.included_subtrees},
      {"excluded_subtrees", tasklist.excluded_subtrees}
    };
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  auto join = [](const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
      if (!joined.empty()) joined += ", ";
      joined += value;
    }
    return joined;
  };

  std::cout << "config_file       = " << path.string() << std::endl;
  std::cout << "notes_dir         = " << config.notes_dir.string() << std::endl;
  std::cout << "index_file        = " << config.index_file.string() << std::endl;
  std::cout << "log_dir           = " << config.log_dir.string() << std::endl;
  std::cout << "log_level         = " << config.log_level << std::endl;
  std::cout << "all_checkboxes    = " << (tasklist.all_checkboxes ? "true" : "false") << std::endl;
  std::cout << "tag_by_page       = " << (tasklist.tag_by_page ? "true" : "false") << std::endl;
  std::cout << "deadline_by_page  = " << (tasklist.deadline_by_page ? "true" : "false") << std::endl;
  std::cout << "use_workweek      = " << (tasklist.use_workweek ? "true" : "false") << std::endl;
  std::cout << "labels            = " << join(tasklist.labels) << std::endl;
  std::cout << "next_label        = " << tasklist.next_label << std::endl;
  std::cout << "included_subtrees = " << join(tasklist.included_subtrees) << std::endl;
  std::cout << "excluded_subtrees = " << join(tasklist.excluded_subtrees) << std::endl;
  return 0;
}

} // namespace taskr::cli
