#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "fetch_config.hpp"
#include "fetch_engine.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    init(false);
    auto workspace_root = std::filesystem::current_path();

    SettingsManager settings;
    settings.set_settings_path(workspace_root / ".config" / "settings.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "rfetch",
                             FetchEngine::action_names());
    std::vector<std::string> actions;
    try {
      actions = parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("rfetch");
    if(settings.get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    FetchConfig config;
    Catalog catalog;
    try {
      config = FetchConfig::from_settings(settings, workspace_root);
      catalog = config.catalog_file.empty()
        ? Catalog::builtin()
        : Catalog::load_file(config.catalog_file);
    } catch(const FetchFailure& e) {
      logger->error("{} [{}]", e.what(), fetch_error_label(e.code()));
      return 1;
    }
    logger->debug("{} catalog entries, target directory {}", catalog.size(), config.target_dir.string());

    if(actions.empty()) actions.push_back("download");

    FetchEngine engine(std::move(config), std::move(catalog), logger);
    return engine.run(actions);
  } catch(std::exception& e) {
    init(false);
    Logger logger("rfetch-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
