#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "share_cli.hpp"
#include "share_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "localshare");
    std::string parse_error;
    if(!parser.parse(argc, argv, *settings, parse_error)) {
      print_err(nullptr, "{}", parse_error);
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init_logging(settings->get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("localshare");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    ShareManager::Options options;
    options.settings = settings;
    options.logger = logger;
    std::string error;
    auto manager = ShareManager::create(std::move(options), error);
    if(!manager) {
      logger->error("Unable to start: {}", error);
      return 1;
    }

    ShareCLI cli(*manager, settings);
    cli.run();

    manager->shutdown();
    for(const auto& event : manager->poll_events()) {
      logger->print("[event] {}", describe(event));
    }
    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("localshare-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
