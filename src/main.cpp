#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "feed_engine.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / kSettingsFileName);
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "dirfeed");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    FeedEngine engine(settings);
    auto logger = engine.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    int status = engine.run();
    engine.stop();
    return status;
  } catch(const ConfigError& e) {
    init(false);
    Logger logger("dirfeed-main");
    logger.error("Configuration error: {}", e.what());
    return 1;
  } catch(const WatchInitError& e) {
    init(false);
    Logger logger("dirfeed-main");
    logger.error("Unable to watch directory: {}", e.what());
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("dirfeed-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
