#include <cpptrace/cpptrace.hpp>
#include <filesystem>

#include "anyware_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    AnywareEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;

    AnywareEngine engine(nullptr, options);
    auto settings = engine.settings();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "anyware");
    std::string parse_error;
    if(!parser.parse(argc, argv, *settings, parse_error)) {
      init(false);
      engine.logger()->print_err("{}", parse_error);
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    auto logger = engine.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    auto local = engine.local_device();
    logger->print("{} ready at {}:{}; type 'help' for commands", local.name, local.ip, engine.transfer_port());
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("anyware-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
