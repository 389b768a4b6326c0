#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "daemon.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

// Defaults, then settings.json, then the environment, then the command line.
// The command line is parsed twice because it may move config_dir.
void load_settings(const CommandLineParser& parser, int argc, char** argv, SettingsManager& settings) {
  parser.parse(argc, argv, settings);
  if(settings.help_requested()) return;
  settings.load();
  settings.apply_environment();
  parser.parse(argc, argv, settings);
}

} // namespace

int main(int argc, char** argv) {
  try {
    SettingsManager settings(DAEMON_SETTINGS_SPECIFICATION);
    CommandLineParser parser("libreconnectd", "LibreConnect daemon");
    load_settings(parser, argc, argv, settings);
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("libreconnectd");
    logger->debug("Verbose logging enabled");

    if(settings.save_requested()) {
      if(settings.save()) {
        logger->info("Settings saved to {}", settings.settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    Daemon daemon(Daemon::Options::from_settings(settings), PlatformServices(), logger);

    asio::signal_set signals(daemon.io(), SIGINT, SIGTERM);
    signals.async_wait([&daemon](const std::error_code& ec, int signal_number){
      if(ec) return;
      daemon.request_stop(signal_number == SIGINT ? "interrupted" : "terminated");
    });

    try {
      daemon.start();
    } catch(const DaemonError& e) {
      logger->error("{}", e.what());
      daemon.stop();
      return 1;
    }

    daemon.run();
    logger->info("Exiting: {}", daemon.stop_reason());
    return 0;
  } catch(const DaemonError& e) {
    init(false);
    Logger logger("libreconnectd");
    logger.error("{}", e.what());
    return e.kind() == ErrorKind::Configuration ? 2 : 1;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("libreconnectd");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
