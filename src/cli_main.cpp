#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "client.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

int run_command(const CliCommand& command,
                const std::vector<std::string>& args,
                const SettingsManager& settings,
                const std::shared_ptr<Logger>& logger) {
  const auto timeout = std::chrono::seconds(settings.get<long long>("timeout"));
  const auto host = settings.get<std::string>("host");
  const auto port = static_cast<uint16_t>(settings.get<long long>("port"));

  std::optional<Message> message;
  if(command.build) {
    message = command.build(args);
  } else if(args.size() != 1) {
    print_err(nullptr, "usage: libreconnect-cli {} {}", command.name, command.arguments);
    return 2;
  }

  asio::io_context io;
  Client client(io, logger);
  client.connect(host, port, timeout);

  if(!message) {
    auto sent = client.send_file(args.front(), timeout);
    logger->print("Sent {} ({} bytes)", args.front(), sent);
    return 0;
  }

  if(!command.expects_reply) {
    client.send(*message, timeout);
    logger->print("Sent {}", message_type_name(*message));
    return 0;
  }

  auto reply = client.request(*message, timeout);
  if(!reply) {
    logger->print_err("Daemon closed the connection without replying");
    return 1;
  }
  logger->print("{}", describe_reply(*reply));
  return std::holds_alternative<PairingRejected>(*reply) ? 1 : 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    SettingsManager settings(CLIENT_SETTINGS_SPECIFICATION);
    settings.apply_environment();
    CommandLineParser parser("libreconnect-cli", "Talk to a running LibreConnect daemon",
                             CLIENT_SETTINGS_SPECIFICATION, nlohmann::json::array());
    std::vector<std::string> rest;
    parser.parse(argc, argv, settings, &rest);
    if(settings.help_requested() || rest.empty()) {
      parser.usage(cli_commands_help());
      return rest.empty() && !settings.help_requested() ? 2 : 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("");

    const auto* command = find_cli_command(rest.front());
    if(!command) {
      logger->print_err("Unknown command '{}'", rest.front());
      parser.usage(cli_commands_help());
      return 2;
    }

    std::vector<std::string> args(rest.begin() + 1, rest.end());
    try {
      return run_command(*command, args, settings, logger);
    } catch(const std::invalid_argument& e) {
      logger->print_err("{}", e.what());
      logger->print_err("usage: libreconnect-cli {} {}", command->name, command->arguments);
      return 2;
    }
  } catch(const DaemonError& e) {
    print_err(nullptr, "{}", e.what());
    return e.kind() == ErrorKind::Configuration ? 2 : 1;
  } catch(const std::exception& e) {
    print_err(nullptr, "Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
