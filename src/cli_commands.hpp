#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

// Subcommands of libreconnect-cli. build() turns the command's arguments
// into the message to send and throws std::invalid_argument on bad input.
struct CliCommand {
  std::string name;
  std::string arguments;
  std::string summary;
  bool expects_reply = false;
  std::function<Message(const std::vector<std::string>& args)> build;
};

// send-file has no builder; the caller streams the file itself.
const std::vector<CliCommand>& cli_commands();
const CliCommand* find_cli_command(const std::string& name);
std::string cli_commands_help();

// Key names as typed by people: "a", "1", "ctrl", "left", "f5", "ArrowUp".
Key parse_cli_key(const std::string& text);
SlideAction parse_cli_slide_action(const std::string& text);

// One line describing a daemon reply.
std::string describe_reply(const Message& reply);
