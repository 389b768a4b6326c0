#include "cli_commands.hpp"
#include "command_line_parser.hpp"
#include "daemon.hpp"
#include "errors.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using libreconnect::test::TestCase;
using libreconnect::test::TestContext;
using libreconnect::test::expect;
using libreconnect::test::expect_eq;

bool throws_configuration(const std::function<void()>& fn) {
  try {
    fn();
  } catch(const DaemonError& e) {
    return e.kind() == ErrorKind::Configuration;
  }
  return false;
}

bool throws_invalid_argument(const std::function<void()>& fn) {
  try {
    fn();
  } catch(const std::invalid_argument&) {
    return true;
  }
  return false;
}

Message build(const std::string& command, const std::vector<std::string>& args) {
  const auto* entry = find_cli_command(command);
  if(!entry || !entry->build) throw std::logic_error("no builder for " + command);
  return entry->build(args);
}

bool test_defaults(TestContext&) {
  SettingsManager settings(DAEMON_SETTINGS_SPECIFICATION);
  if(!expect_eq(settings.get<long long>("port"), 1716LL, "default port")) return false;
  if(!expect_eq(settings.get<std::string>("listen_ip"), std::string("0.0.0.0"), "default listen ip")) return false;
  if(!expect(settings.get<bool>("discovery"), "discovery on by default")) return false;
  return expect(!settings.help_requested() && !settings.save_requested(), "no help or save by default");
}

bool test_range_checks(TestContext&) {
  SettingsManager settings(DAEMON_SETTINGS_SPECIFICATION);
  std::string error;
  if(!expect(!settings.set_from_string("port", "70000", error), "port above 65535 rejected")) return false;
  if(!expect(!error.empty(), "range error is described")) return false;
  if(!expect(!settings.set_from_string("worker_threads", "0", error), "zero workers rejected")) return false;
  if(!expect(!settings.set_from_string("port", "12ab", error), "trailing garbage rejected")) return false;
  if(!expect(settings.set_from_string("port", "0", error), "port 0 accepted")) return false;
  return expect_eq(settings.get<long long>("port"), 0LL, "port stored");
}

bool test_environment_override(TestContext&) {
  ::setenv("LIBRECONNECT_PORT", "4242", 1);
  SettingsManager settings(CLIENT_SETTINGS_SPECIFICATION);
  settings.apply_environment();
  ::unsetenv("LIBRECONNECT_PORT");
  return expect_eq(settings.get<long long>("port"), 4242LL, "port from environment");
}

bool test_settings_file_round_trip(TestContext&) {
  auto root = libreconnect::test::prepare_workspace("config_round_trip");
  SettingsManager settings(DAEMON_SETTINGS_SPECIFICATION);
  std::string error;
  if(!expect(settings.set_from_string("config_dir", root.string(), error), "config_dir set")) return false;
  if(!expect(settings.set_from_string("device_name", "bench", error), "device_name set")) return false;
  if(!expect(settings.set_from_string("help", "true", error), "help set")) return false;
  if(!expect(settings.save(), "settings saved")) return false;
  if(!expect(std::filesystem::exists(root / "settings.json"), "settings.json written under config_dir")) return false;

  SettingsManager reloaded(DAEMON_SETTINGS_SPECIFICATION);
  reloaded.set_from_string("config_dir", root.string(), error);
  if(!expect(reloaded.load(), "settings loaded")) return false;
  if(!expect_eq(reloaded.get<std::string>("device_name"), std::string("bench"), "device_name persisted")) return false;
  return expect(!reloaded.help_requested(), "help is not persisted");
}

bool test_command_line_forms(TestContext&) {
  SettingsManager settings(DAEMON_SETTINGS_SPECIFICATION);
  CommandLineParser parser;
  parser.parse({"--listen_ip", "127.0.0.1", "-t", "2", "--discovery=false", "--verbose", "9000"}, settings);
  if(!expect_eq(settings.get<std::string>("listen_ip"), std::string("127.0.0.1"), "long option")) return false;
  if(!expect_eq(settings.get<long long>("worker_threads"), 2LL, "short alias")) return false;
  if(!expect(!settings.get<bool>("discovery"), "--key=value form")) return false;
  if(!expect(settings.get<bool>("verbose"), "bare boolean flag")) return false;
  return expect_eq(settings.get<long long>("port"), 9000LL, "positional port");
}

bool test_command_line_errors(TestContext&) {
  SettingsManager settings(DAEMON_SETTINGS_SPECIFICATION);
  CommandLineParser parser;
  if(!expect(throws_configuration([&]{ parser.parse({"--no-such-option", "1"}, settings); }), "unknown option")) return false;
  if(!expect(throws_configuration([&]{ parser.parse({"--port"}, settings); }), "missing value")) return false;
  if(!expect(throws_configuration([&]{ parser.parse({"--port", "99999"}, settings); }), "out of range")) return false;
  return expect(throws_configuration([&]{ parser.parse({"1716", "extra"}, settings); }), "unexpected positional");
}

bool test_client_rest_arguments(TestContext&) {
  SettingsManager settings(CLIENT_SETTINGS_SPECIFICATION);
  CommandLineParser parser("libreconnect-cli", "client", CLIENT_SETTINGS_SPECIFICATION, nlohmann::json::array());
  std::vector<std::string> rest;
  parser.parse({"--port", "2000", "mouse", "move", "-5", "10"}, settings, &rest);
  if(!expect_eq(settings.get<long long>("port"), 2000LL, "port before the command")) return false;
  if(!expect_eq(rest.size(), std::size_t(4), "command and its arguments kept")) return false;
  if(!expect_eq(rest[2], std::string("-5"), "negative number kept verbatim")) return false;

  rest.clear();
  parser.parse({"remote", "ls", "-l"}, settings, &rest);
  return expect_eq(rest.back(), std::string("-l"), "options after the command belong to it");
}

bool test_options_from_settings(TestContext&) {
  SettingsManager settings(DAEMON_SETTINGS_SPECIFICATION);
  std::string error;
  settings.set_from_string("device_name", "desk", error);
  settings.set_from_string("read_timeout_secs", "7", error);
  settings.set_from_string("discovery_interval_secs", "2", error);
  auto options = Daemon::Options::from_settings(settings);
  if(!expect_eq(options.device_name, std::string("desk"), "device name")) return false;
  if(!expect_eq(options.read_timeout.count(), 7000LL, "read timeout in ms")) return false;
  if(!expect_eq(options.discovery_interval.count(), 2000LL, "discovery interval in ms")) return false;
  if(!expect(!options.config_dir.empty() && !options.download_dir.empty(), "directories resolved")) return false;

  SettingsManager unnamed(DAEMON_SETTINGS_SPECIFICATION);
  return expect(!Daemon::Options::from_settings(unnamed).device_name.empty(), "empty device name falls back to the host name");
}

bool test_cli_key_names(TestContext&) {
  if(!expect(parse_cli_key("a") == Key::A, "letter")) return false;
  if(!expect(parse_cli_key("7") == Key::Key7, "digit")) return false;
  if(!expect(parse_cli_key("ctrl") == Key::LeftControl, "ctrl alias")) return false;
  if(!expect(parse_cli_key("Up") == Key::ArrowUp, "arrow alias")) return false;
  if(!expect(parse_cli_key("F12") == Key::F12, "function key")) return false;
  if(!expect(throws_invalid_argument([]{ parse_cli_key("hyper"); }), "unknown key")) return false;
  if(!expect(parse_cli_slide_action("prev") == SlideAction::PreviousSlide, "slide alias")) return false;
  return expect(parse_cli_slide_action("StartPresentation") == SlideAction::StartPresentation, "full slide name");
}

bool test_cli_builders(TestContext&) {
  auto key = build("key", {"press", "enter"});
  auto* key_event = std::get_if<KeyEvent>(&key);
  if(!expect(key_event && key_event->code.key == Key::Enter && key_event->action == KeyAction::Press, "key event")) return false;

  auto mouse = build("mouse", {"move", "-5", "10"});
  auto* mouse_event = std::get_if<MouseEvent>(&mouse);
  if(!expect(mouse_event && mouse_event->x == -5 && mouse_event->y == 10, "mouse move")) return false;
  if(!expect(!mouse_event->button, "move carries no button")) return false;

  auto press = build("mouse", {"press", "1", "2", "right"});
  auto* press_event = std::get_if<MouseEvent>(&press);
  if(!expect(press_event && press_event->button && press_event->button->kind == MouseButtonKind::Right, "press with button")) return false;

  auto scroll = build("mouse", {"scroll", "0", "0", "-3"});
  auto* scroll_event = std::get_if<MouseEvent>(&scroll);
  if(!expect(scroll_event && scroll_event->scroll_delta && *scroll_event->scroll_delta == -3.0f, "scroll delta")) return false;

  auto clip = build("set-clipboard", {"two", "words"});
  auto* clip_sync = std::get_if<ClipboardSync>(&clip);
  if(!expect(clip_sync && clip_sync->text == "two words", "clipboard text joined")) return false;

  auto pair = build("pair", {"123456"});
  auto* pair_request = std::get_if<RequestPairingWithKey>(&pair);
  if(!expect(pair_request && pair_request->pairing_key == "123456", "pairing key")) return false;
  if(!expect_eq(pair_request->capabilities.size(), all_capabilities().size(), "all capabilities announced")) return false;

  auto remote = build("remote", {"ls", "-l", "/tmp"});
  auto* command = std::get_if<RemoteCommand>(&remote);
  return expect(command && command->command == "ls" && command->args.size() == 2, "remote command and args");
}

bool test_cli_builder_errors(TestContext&) {
  if(!expect(throws_invalid_argument([]{ build("mouse", {"move", "x", "1"}); }), "non-numeric coordinate")) return false;
  if(!expect(throws_invalid_argument([]{ build("mouse", {"move", "1"}); }), "lone coordinate")) return false;
  if(!expect(throws_invalid_argument([]{ build("media", {"rewind"}); }), "unknown media action")) return false;
  if(!expect(throws_invalid_argument([]{ build("battery", {"50", "maybe"}); }), "bad charging flag")) return false;
  if(!expect(throws_invalid_argument([]{ build("ping", {"extra"}); }), "extra argument")) return false;
  if(!expect(find_cli_command("teleport") == nullptr, "unknown command")) return false;
  return expect(find_cli_command("send-file") && !find_cli_command("send-file")->build, "send-file streams instead of building");
}

bool test_reply_descriptions(TestContext&) {
  if(!expect_eq(describe_reply(Pong{}), std::string("Daemon is running and responding"), "pong")) return false;
  if(!expect_eq(describe_reply(PairingRejected{"cli", "Invalid pairing key"}),
                std::string("Pairing rejected: Invalid pairing key"), "rejection")) return false;
  return expect(cli_commands_help().find("send-file") != std::string::npos, "help lists every command");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"range_checks", test_range_checks},
    {"environment_override", test_environment_override},
    {"settings_file_round_trip", test_settings_file_round_trip},
    {"command_line_forms", test_command_line_forms},
    {"command_line_errors", test_command_line_errors},
    {"client_rest_arguments", test_client_rest_arguments},
    {"options_from_settings", test_options_from_settings},
    {"cli_key_names", test_cli_key_names},
    {"cli_builders", test_cli_builders},
    {"cli_builder_errors", test_cli_builder_errors},
    {"reply_descriptions", test_reply_descriptions}
  };
  return libreconnect::test::run_suite("config", tests, argc, argv);
}
