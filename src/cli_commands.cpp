#include "cli_commands.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "utils.hpp"

namespace {

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

void require(const std::vector<std::string>& args, std::size_t min, std::size_t max, const std::string& command) {
  if(args.size() < min || args.size() > max) {
    throw std::invalid_argument(command + ": wrong number of arguments");
  }
}

int32_t parse_int(const std::string& text, const char* what) {
  try {
    std::size_t used = 0;
    long value = std::stol(text, &used);
    if(used == text.size() && value >= INT32_MIN && value <= INT32_MAX) return static_cast<int32_t>(value);
  } catch(const std::logic_error&) {
  }
  throw std::invalid_argument(std::string("invalid ") + what + " '" + text + "'");
}

float parse_float(const std::string& text, const char* what) {
  try {
    std::size_t used = 0;
    float value = std::stof(text, &used);
    if(used == text.size()) return value;
  } catch(const std::logic_error&) {
  }
  throw std::invalid_argument(std::string("invalid ") + what + " '" + text + "'");
}

bool parse_flag(const std::string& text) {
  auto v = lower(text);
  if(v == "true" || v == "yes" || v == "1" || v == "charging") return true;
  if(v == "false" || v == "no" || v == "0" || v == "discharging") return false;
  throw std::invalid_argument("expected true or false, got '" + text + "'");
}

template<typename T>
T require_value(std::optional<T> value, const char* what, const std::string& text) {
  if(!value) throw std::invalid_argument(std::string("unknown ") + what + " '" + text + "'");
  return *value;
}

std::string join(const std::vector<std::string>& args, std::size_t from = 0) {
  std::string out;
  for(std::size_t i = from; i < args.size(); ++i) {
    if(i > from) out += ' ';
    out += args[i];
  }
  return out;
}

std::string cli_device_id() {
  return "cli-" + local_hostname();
}

Message build_mouse(const std::vector<std::string>& args) {
  require(args, 1, 4, "mouse");
  MouseEvent event;
  event.action = require_value(parse_mouse_action(args[0]), "mouse action", args[0]);
  if(args.size() >= 3) {
    event.x = parse_int(args[1], "x");
    event.y = parse_int(args[2], "y");
  } else if(args.size() == 2) {
    throw std::invalid_argument("mouse: x and y go together");
  }
  if(args.size() == 4) {
    if(event.action == MouseAction::Scroll) {
      event.scroll_delta = parse_float(args[3], "scroll delta");
    } else {
      event.button = MouseButton{require_value(parse_mouse_button(args[3]), "mouse button", args[3]), 0};
    }
  } else if(event.action == MouseAction::Press || event.action == MouseAction::Release) {
    event.button = MouseButton{MouseButtonKind::Left, 0};
  }
  return event;
}

Message build_touchpad(const std::vector<std::string>& args) {
  require(args, 2, 5, "touchpad");
  if(args.size() == 3) throw std::invalid_argument("touchpad: scroll_x and scroll_y go together");
  TouchpadEvent event;
  event.dx = parse_float(args[0], "dx");
  event.dy = parse_float(args[1], "dy");
  if(args.size() >= 4) {
    event.scroll_delta_x = parse_float(args[2], "scroll_x");
    event.scroll_delta_y = parse_float(args[3], "scroll_y");
  }
  if(args.size() == 5) {
    auto click = lower(args[4]);
    if(click == "left") event.is_left_click = true;
    else if(click == "right") event.is_right_click = true;
    else throw std::invalid_argument("touchpad: click must be left or right");
  }
  return event;
}

Message build_keyed_pairing(const std::vector<std::string>& args) {
  require(args, 1, 3, "pair");
  RequestPairingWithKey request;
  request.pairing_key = args[0];
  request.id = args.size() > 1 ? args[1] : cli_device_id();
  request.name = args.size() > 2 ? args[2] : local_hostname();
  request.device_type = to_string(DeviceType::Desktop);
  for(auto cap : all_capabilities()) request.capabilities.push_back(to_string(cap));
  return request;
}

Message build_legacy_pairing(const std::vector<std::string>& args) {
  require(args, 0, 2, "pair-legacy");
  DeviceInfo info;
  info.id = args.size() > 0 ? args[0] : cli_device_id();
  info.name = args.size() > 1 ? args[1] : local_hostname();
  info.device_type = DeviceType::Desktop;
  for(auto cap : all_capabilities()) info.capabilities.insert(cap);
  return RequestPairing{info};
}

} // namespace

Key parse_cli_key(const std::string& text) {
  static const std::unordered_map<std::string, Key> aliases = {
    {"0", Key::Key0}, {"1", Key::Key1}, {"2", Key::Key2}, {"3", Key::Key3}, {"4", Key::Key4},
    {"5", Key::Key5}, {"6", Key::Key6}, {"7", Key::Key7}, {"8", Key::Key8}, {"9", Key::Key9},
    {"shift", Key::LeftShift}, {"ctrl", Key::LeftControl}, {"leftctrl", Key::LeftControl},
    {"alt", Key::LeftAlt}, {"rightctrl", Key::RightControl},
    {"esc", Key::Escape}, {"return", Key::Enter},
    {"left", Key::ArrowLeft}, {"arrow_left", Key::ArrowLeft},
    {"right", Key::ArrowRight}, {"arrow_right", Key::ArrowRight},
    {"up", Key::ArrowUp}, {"arrow_up", Key::ArrowUp},
    {"down", Key::ArrowDown}, {"arrow_down", Key::ArrowDown}
  };
  auto it = aliases.find(lower(text));
  if(it != aliases.end()) return it->second;
  return require_value(parse_key(text), "key", text);
}

SlideAction parse_cli_slide_action(const std::string& text) {
  static const std::unordered_map<std::string, SlideAction> aliases = {
    {"next", SlideAction::NextSlide},
    {"prev", SlideAction::PreviousSlide}, {"previous", SlideAction::PreviousSlide},
    {"prevslide", SlideAction::PreviousSlide},
    {"start", SlideAction::StartPresentation},
    {"stop", SlideAction::EndPresentation}, {"end", SlideAction::EndPresentation}
  };
  auto it = aliases.find(lower(text));
  if(it != aliases.end()) return it->second;
  return require_value(parse_slide_action(text), "slide action", text);
}

const std::vector<CliCommand>& cli_commands() {
  static const std::vector<CliCommand> commands = {
    {"ping", "", "Check that the daemon answers", true,
     [](const std::vector<std::string>& args) -> Message { require(args, 0, 0, "ping"); return Ping{}; }},
    {"set-clipboard", "<text>", "Replace the daemon's clipboard", false,
     [](const std::vector<std::string>& args) -> Message {
       if(args.empty()) throw std::invalid_argument("set-clipboard: missing text");
       return ClipboardSync{join(args)};
     }},
    {"get-clipboard", "", "Print the daemon's clipboard", true,
     [](const std::vector<std::string>& args) -> Message { require(args, 0, 0, "get-clipboard"); return RequestClipboard{}; }},
    {"send-file", "<path>", "Send a file in 8 KiB chunks", false, nullptr},
    {"key", "<press|release> <key>", "Inject a key event", false,
     [](const std::vector<std::string>& args) -> Message {
       require(args, 2, 2, "key");
       KeyEvent event;
       event.action = require_value(parse_key_action(args[0]), "key action", args[0]);
       event.code = KeyCode{parse_cli_key(args[1]), 0};
       return event;
     }},
    {"mouse", "<move|press|release|scroll> [x y [button|delta]]", "Inject a mouse event", false, build_mouse},
    {"notify", "<title> <body> [app]", "Show a notification", false,
     [](const std::vector<std::string>& args) -> Message {
       require(args, 2, 3, "notify");
       Notification note{args[0], args[1], std::nullopt};
       if(args.size() == 3) note.app_name = args[2];
       return note;
     }},
    {"media", "<action>", "Play, Pause, PlayPause, Next, Previous, VolumeUp, VolumeDown, ToggleMute", false,
     [](const std::vector<std::string>& args) -> Message {
       require(args, 1, 1, "media");
       return MediaControl{require_value(parse_media_action(args[0]), "media action", args[0])};
     }},
    {"battery", "<charge> <charging>", "Report a battery status", false,
     [](const std::vector<std::string>& args) -> Message {
       require(args, 2, 2, "battery");
       return BatteryStatus{parse_float(args[0], "charge"), parse_flag(args[1])};
     }},
    {"touchpad", "<dx> <dy> [scroll_x scroll_y [left|right]]", "Send a touchpad event", false, build_touchpad},
    {"slide", "<next|prev|start|end>", "Drive a presentation", false,
     [](const std::vector<std::string>& args) -> Message {
       require(args, 1, 1, "slide");
       return SlideControl{parse_cli_slide_action(args[0])};
     }},
    {"remote", "<command> [args...]", "Run a whitelisted command on the host", false,
     [](const std::vector<std::string>& args) -> Message {
       if(args.empty()) throw std::invalid_argument("remote: missing command");
       return RemoteCommand{args[0], std::vector<std::string>(args.begin() + 1, args.end())};
     }},
    {"pair", "<key> [id] [name]", "Pair with the code shown by the daemon", true, build_keyed_pairing},
    {"pair-legacy", "[id] [name]", "Pair without a code", true, build_legacy_pairing}
  };
  return commands;
}

const CliCommand* find_cli_command(const std::string& name) {
  for(const auto& command : cli_commands()) {
    if(command.name == name) return &command;
  }
  return nullptr;
}

std::string cli_commands_help() {
  std::ostringstream out;
  bool first = true;
  for(const auto& command : cli_commands()) {
    if(!first) out << '\n';
    first = false;
    std::string head = command.name;
    if(!command.arguments.empty()) head += " " + command.arguments;
    out << "  " << head;
    if(head.size() < 48) out << std::string(48 - head.size(), ' ');
    else out << "  ";
    out << command.summary;
  }
  return out.str();
}

std::string describe_reply(const Message& reply) {
  if(std::holds_alternative<Pong>(reply)) return "Daemon is running and responding";
  if(auto* accepted = std::get_if<PairingAccepted>(&reply)) return "Paired as " + accepted->device_id;
  if(auto* rejected = std::get_if<PairingRejected>(&reply)) return "Pairing rejected: " + rejected->reason;
  if(auto* clip = std::get_if<ClipboardSync>(&reply)) return "Clipboard: " + clip->text;
  if(auto* error = std::get_if<FileTransferError>(&reply)) return "Transfer of " + error->file_name + " failed: " + error->error;
  return std::string(message_type_name(reply)) + ": " + encode_message(reply);
}
