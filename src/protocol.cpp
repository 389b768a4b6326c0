#include "protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace {

template<typename E, std::size_t N>
using NameTable = std::array<std::pair<E, const char*>, N>;

const NameTable<DeviceType, 2> kDeviceTypeNames{{
  {DeviceType::Mobile, "Mobile"},
  {DeviceType::Desktop, "Desktop"}
}};

const NameTable<Capability, 9> kCapabilityNames{{
  {Capability::ClipboardSync, "ClipboardSync"},
  {Capability::FileTransfer, "FileTransfer"},
  {Capability::InputShare, "InputShare"},
  {Capability::NotificationSync, "NotificationSync"},
  {Capability::BatteryStatus, "BatteryStatus"},
  {Capability::MediaControl, "MediaControl"},
  {Capability::RemoteCommands, "RemoteCommands"},
  {Capability::TouchpadMode, "TouchpadMode"},
  {Capability::SlideControl, "SlideControl"}
}};

const NameTable<KeyAction, 2> kKeyActionNames{{
  {KeyAction::Press, "Press"},
  {KeyAction::Release, "Release"}
}};

const NameTable<Key, 66> kKeyNames{{
  {Key::A, "A"}, {Key::B, "B"}, {Key::C, "C"}, {Key::D, "D"}, {Key::E, "E"},
  {Key::F, "F"}, {Key::G, "G"}, {Key::H, "H"}, {Key::I, "I"}, {Key::J, "J"},
  {Key::K, "K"}, {Key::L, "L"}, {Key::M, "M"}, {Key::N, "N"}, {Key::O, "O"},
  {Key::P, "P"}, {Key::Q, "Q"}, {Key::R, "R"}, {Key::S, "S"}, {Key::T, "T"},
  {Key::U, "U"}, {Key::V, "V"}, {Key::W, "W"}, {Key::X, "X"}, {Key::Y, "Y"},
  {Key::Z, "Z"},
  {Key::Key0, "Key0"}, {Key::Key1, "Key1"}, {Key::Key2, "Key2"}, {Key::Key3, "Key3"},
  {Key::Key4, "Key4"}, {Key::Key5, "Key5"}, {Key::Key6, "Key6"}, {Key::Key7, "Key7"},
  {Key::Key8, "Key8"}, {Key::Key9, "Key9"},
  {Key::F1, "F1"}, {Key::F2, "F2"}, {Key::F3, "F3"}, {Key::F4, "F4"},
  {Key::F5, "F5"}, {Key::F6, "F6"}, {Key::F7, "F7"}, {Key::F8, "F8"},
  {Key::F9, "F9"}, {Key::F10, "F10"}, {Key::F11, "F11"}, {Key::F12, "F12"},
  {Key::Escape, "Escape"}, {Key::Tab, "Tab"}, {Key::CapsLock, "CapsLock"},
  {Key::LeftShift, "LeftShift"}, {Key::LeftControl, "LeftControl"},
  {Key::LeftAlt, "LeftAlt"}, {Key::Space, "Space"}, {Key::RightAlt, "RightAlt"},
  {Key::RightControl, "RightControl"}, {Key::RightShift, "RightShift"},
  {Key::Enter, "Enter"}, {Key::Backspace, "Backspace"}, {Key::Delete, "Delete"},
  {Key::ArrowLeft, "ArrowLeft"}, {Key::ArrowRight, "ArrowRight"},
  {Key::ArrowUp, "ArrowUp"}, {Key::ArrowDown, "ArrowDown"},
  {Key::Unknown, "Unknown"}
}};

const NameTable<MouseAction, 4> kMouseActionNames{{
  {MouseAction::Move, "Move"},
  {MouseAction::Press, "Press"},
  {MouseAction::Release, "Release"},
  {MouseAction::Scroll, "Scroll"}
}};

const NameTable<MouseButtonKind, 4> kMouseButtonNames{{
  {MouseButtonKind::Left, "Left"},
  {MouseButtonKind::Right, "Right"},
  {MouseButtonKind::Middle, "Middle"},
  {MouseButtonKind::Other, "Other"}
}};

const NameTable<MediaAction, 8> kMediaActionNames{{
  {MediaAction::Play, "Play"},
  {MediaAction::Pause, "Pause"},
  {MediaAction::PlayPause, "PlayPause"},
  {MediaAction::Next, "Next"},
  {MediaAction::Previous, "Previous"},
  {MediaAction::VolumeUp, "VolumeUp"},
  {MediaAction::VolumeDown, "VolumeDown"},
  {MediaAction::ToggleMute, "ToggleMute"}
}};

const NameTable<SlideAction, 4> kSlideActionNames{{
  {SlideAction::NextSlide, "NextSlide"},
  {SlideAction::PreviousSlide, "PreviousSlide"},
  {SlideAction::StartPresentation, "StartPresentation"},
  {SlideAction::EndPresentation, "EndPresentation"}
}};

bool iequals(std::string_view a, std::string_view b) {
  if(a.size() != b.size()) return false;
  for(std::size_t i = 0; i < a.size(); ++i) {
    if(std::tolower(static_cast<unsigned char>(a[i])) !=
       std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

template<typename E, std::size_t N>
std::string name_of(const NameTable<E, N>& table, E value) {
  for(const auto& entry : table) {
    if(entry.first == value) return entry.second;
  }
  return "Unknown";
}

template<typename E, std::size_t N>
std::optional<E> lookup(const NameTable<E, N>& table, std::string_view text, bool ignore_case) {
  for(const auto& entry : table) {
    if(ignore_case ? iequals(text, entry.second) : text == entry.second) {
      return entry.first;
    }
  }
  return std::nullopt;
}

// ---- strict field readers -------------------------------------------------

const json& field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if(it == obj.end()) {
    throw DecodeError(std::string("missing field '") + key + "'");
  }
  return *it;
}

const json& expect_object(const json& payload, const char* tag) {
  if(!payload.is_object()) {
    throw DecodeError(std::string(tag) + ": expected an object payload");
  }
  return payload;
}

std::string as_string(const json& value, const char* what) {
  if(!value.is_string()) {
    throw DecodeError(std::string("'") + what + "' must be a string");
  }
  return value.get<std::string>();
}

std::string string_field(const json& obj, const char* key) {
  return as_string(field(obj, key), key);
}

uint64_t unsigned_field(const json& obj, const char* key) {
  const auto& value = field(obj, key);
  if(!value.is_number_unsigned()) {
    throw DecodeError(std::string("'") + key + "' must be a non-negative integer");
  }
  return value.get<uint64_t>();
}

int32_t int_field(const json& obj, const char* key) {
  const auto& value = field(obj, key);
  if(!value.is_number_integer()) {
    throw DecodeError(std::string("'") + key + "' must be an integer");
  }
  auto v = value.get<int64_t>();
  if(v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
    throw DecodeError(std::string("'") + key + "' out of range");
  }
  return static_cast<int32_t>(v);
}

float float_value(const json& value, const char* key) {
  if(!value.is_number()) {
    throw DecodeError(std::string("'") + key + "' must be a number");
  }
  return value.get<float>();
}

float float_field(const json& obj, const char* key) {
  return float_value(field(obj, key), key);
}

bool bool_value(const json& value, const char* key) {
  if(!value.is_boolean()) {
    throw DecodeError(std::string("'") + key + "' must be a boolean");
  }
  return value.get<bool>();
}

float optional_float(const json& obj, const char* key) {
  auto it = obj.find(key);
  if(it == obj.end() || it->is_null()) return 0.0f;
  return float_value(*it, key);
}

bool optional_bool(const json& obj, const char* key) {
  auto it = obj.find(key);
  if(it == obj.end() || it->is_null()) return false;
  return bool_value(*it, key);
}

std::vector<std::string> string_list(const json& value, const char* key) {
  if(!value.is_array()) {
    throw DecodeError(std::string("'") + key + "' must be an array");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for(const auto& item : value) {
    out.push_back(as_string(item, key));
  }
  return out;
}

template<typename E, std::size_t N>
E enum_value(const json& value, const NameTable<E, N>& table, const char* what) {
  auto name = as_string(value, what);
  auto parsed = lookup(table, name, false);
  if(!parsed) {
    throw DecodeError(std::string("unknown ") + what + " '" + name + "'");
  }
  return *parsed;
}

// ---- payload writers ------------------------------------------------------

json write_payload(const DeviceInfoBroadcast& m) { return json(m.info); }
json write_payload(const RequestPairing& m) { return json(m.info); }

json write_payload(const RequestPairingWithKey& m) {
  return json{{"id", m.id},
              {"name", m.name},
              {"device_type", m.device_type},
              {"capabilities", m.capabilities},
              {"pairing_key", m.pairing_key}};
}

json write_payload(const PairingAccepted& m) { return json{{"device_id", m.device_id}}; }

json write_payload(const PairingRejected& m) {
  return json{{"device_id", m.device_id}, {"reason", m.reason}};
}

json write_payload(const ClipboardSync& m) { return json(m.text); }

json write_payload(const FileTransferRequest& m) {
  return json{{"file_name", m.file_name}, {"file_size", m.file_size}};
}

json write_payload(const FileTransferChunk& m) {
  json j = json::object();
  j["file_name"] = m.file_name;
  j["chunk"] = m.chunk;
  j["offset"] = m.offset;
  return j;
}

json write_payload(const FileTransferEnd& m) { return json{{"file_name", m.file_name}}; }

json write_payload(const FileTransferError& m) {
  return json{{"file_name", m.file_name}, {"error", m.error}};
}

json write_payload(const KeyEvent& m) {
  json j = json::object();
  j["action"] = to_string(m.action);
  if(m.code.key == Key::Unknown) {
    j["code"] = json{{"Unknown", m.code.raw}};
  } else {
    j["code"] = to_string(m.code.key);
  }
  return j;
}

json write_payload(const MouseEvent& m) {
  json j = json::object();
  j["action"] = to_string(m.action);
  j["x"] = m.x;
  j["y"] = m.y;
  if(!m.button) {
    j["button"] = nullptr;
  } else if(m.button->kind == MouseButtonKind::Other) {
    j["button"] = json{{"Other", m.button->other}};
  } else {
    j["button"] = to_string(m.button->kind);
  }
  j["scroll_delta"] = m.scroll_delta ? json(*m.scroll_delta) : json(nullptr);
  return j;
}

json write_payload(const TouchpadEvent& m) {
  return json{{"x", m.x},
              {"y", m.y},
              {"dx", m.dx},
              {"dy", m.dy},
              {"scroll_delta_x", m.scroll_delta_x},
              {"scroll_delta_y", m.scroll_delta_y},
              {"is_left_click", m.is_left_click},
              {"is_right_click", m.is_right_click}};
}

json write_payload(const Notification& m) {
  json j = json::object();
  j["title"] = m.title;
  j["body"] = m.body;
  j["app_name"] = m.app_name ? json(*m.app_name) : json(nullptr);
  return j;
}

json write_payload(const MediaControl& m) { return json{{"action", to_string(m.action)}}; }

json write_payload(const BatteryStatus& m) {
  return json{{"charge", m.charge}, {"is_charging", m.is_charging}};
}

json write_payload(const RemoteCommand& m) {
  return json{{"command", m.command}, {"args", m.args}};
}

json write_payload(const SlideControl& m) { return json(to_string(m.action)); }

// ---- payload readers ------------------------------------------------------

void read_payload(const json& p, DeviceInfoBroadcast& m) { m.info = p.get<DeviceInfo>(); }
void read_payload(const json& p, RequestPairing& m) { m.info = p.get<DeviceInfo>(); }

void read_payload(const json& p, RequestPairingWithKey& m) {
  expect_object(p, RequestPairingWithKey::kTag);
  m.id = string_field(p, "id");
  m.name = string_field(p, "name");
  m.device_type = string_field(p, "device_type");
  m.capabilities = string_list(field(p, "capabilities"), "capabilities");
  m.pairing_key = string_field(p, "pairing_key");
}

void read_payload(const json& p, PairingAccepted& m) {
  expect_object(p, PairingAccepted::kTag);
  m.device_id = string_field(p, "device_id");
}

void read_payload(const json& p, PairingRejected& m) {
  expect_object(p, PairingRejected::kTag);
  m.device_id = string_field(p, "device_id");
  auto it = p.find("reason");
  if(it != p.end() && !it->is_null()) m.reason = as_string(*it, "reason");
}

void read_payload(const json& p, ClipboardSync& m) { m.text = as_string(p, ClipboardSync::kTag); }

void read_payload(const json& p, FileTransferRequest& m) {
  expect_object(p, FileTransferRequest::kTag);
  m.file_name = string_field(p, "file_name");
  m.file_size = unsigned_field(p, "file_size");
}

void read_payload(const json& p, FileTransferChunk& m) {
  expect_object(p, FileTransferChunk::kTag);
  m.file_name = string_field(p, "file_name");
  m.offset = unsigned_field(p, "offset");
  const auto& chunk = field(p, "chunk");
  if(!chunk.is_array()) throw DecodeError("'chunk' must be an array of bytes");
  m.chunk.clear();
  m.chunk.reserve(chunk.size());
  for(const auto& b : chunk) {
    if(!b.is_number_unsigned() || b.get<uint64_t>() > 255) {
      throw DecodeError("'chunk' contains a value that is not a byte");
    }
    m.chunk.push_back(static_cast<uint8_t>(b.get<uint64_t>()));
  }
}

void read_payload(const json& p, FileTransferEnd& m) {
  expect_object(p, FileTransferEnd::kTag);
  m.file_name = string_field(p, "file_name");
}

void read_payload(const json& p, FileTransferError& m) {
  expect_object(p, FileTransferError::kTag);
  m.file_name = string_field(p, "file_name");
  m.error = string_field(p, "error");
}

void read_payload(const json& p, KeyEvent& m) {
  expect_object(p, KeyEvent::kTag);
  m.action = enum_value(field(p, "action"), kKeyActionNames, "key action");
  const auto& code = field(p, "code");
  if(code.is_object()) {
    m.code.key = Key::Unknown;
    m.code.raw = static_cast<uint32_t>(unsigned_field(code, "Unknown"));
  } else {
    m.code.key = enum_value(code, kKeyNames, "key code");
    if(m.code.key == Key::Unknown) throw DecodeError("Unknown key code requires a raw value");
  }
}

void read_payload(const json& p, MouseEvent& m) {
  expect_object(p, MouseEvent::kTag);
  m.action = enum_value(field(p, "action"), kMouseActionNames, "mouse action");
  m.x = int_field(p, "x");
  m.y = int_field(p, "y");
  m.button.reset();
  auto button = p.find("button");
  if(button != p.end() && !button->is_null()) {
    MouseButton b;
    if(button->is_object()) {
      b.kind = MouseButtonKind::Other;
      b.other = static_cast<uint32_t>(unsigned_field(*button, "Other"));
    } else {
      b.kind = enum_value(*button, kMouseButtonNames, "mouse button");
      if(b.kind == MouseButtonKind::Other) throw DecodeError("Other mouse button requires a value");
    }
    m.button = b;
  }
  m.scroll_delta.reset();
  auto delta = p.find("scroll_delta");
  if(delta != p.end() && !delta->is_null()) {
    m.scroll_delta = float_value(*delta, "scroll_delta");
  }
}

void read_payload(const json& p, TouchpadEvent& m) {
  expect_object(p, TouchpadEvent::kTag);
  m.x = float_field(p, "x");
  m.y = float_field(p, "y");
  m.dx = float_field(p, "dx");
  m.dy = float_field(p, "dy");
  m.scroll_delta_x = optional_float(p, "scroll_delta_x");
  m.scroll_delta_y = optional_float(p, "scroll_delta_y");
  m.is_left_click = optional_bool(p, "is_left_click");
  m.is_right_click = optional_bool(p, "is_right_click");
}

void read_payload(const json& p, Notification& m) {
  expect_object(p, Notification::kTag);
  m.title = string_field(p, "title");
  m.body = string_field(p, "body");
  m.app_name.reset();
  auto it = p.find("app_name");
  if(it != p.end() && !it->is_null()) m.app_name = as_string(*it, "app_name");
}

void read_payload(const json& p, MediaControl& m) {
  expect_object(p, MediaControl::kTag);
  m.action = enum_value(field(p, "action"), kMediaActionNames, "media action");
}

void read_payload(const json& p, BatteryStatus& m) {
  expect_object(p, BatteryStatus::kTag);
  m.charge = float_field(p, "charge");
  m.is_charging = bool_value(field(p, "is_charging"), "is_charging");
}

void read_payload(const json& p, RemoteCommand& m) {
  expect_object(p, RemoteCommand::kTag);
  m.command = string_field(p, "command");
  m.args.clear();
  auto it = p.find("args");
  if(it != p.end() && !it->is_null()) m.args = string_list(*it, "args");
}

void read_payload(const json& p, SlideControl& m) {
  m.action = enum_value(p, kSlideActionNames, "slide action");
}

// ---- tag dispatch ---------------------------------------------------------

using Decoder = Message (*)(const json&);

template<typename T>
Message decode_variant(const json& payload) {
  T message;
  if constexpr(std::is_empty_v<T>) {
    if(!payload.is_null() && !(payload.is_object() && payload.empty())) {
      throw DecodeError(std::string(T::kTag) + " takes no payload");
    }
  } else {
    read_payload(payload, message);
  }
  return message;
}

template<std::size_t... I>
std::unordered_map<std::string, Decoder> build_decoders(std::index_sequence<I...>) {
  return {
    {std::variant_alternative_t<I, Message>::kTag,
     &decode_variant<std::variant_alternative_t<I, Message>>}...
  };
}

const std::unordered_map<std::string, Decoder>& decoders() {
  static const auto table = build_decoders(std::make_index_sequence<std::variant_size_v<Message>>{});
  return table;
}

} // namespace

const std::vector<Capability>& all_capabilities() {
  static const std::vector<Capability> all = [](){
    std::vector<Capability> out;
    for(const auto& entry : kCapabilityNames) out.push_back(entry.first);
    return out;
  }();
  return all;
}

bool operator==(const DeviceInfo& a, const DeviceInfo& b) {
  return a.id == b.id && a.name == b.name &&
         a.device_type == b.device_type && a.capabilities == b.capabilities;
}

bool operator!=(const DeviceInfo& a, const DeviceInfo& b) {
  return !(a == b);
}

void to_json(json& j, const DeviceInfo& info) {
  json caps = json::array();
  for(auto cap : info.capabilities) caps.push_back(to_string(cap));
  j = json{{"id", info.id},
           {"name", info.name},
           {"device_type", to_string(info.device_type)},
           {"capabilities", std::move(caps)}};
}

void from_json(const json& j, DeviceInfo& info) {
  expect_object(j, "DeviceInfo");
  info.id = string_field(j, "id");
  info.name = string_field(j, "name");
  info.device_type = enum_value(field(j, "device_type"), kDeviceTypeNames, "device type");
  info.capabilities.clear();
  const auto& caps = field(j, "capabilities");
  if(!caps.is_array()) throw DecodeError("'capabilities' must be an array");
  for(const auto& cap : caps) {
    info.capabilities.insert(enum_value(cap, kCapabilityNames, "capability"));
  }
}

json message_to_json(const Message& message) {
  return std::visit([](const auto& m) -> json {
    using T = std::decay_t<decltype(m)>;
    if constexpr(std::is_empty_v<T>) {
      return json(T::kTag);
    } else {
      json doc = json::object();
      doc[T::kTag] = write_payload(m);
      return doc;
    }
  }, message);
}

Message message_from_json(const json& doc) {
  std::string tag;
  json payload;
  if(doc.is_string()) {
    tag = doc.get<std::string>();
  } else if(doc.is_object() && doc.size() == 1) {
    tag = doc.begin().key();
    payload = doc.begin().value();
  } else {
    throw DecodeError("expected a tagged message");
  }

  const auto& table = decoders();
  auto it = table.find(tag);
  if(it == table.end()) {
    throw DecodeError("unknown message type '" + tag + "'");
  }
  try {
    return it->second(payload);
  } catch(const DecodeError& e) {
    throw DecodeError(tag + ": " + e.what());
  } catch(const json::exception& e) {
    throw DecodeError(tag + ": " + e.what());
  }
}

std::string encode_message(const Message& message) {
  return message_to_json(message).dump();
}

Message decode_message(std::string_view bytes) {
  while(!bytes.empty() && (bytes.back() == '\n' || bytes.back() == '\r')) {
    bytes.remove_suffix(1);
  }
  if(bytes.empty()) {
    throw DecodeError("empty message");
  }
  json doc;
  try {
    doc = json::parse(bytes.begin(), bytes.end());
  } catch(const json::parse_error& e) {
    throw DecodeError(std::string("invalid JSON: ") + e.what());
  }
  return message_from_json(doc);
}

std::string frame_message(const Message& message) {
  auto out = encode_message(message);
  out.push_back(kMessageDelimiter);
  return out;
}

const char* message_type_name(const Message& message) {
  return std::visit([](const auto& m) -> const char* {
    return std::decay_t<decltype(m)>::kTag;
  }, message);
}

std::string to_string(DeviceType value) { return name_of(kDeviceTypeNames, value); }
std::string to_string(Capability value) { return name_of(kCapabilityNames, value); }
std::string to_string(KeyAction value) { return name_of(kKeyActionNames, value); }
std::string to_string(Key value) { return name_of(kKeyNames, value); }
std::string to_string(MouseAction value) { return name_of(kMouseActionNames, value); }
std::string to_string(MouseButtonKind value) { return name_of(kMouseButtonNames, value); }
std::string to_string(MediaAction value) { return name_of(kMediaActionNames, value); }
std::string to_string(SlideAction value) { return name_of(kSlideActionNames, value); }

std::optional<DeviceType> parse_device_type(std::string_view text) {
  return lookup(kDeviceTypeNames, text, true);
}

std::optional<Capability> parse_capability(std::string_view text) {
  return lookup(kCapabilityNames, text, true);
}

std::optional<KeyAction> parse_key_action(std::string_view text) {
  return lookup(kKeyActionNames, text, true);
}

std::optional<Key> parse_key(std::string_view text) {
  auto key = lookup(kKeyNames, text, true);
  if(key == Key::Unknown) return std::nullopt;
  return key;
}

std::optional<MouseAction> parse_mouse_action(std::string_view text) {
  return lookup(kMouseActionNames, text, true);
}

std::optional<MouseButtonKind> parse_mouse_button(std::string_view text) {
  auto kind = lookup(kMouseButtonNames, text, true);
  if(kind == MouseButtonKind::Other) return std::nullopt;
  return kind;
}

std::optional<MediaAction> parse_media_action(std::string_view text) {
  return lookup(kMediaActionNames, text, true);
}

std::optional<SlideAction> parse_slide_action(std::string_view text) {
  return lookup(kSlideActionNames, text, true);
}
