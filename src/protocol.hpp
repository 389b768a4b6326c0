#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using json = nlohmann::json;

// protocol.hpp
inline constexpr unsigned short kDefaultPort = 1716;
inline constexpr std::size_t kMaxMessageSize = 64 * 1024 * 1024;
inline constexpr std::size_t kMaxChunkSize = 8192;
inline constexpr char kMessageDelimiter = '\n';
inline constexpr const char* kProtocolVersion = "1.0";
inline constexpr const char* kServiceType = "_libreconnect._tcp.local.";

using DeviceId = std::string;

class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class DeviceType { Mobile, Desktop };

enum class Capability {
  ClipboardSync,
  FileTransfer,
  InputShare,
  NotificationSync,
  BatteryStatus,
  MediaControl,
  RemoteCommands,
  TouchpadMode,
  SlideControl
};

const std::vector<Capability>& all_capabilities();

struct DeviceInfo {
  DeviceId id;
  std::string name;
  DeviceType device_type = DeviceType::Mobile;
  std::set<Capability> capabilities;
};

bool operator==(const DeviceInfo& a, const DeviceInfo& b);
bool operator!=(const DeviceInfo& a, const DeviceInfo& b);

enum class KeyAction { Press, Release };

enum class Key {
  A, B, C, D, E, F, G, H, I, J, K, L, M, N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
  Key0, Key1, Key2, Key3, Key4, Key5, Key6, Key7, Key8, Key9,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  Escape, Tab, CapsLock, LeftShift, LeftControl, LeftAlt, Space, RightAlt,
  RightControl, RightShift, Enter, Backspace, Delete,
  ArrowLeft, ArrowRight, ArrowUp, ArrowDown,
  Unknown
};

// Key::Unknown carries the platform scan code in `raw`.
struct KeyCode {
  Key key = Key::Unknown;
  uint32_t raw = 0;
};

enum class MouseAction { Move, Press, Release, Scroll };

enum class MouseButtonKind { Left, Right, Middle, Other };

struct MouseButton {
  MouseButtonKind kind = MouseButtonKind::Left;
  uint32_t other = 0;
};

enum class MediaAction { Play, Pause, PlayPause, Next, Previous, VolumeUp, VolumeDown, ToggleMute };

enum class SlideAction { NextSlide, PreviousSlide, StartPresentation, EndPresentation };

// ---- message variants -----------------------------------------------------

struct Ping { static constexpr const char* kTag = "Ping"; };
struct Pong { static constexpr const char* kTag = "Pong"; };

struct DeviceInfoBroadcast {
  static constexpr const char* kTag = "DeviceInfo";
  DeviceInfo info;
};

// Legacy pairing: accepted without a key.
struct RequestPairing {
  static constexpr const char* kTag = "RequestPairing";
  DeviceInfo info;
};

struct RequestPairingWithKey {
  static constexpr const char* kTag = "RequestPairingWithKey";
  std::string id;
  std::string name;
  std::string device_type;
  std::vector<std::string> capabilities;
  std::string pairing_key;
};

struct PairingAccepted {
  static constexpr const char* kTag = "PairingAccepted";
  DeviceId device_id;
};

struct PairingRejected {
  static constexpr const char* kTag = "PairingRejected";
  DeviceId device_id;
  std::string reason;
};

struct ClipboardSync {
  static constexpr const char* kTag = "ClipboardSync";
  std::string text;
};

struct RequestClipboard { static constexpr const char* kTag = "RequestClipboard"; };

struct FileTransferRequest {
  static constexpr const char* kTag = "FileTransferRequest";
  std::string file_name;
  uint64_t file_size = 0;
};

struct FileTransferChunk {
  static constexpr const char* kTag = "FileTransferChunk";
  std::string file_name;
  std::vector<uint8_t> chunk;
  uint64_t offset = 0;
};

struct FileTransferEnd {
  static constexpr const char* kTag = "FileTransferEnd";
  std::string file_name;
};

struct FileTransferError {
  static constexpr const char* kTag = "FileTransferError";
  std::string file_name;
  std::string error;
};

struct KeyEvent {
  static constexpr const char* kTag = "KeyEvent";
  KeyAction action = KeyAction::Press;
  KeyCode code;
};

struct MouseEvent {
  static constexpr const char* kTag = "MouseEvent";
  MouseAction action = MouseAction::Move;
  int32_t x = 0;
  int32_t y = 0;
  std::optional<MouseButton> button;
  std::optional<float> scroll_delta;
};

struct TouchpadEvent {
  static constexpr const char* kTag = "TouchpadEvent";
  float x = 0.0f;
  float y = 0.0f;
  float dx = 0.0f;
  float dy = 0.0f;
  float scroll_delta_x = 0.0f;
  float scroll_delta_y = 0.0f;
  bool is_left_click = false;
  bool is_right_click = false;
};

struct Notification {
  static constexpr const char* kTag = "Notification";
  std::string title;
  std::string body;
  std::optional<std::string> app_name;
};

struct MediaControl {
  static constexpr const char* kTag = "MediaControl";
  MediaAction action = MediaAction::PlayPause;
};

struct BatteryStatus {
  static constexpr const char* kTag = "BatteryStatus";
  float charge = 0.0f;
  bool is_charging = false;
};

struct RemoteCommand {
  static constexpr const char* kTag = "RemoteCommand";
  std::string command;
  std::vector<std::string> args;
};

struct SlideControl {
  static constexpr const char* kTag = "SlideControl";
  SlideAction action = SlideAction::NextSlide;
};

using Message = std::variant<Ping,
                             Pong,
                             DeviceInfoBroadcast,
                             RequestPairing,
                             RequestPairingWithKey,
                             PairingAccepted,
                             PairingRejected,
                             ClipboardSync,
                             RequestClipboard,
                             FileTransferRequest,
                             FileTransferChunk,
                             FileTransferEnd,
                             FileTransferError,
                             KeyEvent,
                             MouseEvent,
                             TouchpadEvent,
                             Notification,
                             MediaControl,
                             BatteryStatus,
                             RemoteCommand,
                             SlideControl>;

// ---- codec ----------------------------------------------------------------

// Externally tagged JSON: unit variants are a bare string ("Ping"), all
// others are {"Tag": payload}. Never contains a raw newline.
json message_to_json(const Message& message);
Message message_from_json(const json& doc);

std::string encode_message(const Message& message);
// Throws DecodeError on malformed, truncated or unknown input.
Message decode_message(std::string_view bytes);

// encode_message() plus the line delimiter.
std::string frame_message(const Message& message);

const char* message_type_name(const Message& message);

void to_json(json& j, const DeviceInfo& info);
void from_json(const json& j, DeviceInfo& info);

// ---- enum names -----------------------------------------------------------

std::string to_string(DeviceType value);
std::string to_string(Capability value);
std::string to_string(KeyAction value);
std::string to_string(Key value);
std::string to_string(MouseAction value);
std::string to_string(MouseButtonKind value);
std::string to_string(MediaAction value);
std::string to_string(SlideAction value);

// Case-insensitive lookups for values coming from users or lenient peers.
std::optional<DeviceType> parse_device_type(std::string_view text);
std::optional<Capability> parse_capability(std::string_view text);
std::optional<KeyAction> parse_key_action(std::string_view text);
std::optional<Key> parse_key(std::string_view text);
std::optional<MouseAction> parse_mouse_action(std::string_view text);
std::optional<MouseButtonKind> parse_mouse_button(std::string_view text);
std::optional<MediaAction> parse_media_action(std::string_view text);
std::optional<SlideAction> parse_slide_action(std::string_view text);
