#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  DiscoveryInit,
  DiscoveryRegister,
  DiscoveryBrowse,
  ListenerBind,
  Network,
  Timeout,
  MessageTooLarge,
  MessageDecode,
  RegistryLock,
  CapabilityHandler,
  Configuration
};

inline const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::DiscoveryInit:     return "discovery initialization failed";
    case ErrorKind::DiscoveryRegister: return "discovery registration failed";
    case ErrorKind::DiscoveryBrowse:   return "discovery browsing failed";
    case ErrorKind::ListenerBind:      return "listener bind failed";
    case ErrorKind::Network:           return "network error";
    case ErrorKind::Timeout:           return "operation timeout";
    case ErrorKind::MessageTooLarge:   return "message too large";
    case ErrorKind::MessageDecode:     return "message decode failed";
    case ErrorKind::RegistryLock:      return "registry lock failed";
    case ErrorKind::CapabilityHandler: return "capability handler failed";
    case ErrorKind::Configuration:     return "configuration error";
  }
  return "error";
}

class DaemonError : public std::runtime_error {
public:
  DaemonError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + detail),
      kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};
