#pragma once
#include <memory>
#include <optional>
#include "capability.hpp"
#include "pairing_authority.hpp"

// Pairing requests go to the PairingAuthority; everything else is offered to
// the capability handlers.
class MessageRouter {
public:
  MessageRouter(std::shared_ptr<PairingAuthority> pairing,
                std::shared_ptr<const CapabilityDispatcher> dispatcher,
                std::shared_ptr<Logger> logger = nullptr);

  std::optional<Message> route(const Message& message, const DeviceId& sender) const;
  void disconnected(const DeviceId& sender) const;

private:
  std::shared_ptr<PairingAuthority> pairing_;
  std::shared_ptr<const CapabilityDispatcher> dispatcher_;
  std::shared_ptr<Logger> logger_;
};
