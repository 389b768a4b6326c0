#include "message_router.hpp"

MessageRouter::MessageRouter(std::shared_ptr<PairingAuthority> pairing,
                             std::shared_ptr<const CapabilityDispatcher> dispatcher,
                             std::shared_ptr<Logger> logger)
  : pairing_(std::move(pairing)),
    dispatcher_(std::move(dispatcher)),
    logger_(std::move(logger)) {}

std::optional<Message> MessageRouter::route(const Message& message, const DeviceId& sender) const {
  log_debug(logger_.get(), "{} from {}", message_type_name(message), sender);
  if(auto* legacy = std::get_if<RequestPairing>(&message)){
    return pairing_->handle_legacy(*legacy);
  }
  if(auto* keyed = std::get_if<RequestPairingWithKey>(&message)){
    return pairing_->handle_keyed(*keyed);
  }
  return dispatcher_->dispatch(message, sender);
}

void MessageRouter::disconnected(const DeviceId& sender) const {
  dispatcher_->forget(sender);
}
