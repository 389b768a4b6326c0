#include "capability.hpp"
#include <stdexcept>
#include "errors.hpp"

CapabilityDispatcher::CapabilityDispatcher(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void CapabilityDispatcher::add(std::unique_ptr<CapabilityHandler> handler) {
  if(!handler) return;
  if(frozen_.load()) {
    throw std::logic_error("capability handler '" + handler->name() + "' registered after start");
  }
  log_debug(logger_.get(), "Registered capability handler {}", handler->name());
  handlers_.push_back(std::move(handler));
}

void CapabilityDispatcher::freeze() {
  frozen_.store(true);
}

std::optional<Message> CapabilityDispatcher::dispatch(const Message& message, const DeviceId& sender) const {
  for(const auto& handler : handlers_) {
    try {
      if(auto reply = handler->handle(message, sender)) {
        log_debug(logger_.get(), "{} answered {} from {} with {}",
                  handler->name(), message_type_name(message), sender, message_type_name(*reply));
        return reply;
      }
    } catch(const std::exception& e) {
      log_error(logger_.get(), "{} in '{}' for {} from {}: {}",
                error_kind_name(ErrorKind::CapabilityHandler), handler->name(),
                message_type_name(message), sender, e.what());
    }
  }
  log_debug(logger_.get(), "No reply for {} from {}", message_type_name(message), sender);
  return std::nullopt;
}

void CapabilityDispatcher::forget(const DeviceId& sender) const {
  for(const auto& handler : handlers_) {
    try {
      handler->forget(sender);
    } catch(const std::exception& e) {
      log_error(logger_.get(), "{} in '{}' forgetting {}: {}",
                error_kind_name(ErrorKind::CapabilityHandler), handler->name(), sender, e.what());
    }
  }
}

std::vector<std::string> CapabilityDispatcher::handler_names() const {
  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for(const auto& handler : handlers_) names.push_back(handler->name());
  return names;
}
