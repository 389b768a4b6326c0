#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "log.hpp"
#include "protocol.hpp"

// One unit of daemon functionality. handle() returns a reply, or nothing
// when the message is not for this handler or needs no answer. Failures are
// reported by throwing.
class CapabilityHandler {
public:
  virtual ~CapabilityHandler() = default;
  virtual std::string name() const = 0;
  virtual std::optional<Message> handle(const Message& message, const DeviceId& sender) = 0;
  // The connection for sender has closed; drop anything kept for it.
  virtual void forget(const DeviceId&) {}
};

// Ordered handler list; the first handler that returns a reply wins.
class CapabilityDispatcher {
public:
  explicit CapabilityDispatcher(std::shared_ptr<Logger> logger = nullptr);

  // Throws std::logic_error once freeze() has been called.
  void add(std::unique_ptr<CapabilityHandler> handler);
  void freeze();
  bool frozen() const { return frozen_.load(); }

  std::optional<Message> dispatch(const Message& message, const DeviceId& sender) const;
  void forget(const DeviceId& sender) const;

  std::vector<std::string> handler_names() const;
  std::size_t size() const { return handlers_.size(); }

  template<typename T>
  T* find() const {
    for(const auto& handler : handlers_) {
      if(auto* typed = dynamic_cast<T*>(handler.get())) return typed;
    }
    return nullptr;
  }

private:
  std::shared_ptr<Logger> logger_;
  std::vector<std::unique_ptr<CapabilityHandler>> handlers_;
  std::atomic<bool> frozen_{false};
};
