#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "device_registry.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Owns the single live pairing code and turns pairing requests into registry
// updates. The compare-and-rotate step for keyed requests runs under one
// lock, so a code is accepted at most once.
class PairingAuthority {
public:
    using CodeGenerator = std::function<std::string()>;

    static constexpr const char* kInvalidKeyReason = "Invalid pairing key";
    static constexpr const char* kLegacyDisabledReason = "Legacy pairing disabled";

    PairingAuthority(std::shared_ptr<DeviceRegistry> registry,
                     std::shared_ptr<Logger> logger = nullptr,
                     CodeGenerator generator = nullptr);

    std::string current_code() const;
    // Replaces the live code and returns the new one.
    std::string rotate_code();

    void set_allow_legacy(bool allow);
    bool allow_legacy() const;

    Message handle_legacy(const RequestPairing& request);
    Message handle_keyed(const RequestPairingWithKey& request);

    // Builds a DeviceInfo from the loosely typed keyed request: device_type
    // is matched case-insensitively and defaults to Mobile, unknown
    // capability names are dropped.
    static DeviceInfo device_from_request(const RequestPairingWithKey& request);

private:
    std::string next_code_locked();

    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<Logger> logger_;
    CodeGenerator generator_;

    mutable std::mutex m_;
    std::string code_;
    bool allow_legacy_ = true;
};
