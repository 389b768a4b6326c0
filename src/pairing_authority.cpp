#include "pairing_authority.hpp"
#include "utils.hpp"

PairingAuthority::PairingAuthority(std::shared_ptr<DeviceRegistry> registry,
                                   std::shared_ptr<Logger> logger,
                                   CodeGenerator generator)
    : registry_(std::move(registry)),
      logger_(std::move(logger)),
      generator_(generator ? std::move(generator) : CodeGenerator(generate_pairing_code))
{
    std::lock_guard lg(m_);
    code_ = next_code_locked();
}

std::string PairingAuthority::next_code_locked(){
    auto code = generator_();
    log_info(logger_.get(), "Pairing code: {}", code);
    return code;
}

std::string PairingAuthority::current_code() const {
    std::lock_guard lg(m_);
    return code_;
}

std::string PairingAuthority::rotate_code(){
    std::lock_guard lg(m_);
    code_ = next_code_locked();
    return code_;
}

void PairingAuthority::set_allow_legacy(bool allow){
    std::lock_guard lg(m_);
    allow_legacy_ = allow;
}

bool PairingAuthority::allow_legacy() const {
    std::lock_guard lg(m_);
    return allow_legacy_;
}

DeviceInfo PairingAuthority::device_from_request(const RequestPairingWithKey& request){
    DeviceInfo info;
    info.id = request.id;
    info.name = request.name;
    info.device_type = parse_device_type(request.device_type).value_or(DeviceType::Mobile);
    for(const auto& name : request.capabilities){
        if(auto cap = parse_capability(name)) info.capabilities.insert(*cap);
    }
    return info;
}

Message PairingAuthority::handle_legacy(const RequestPairing& request){
    if(!allow_legacy()){
        log_warn(logger_.get(), "Refused legacy pairing from {} ({})", request.info.id, request.info.name);
        return PairingRejected{request.info.id, kLegacyDisabledReason};
    }
    log_warn(logger_.get(), "Accepting legacy pairing without key from {} ({})",
             request.info.id, request.info.name);
    if(!registry_->upsert_paired(request.info)){
        log_warn(logger_.get(), "{} is paired for this run only", request.info.id);
    }
    return PairingAccepted{request.info.id};
}

Message PairingAuthority::handle_keyed(const RequestPairingWithKey& request){
    DeviceInfo info = device_from_request(request);
    {
        std::lock_guard lg(m_);
        if(request.pairing_key != code_){
            log_warn(logger_.get(), "Rejected pairing from {} ({}): wrong key", request.id, request.name);
            return PairingRejected{request.id, kInvalidKeyReason};
        }
        code_ = next_code_locked();
    }
    if(!registry_->upsert_paired(info)){
        log_warn(logger_.get(), "{} is paired for this run only", info.id);
    }
    log_info(logger_.get(), "Device {} ({}) paired with key", info.id, info.name);
    return PairingAccepted{request.id};
}
