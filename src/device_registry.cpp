#include "device_registry.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace {

std::vector<DeviceInfo> sorted_values(const std::unordered_map<DeviceId, DeviceInfo>& map){
    std::vector<DeviceInfo> out;
    out.reserve(map.size());
    for(const auto& entry : map) out.push_back(entry.second);
    std::sort(out.begin(), out.end(),
              [](const DeviceInfo& a, const DeviceInfo& b){ return a.id < b.id; });
    return out;
}

} // namespace

DeviceRegistry::DeviceRegistry(std::filesystem::path config_dir,
                               std::shared_ptr<Logger> logger)
    : storage_path_(std::move(config_dir) / kPairedDevicesFile),
      logger_(std::move(logger))
{
}

std::size_t DeviceRegistry::load(){
    std::lock_guard lg(m_);
    paired_.clear();

    std::error_code ec;
    if(!std::filesystem::exists(storage_path_, ec)){
        log_debug(logger_.get(), "No paired devices file at {}", storage_path_.string());
        return 0;
    }

    std::ifstream in(storage_path_);
    if(!in){
        log_warn(logger_.get(), "Unable to open {}, starting with no paired devices", storage_path_.string());
        return 0;
    }

    try {
        nlohmann::json doc;
        in >> doc;
        if(!doc.is_array()){
            log_warn(logger_.get(), "{} does not hold a device list, ignoring it", storage_path_.string());
            return 0;
        }
        for(const auto& item : doc){
            auto info = item.get<DeviceInfo>();
            paired_[info.id] = std::move(info);
        }
    } catch(const std::exception& e){
        log_warn(logger_.get(), "Failed to parse {}: {}", storage_path_.string(), e.what());
        paired_.clear();
        return 0;
    }

    log_info(logger_.get(), "Loaded {} paired device(s) from {}", paired_.size(), storage_path_.string());
    return paired_.size();
}

bool DeviceRegistry::save() const {
    std::lock_guard lg(m_);
    return write_locked();
}

bool DeviceRegistry::write_locked() const {
    std::error_code ec;
    if(storage_path_.has_parent_path()){
        std::filesystem::create_directories(storage_path_.parent_path(), ec);
        if(ec){
            log_error(logger_.get(), "Unable to create {}: {}", storage_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    nlohmann::json doc = nlohmann::json::array();
    for(const auto& info : sorted_values(paired_)) doc.push_back(info);

    auto temp = storage_path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if(!out){
            log_error(logger_.get(), "Unable to write {}", temp.string());
            return false;
        }
        out << doc.dump(2) << '\n';
        if(!out){
            log_error(logger_.get(), "Short write to {}", temp.string());
            return false;
        }
    }

    std::filesystem::rename(temp, storage_path_, ec);
    if(ec){
        log_error(logger_.get(), "Unable to replace {}: {}", storage_path_.string(), ec.message());
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

bool DeviceRegistry::upsert_paired(const DeviceInfo& info){
    std::lock_guard lg(m_);
    paired_[info.id] = info;
    log_info(logger_.get(), "Paired device {} ({})", info.id, info.name);
    return write_locked();
}

void DeviceRegistry::upsert_discovered(const DeviceInfo& info){
    std::lock_guard lg(m_);
    auto it = discovered_.find(info.id);
    if(it == discovered_.end()){
        log_info(logger_.get(), "Discovered device {} ({})", info.id, to_string(info.device_type));
    } else if(it->second == info){
        return;
    }
    discovered_[info.id] = info;
}

bool DeviceRegistry::remove_discovered(const DeviceId& id){
    std::lock_guard lg(m_);
    if(discovered_.erase(id) == 0) return false;
    log_info(logger_.get(), "Device {} left the network", id);
    return true;
}

std::optional<DeviceInfo> DeviceRegistry::find_paired(const DeviceId& id) const {
    std::lock_guard lg(m_);
    auto it = paired_.find(id);
    if(it == paired_.end()) return std::nullopt;
    return it->second;
}

std::optional<DeviceInfo> DeviceRegistry::find_discovered(const DeviceId& id) const {
    std::lock_guard lg(m_);
    auto it = discovered_.find(id);
    if(it == discovered_.end()) return std::nullopt;
    return it->second;
}

bool DeviceRegistry::is_paired(const DeviceId& id) const {
    std::lock_guard lg(m_);
    return paired_.count(id) > 0;
}

std::vector<DeviceInfo> DeviceRegistry::paired_devices() const {
    std::lock_guard lg(m_);
    return sorted_values(paired_);
}

std::vector<DeviceInfo> DeviceRegistry::discovered_devices() const {
    std::lock_guard lg(m_);
    return sorted_values(discovered_);
}

std::size_t DeviceRegistry::paired_count() const {
    std::lock_guard lg(m_);
    return paired_.size();
}

std::size_t DeviceRegistry::discovered_count() const {
    std::lock_guard lg(m_);
    return discovered_.size();
}
