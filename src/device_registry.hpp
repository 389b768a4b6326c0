#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol.hpp"
#include "log.hpp"

// Paired devices (persisted as a JSON array in paired_devices.json) and the
// devices currently seen on the local network. The two sets are independent:
// discovery never touches the paired set or the file.
class DeviceRegistry {
public:
    static constexpr const char* kPairedDevicesFile = "paired_devices.json";

    explicit DeviceRegistry(std::filesystem::path config_dir,
                            std::shared_ptr<Logger> logger = nullptr);

    // Reads the paired set from disk. A missing file leaves the set empty and
    // is not an error; an unreadable or malformed file is logged and the set
    // starts empty. Returns the number of devices loaded.
    std::size_t load();

    // Rewrites the whole file through a temporary and a rename.
    bool save() const;

    // Replaces any previous entry for info.id and persists. Returns false
    // when the file could not be written (the in-memory entry is kept).
    bool upsert_paired(const DeviceInfo& info);

    void upsert_discovered(const DeviceInfo& info);
    bool remove_discovered(const DeviceId& id);

    std::optional<DeviceInfo> find_paired(const DeviceId& id) const;
    std::optional<DeviceInfo> find_discovered(const DeviceId& id) const;
    bool is_paired(const DeviceId& id) const;

    std::vector<DeviceInfo> paired_devices() const;
    std::vector<DeviceInfo> discovered_devices() const;
    std::size_t paired_count() const;
    std::size_t discovered_count() const;

    std::filesystem::path storage_path() const { return storage_path_; }

private:
    bool write_locked() const;

    std::filesystem::path storage_path_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex m_;
    std::unordered_map<DeviceId, DeviceInfo> paired_;
    std::unordered_map<DeviceId, DeviceInfo> discovered_;
};
