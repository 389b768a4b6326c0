#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Cryptographically random bytes from OpenSSL. Throws std::runtime_error when
// the generator is not seeded.
std::vector<unsigned char> random_bytes(std::size_t count);

// Uniform six digit code in [100000, 999999].
std::string generate_pairing_code();

std::string local_hostname();

// Stable identifier for this host, derived from the device name.
std::string local_device_id(const std::string &device_name);

// $XDG_CONFIG_HOME/libreconnect, falling back to ~/.config/libreconnect.
std::filesystem::path default_config_dir();
// $XDG_DOWNLOAD_DIR/LibreConnect, falling back to ~/Downloads/LibreConnect.
std::filesystem::path default_download_dir();
