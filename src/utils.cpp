#include "utils.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <unistd.h>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
constexpr uint32_t kCodeMin = 100000;
constexpr uint32_t kCodeSpan = 900000;

std::filesystem::path home_dir(){
    const char* home = std::getenv("HOME");
    if(home && *home) return home;
    return std::filesystem::temp_directory_path();
}

std::filesystem::path env_path(const char* name){
    const char* value = std::getenv(name);
    if(value && *value) return value;
    return {};
}
} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count == 0) return out;
    if(RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        char reason[256] = {0};
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
    return out;
}

std::string generate_pairing_code(){
    // Rejection sampling keeps the distribution uniform over the span.
    const uint32_t limit = UINT32_MAX - (UINT32_MAX % kCodeSpan);
    for(;;){
        auto bytes = random_bytes(sizeof(uint32_t));
        uint32_t value = 0;
        for(auto b: bytes) value = (value << 8) | b;
        if(value >= limit) continue;
        return std::to_string(kCodeMin + value % kCodeSpan);
    }
}

std::string local_hostname(){
    char buf[HOST_NAME_MAX + 1] = {0};
    if(gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "localhost";
    return buf;
}

std::string local_device_id(const std::string &device_name){
    return sha256_hex("libreconnect:" + device_name).substr(0, 16);
}

std::filesystem::path default_config_dir(){
    auto base = env_path("XDG_CONFIG_HOME");
    if(base.empty()) base = home_dir() / ".config";
    return base / "libreconnect";
}

std::filesystem::path default_download_dir(){
    auto base = env_path("XDG_DOWNLOAD_DIR");
    if(base.empty()) base = home_dir() / "Downloads";
    return base / "LibreConnect";
}
