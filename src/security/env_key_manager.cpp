#include "security/env_key_manager.hpp"
#include "core/utils.hpp"

#include <openssl/sha.h>

#include <cstdlib>
#include <format>

namespace anonproxy {

namespace {
constexpr size_t kKeyLen = 32;
} // anonymous namespace

EnvKeyManager::EnvKeyManager(const std::string& env_var_name) {
    const char* hex_key = std::getenv(env_var_name.c_str());
    if (!hex_key || std::string_view(hex_key).empty()) {
        load_error_ = std::format("environment variable '{}' not set", env_var_name);
        return;
    }

    std::string hex(hex_key);
    key_.key_bytes = utils::hex_to_bytes(hex);
    utils::secure_zero(hex);

    if (key_.key_bytes.empty()) {
        load_error_ = std::format("'{}' must be hex-encoded", env_var_name);
        return;
    }
    if (key_.key_bytes.size() != kKeyLen) {
        load_error_ = std::format("'{}' holds {} bytes (expected {} for AES-256)",
            env_var_name, key_.key_bytes.size(), kKeyLen);
        utils::secure_zero(key_.key_bytes);
        return;
    }

    unsigned char fingerprint[SHA256_DIGEST_LENGTH];
    SHA256(key_.key_bytes.data(), key_.key_bytes.size(), fingerprint);

    key_.key_id = "env-" + utils::bytes_to_hex(fingerprint, 4);
    key_.created_at = std::chrono::system_clock::now();
    key_.active = true;
    valid_ = true;
}

EnvKeyManager::~EnvKeyManager() {
    utils::secure_zero(key_.key_bytes);
}

std::optional<IKeyManager::KeyInfo> EnvKeyManager::get_active_key() const {
    if (!valid_) return std::nullopt;
    return key_;
}

std::optional<IKeyManager::KeyInfo> EnvKeyManager::get_key(const std::string& key_id) const {
    if (!valid_ || key_id != key_.key_id) return std::nullopt;
    return key_;
}

bool EnvKeyManager::rotate_key() {
    // Env-based keys don't support rotation
    return false;
}

size_t EnvKeyManager::key_count() const {
    return valid_ ? 1 : 0;
}

} // namespace anonproxy
