#pragma once

#include "security/ikey_manager.hpp"
#include <string>

namespace anonproxy {

/**
 * @brief Environment variable key manager
 *
 * Reads a single encryption key from an environment variable.
 * The key must be hex-encoded (64 hex chars = 32 bytes = 256-bit AES key).
 * The key id is a short SHA-256 fingerprint of the key, so records sealed
 * under a different key fail to resolve instead of failing to decrypt.
 * No key rotation support.
 */
class EnvKeyManager : public IKeyManager {
public:
    explicit EnvKeyManager(const std::string& env_var_name = "ANON_PROXY_VAULT_KEY");
    ~EnvKeyManager() override;

    [[nodiscard]] std::optional<KeyInfo> get_active_key() const override;
    [[nodiscard]] std::optional<KeyInfo> get_key(const std::string& key_id) const override;
    bool rotate_key() override;
    [[nodiscard]] size_t key_count() const override;

    [[nodiscard]] bool is_valid() const { return valid_; }

    // Why the key could not be loaded (never contains key material)
    [[nodiscard]] const std::string& load_error() const { return load_error_; }

private:
    KeyInfo key_;
    bool valid_ = false;
    std::string load_error_;
};

} // namespace anonproxy
