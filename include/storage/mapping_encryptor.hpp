#pragma once

#include "security/ikey_manager.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace anonproxy {

/**
 * @brief Encrypts serialized mappings at rest using AES-256-GCM
 *
 * Each record is independently encrypted with a random IV; the mapId is
 * bound as additional authenticated data, so a record copied under another
 * id fails to open.
 * Format: MENC:v1:<key_id>:<base64(iv + ciphertext + tag)>
 */
class MappingEncryptor {
public:
    explicit MappingEncryptor(std::shared_ptr<IKeyManager> key_manager);

    /// nullopt if no usable key or the cipher fails
    [[nodiscard]] std::optional<std::string> encrypt(std::string_view plaintext,
                                                     std::string_view aad) const;

    /// nullopt on bad format, unknown key id or authentication failure
    [[nodiscard]] std::optional<std::string> decrypt(std::string_view sealed,
                                                     std::string_view aad) const;

    [[nodiscard]] bool has_key() const;

    struct Stats {
        uint64_t records_encrypted;
        uint64_t encryption_failures;
        uint64_t decryption_failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .records_encrypted = records_encrypted_.load(std::memory_order_relaxed),
            .encryption_failures = encryption_failures_.load(std::memory_order_relaxed),
            .decryption_failures = decryption_failures_.load(std::memory_order_relaxed),
        };
    }

private:
    std::shared_ptr<IKeyManager> key_manager_;
    mutable std::atomic<uint64_t> records_encrypted_{0};
    mutable std::atomic<uint64_t> encryption_failures_{0};
    mutable std::atomic<uint64_t> decryption_failures_{0};
};

} // namespace anonproxy
