#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace anonproxy {

/**
 * @brief HMAC-SHA256 signer binding a mapping to its identifier
 *
 * Message: u32 big-endian len(map_id) | map_id | canonical encoding.
 * Signatures are transported as standard base64 (44 chars).
 * The secret is cleansed on destruction.
 */
class Signer {
public:
    /**
     * @throws std::invalid_argument if secret is empty
     */
    explicit Signer(std::string secret);
    ~Signer();

    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;

    /**
     * @brief Sign a canonical mapping encoding
     * @throws std::runtime_error if HMAC fails
     */
    [[nodiscard]] std::string sign(std::string_view map_id, std::string_view canonical) const;

    /**
     * @brief Constant-time verification
     * @return false on malformed base64, wrong length or mismatch
     */
    [[nodiscard]] bool verify(std::string_view map_id, std::string_view canonical,
                              std::string_view signature) const;

    // Sign / verify the canonical encoding of a whole mapping
    [[nodiscard]] std::string sign(const Mapping& mapping) const;
    [[nodiscard]] bool verify(const Mapping& mapping, std::string_view signature) const;

private:
    [[nodiscard]] bool compute(std::string_view map_id, std::string_view canonical,
                               unsigned char* out, unsigned int& out_len) const;

    std::string secret_;
};

} // namespace anonproxy
