#include "security/signer.hpp"
#include "core/base64.hpp"
#include "core/mapping_codec.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace anonproxy {

Signer::Signer(std::string secret) : secret_(std::move(secret)) {
    if (secret_.empty()) {
        throw std::invalid_argument("signature secret must not be empty");
    }
}

Signer::~Signer() {
    utils::secure_zero(secret_);
}

bool Signer::compute(std::string_view map_id, std::string_view canonical,
                     unsigned char* out, unsigned int& out_len) const {
    const auto id_len = static_cast<uint32_t>(map_id.size());

    std::string message;
    message.reserve(4 + map_id.size() + canonical.size());
    message += static_cast<char>((id_len >> 24) & 0xFF);
    message += static_cast<char>((id_len >> 16) & 0xFF);
    message += static_cast<char>((id_len >> 8) & 0xFF);
    message += static_cast<char>(id_len & 0xFF);
    message.append(map_id);
    message.append(canonical);

    const auto* ok = HMAC(EVP_sha256(),
                          secret_.data(), static_cast<int>(secret_.size()),
                          reinterpret_cast<const unsigned char*>(message.data()),
                          message.size(),
                          out, &out_len);
    utils::secure_zero(message);
    return ok != nullptr;
}

std::string Signer::sign(std::string_view map_id, std::string_view canonical) const {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!compute(map_id, canonical, mac, mac_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return base64::encode(mac, mac_len);
}

bool Signer::verify(std::string_view map_id, std::string_view canonical,
                    std::string_view signature) const {
    const auto expected = base64::decode(signature);
    if (!expected || expected->empty()) return false;

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!compute(map_id, canonical, mac, mac_len)) return false;

    if (mac_len != expected->size()) return false;
    return CRYPTO_memcmp(mac, expected->data(), mac_len) == 0;
}

std::string Signer::sign(const Mapping& mapping) const {
    std::string encoded = codec::encode_canonical(mapping);
    auto sig = sign(mapping.map_id, encoded);
    utils::secure_zero(encoded);
    return sig;
}

bool Signer::verify(const Mapping& mapping, std::string_view signature) const {
    std::string encoded = codec::encode_canonical(mapping);
    const bool ok = verify(mapping.map_id, encoded, signature);
    utils::secure_zero(encoded);
    return ok;
}

} // namespace anonproxy
