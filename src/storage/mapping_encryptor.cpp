#include "storage/mapping_encryptor.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <vector>

namespace anonproxy {

namespace {
constexpr int kIvLen = 12;
constexpr int kTagLen = 16;
constexpr size_t kKeyLen = 32;
constexpr std::string_view kPrefix = "MENC:v1:";

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
} // anonymous namespace

MappingEncryptor::MappingEncryptor(std::shared_ptr<IKeyManager> key_manager)
    : key_manager_(std::move(key_manager)) {}

bool MappingEncryptor::has_key() const {
    if (!key_manager_) return false;
    const auto key_info = key_manager_->get_active_key();
    return key_info && key_info->key_bytes.size() == kKeyLen;
}

std::optional<std::string> MappingEncryptor::encrypt(std::string_view plaintext,
                                                     std::string_view aad) const {
    if (!key_manager_) {
        encryption_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto key_info = key_manager_->get_active_key();
    if (!key_info || key_info->key_bytes.size() != kKeyLen) {
        encryption_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    // Generate random IV
    uint8_t iv[kIvLen];
    if (RAND_bytes(iv, kIvLen) != 1) {
        utils::secure_zero(key_info->key_bytes);
        encryption_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        utils::secure_zero(key_info->key_bytes);
        encryption_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    uint8_t tag[kTagLen];
    int len = 0;
    int ciphertext_len = 0;

    bool ok =
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_info->key_bytes.data(), iv) == 1 &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len,
            reinterpret_cast<const uint8_t*>(aad.data()), static_cast<int>(aad.size())) == 1 &&
        EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
            reinterpret_cast<const uint8_t*>(plaintext.data()),
            static_cast<int>(plaintext.size())) == 1;
    if (ok) {
        ciphertext_len = len;
        ok = EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + len, &len) == 1;
    }
    if (ok) {
        ciphertext_len += len;
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen, tag) == 1;
    }
    utils::secure_zero(key_info->key_bytes);

    if (!ok) {
        encryption_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + ciphertext_len + kTagLen);
    packed.insert(packed.end(), iv, iv + kIvLen);
    packed.insert(packed.end(), ciphertext.begin(), ciphertext.begin() + ciphertext_len);
    packed.insert(packed.end(), tag, tag + kTagLen);

    // Format: MENC:v1:<key_id>:<base64(packed)>
    std::string result;
    result.reserve(kPrefix.size() + key_info->key_id.size() + 1 +
                   4 * ((packed.size() + 2) / 3));
    result += kPrefix;
    result += key_info->key_id;
    result += ':';
    result += base64::encode(packed.data(), packed.size());

    records_encrypted_.fetch_add(1, std::memory_order_relaxed);
    return result;
}

std::optional<std::string> MappingEncryptor::decrypt(std::string_view sealed,
                                                     std::string_view aad) const {
    auto fail = [this]() -> std::optional<std::string> {
        decryption_failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    };

    // Check format: MENC:v1:<key_id>:<base64>
    if (!key_manager_ || !sealed.starts_with(kPrefix)) {
        return fail();
    }

    const auto rest = sealed.substr(kPrefix.size());
    const size_t colon = rest.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return fail();
    }

    const std::string key_id(rest.substr(0, colon));
    auto key_info = key_manager_->get_key(key_id);
    if (!key_info || key_info->key_bytes.size() != kKeyLen) {
        return fail();
    }

    const auto packed = base64::decode(rest.substr(colon + 1));
    if (!packed || packed->size() < static_cast<size_t>(kIvLen + kTagLen)) {
        utils::secure_zero(key_info->key_bytes);
        return fail();
    }

    const uint8_t* iv = packed->data();
    const size_t ct_len = packed->size() - kIvLen - kTagLen;
    const uint8_t* ct = packed->data() + kIvLen;
    const uint8_t* tag_ptr = packed->data() + kIvLen + ct_len;

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        utils::secure_zero(key_info->key_bytes);
        return fail();
    }

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    bool ok =
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_info->key_bytes.data(), iv) == 1 &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len,
            reinterpret_cast<const uint8_t*>(aad.data()), static_cast<int>(aad.size())) == 1 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct, static_cast<int>(ct_len)) == 1;
    if (ok) {
        plaintext_len = len;
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen,
                const_cast<uint8_t*>(tag_ptr)) == 1 &&
             EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) > 0;
    }
    utils::secure_zero(key_info->key_bytes);

    if (!ok) {
        // Authentication failed
        utils::secure_zero(plaintext);
        return fail();
    }
    plaintext_len += len;

    std::string result(reinterpret_cast<const char*>(plaintext.data()), plaintext_len);
    utils::secure_zero(plaintext);
    return result;
}

} // namespace anonproxy
