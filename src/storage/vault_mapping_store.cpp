#include "storage/vault_mapping_store.hpp"
#include "core/json.hpp"
#include "core/mapping_codec.hpp"
#include "core/utils.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <mutex>

namespace anonproxy {

namespace {

constexpr const char* kJsonContentType = "application/json";

std::string trim_slashes(std::string_view s) {
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return std::string(s);
}

bool is_unavailable_status(int status) {
    return status == 403 || status >= 500;
}

} // anonymous namespace

VaultMappingStore::VaultMappingStore(VaultStoreConfig config,
                                     std::shared_ptr<IKeyManager> key_manager,
                                     bool enable_logging)
    : config_(std::move(config)),
      encryptor_(std::move(key_manager)),
      enable_logging_(enable_logging) {
    config_.mount = trim_slashes(config_.mount);
    config_.path_prefix = trim_slashes(config_.path_prefix);
    while (!config_.address.empty() && config_.address.back() == '/') {
        config_.address.pop_back();
    }
}

VaultMappingStore::~VaultMappingStore() {
    dispose();
}

// ============================================================================
// Paths / transport
// ============================================================================

std::string VaultMappingStore::data_path(const std::string& map_id) const {
    if (config_.path_prefix.empty()) {
        return std::format("/v1/{}/data/{}", config_.mount, map_id);
    }
    return std::format("/v1/{}/data/{}/{}", config_.mount, config_.path_prefix, map_id);
}

std::string VaultMappingStore::metadata_path(const std::string& map_id) const {
    if (config_.path_prefix.empty()) {
        return std::format("/v1/{}/metadata/{}", config_.mount, map_id);
    }
    return std::format("/v1/{}/metadata/{}/{}", config_.mount, config_.path_prefix, map_id);
}

Result<VaultMappingStore::HttpReply> VaultMappingStore::request(
    Method method, const std::string& path, const std::string& body) const {

    httplib::Client cli(config_.address);
    if (!cli.is_valid()) {
        return Result<HttpReply>::error(ErrorCategory::BACKEND_UNAVAILABLE,
            "vault: invalid address");
    }
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);
    cli.enable_server_certificate_verification(config_.verify_tls);

    const httplib::Headers headers = {
        {"X-Vault-Token", config_.token}
    };

    auto res = [&]() {
        switch (method) {
            case Method::Post:
                return cli.Post(path, headers, body, kJsonContentType);
            case Method::Delete:
                return cli.Delete(path, headers);
            case Method::Get:
                break;
        }
        return cli.Get(path, headers);
    }();

    if (!res) {
        const auto msg = std::format("vault: transport error ({})", httplib::to_string(res.error()));
        log_error(msg);
        return Result<HttpReply>::error(ErrorCategory::BACKEND_UNAVAILABLE, msg);
    }

    HttpReply reply;
    reply.status = res->status;
    reply.body = std::move(res->body);
    return Result<HttpReply>::ok(std::move(reply));
}

void VaultMappingStore::log_error(const std::string& msg) const {
    if (enable_logging_) {
        utils::log::error(msg);
    }
}

// ============================================================================
// IMappingStore
// ============================================================================

Result<std::string> VaultMappingStore::create(Mapping& mapping) {
    std::shared_lock lock(lifecycle_mutex_);
    if (disposed_) {
        return Result<std::string>::error(ErrorCategory::LIFECYCLE_ERROR, "mapping store disposed");
    }

    const int64_t created_ms = utils::to_epoch_ms(mapping.created_at);
    const int64_t expires_ms = config_.ttl_seconds == 0
        ? 0
        : utils::to_epoch_ms(utils::now()) + static_cast<int64_t>(config_.ttl_seconds) * 1000;

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        const std::string id = generate_map_id();
        mapping.map_id = id;

        std::string encoded = codec::encode_canonical(mapping);
        const auto sealed = encryptor_.encrypt(encoded, id);
        utils::secure_zero(encoded);
        if (!sealed) {
            mapping.map_id.clear();
            return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                "vault: mapping encryption failed");
        }

        const std::string body = std::format(
            R"({{"options":{{"cas":0}},"data":{{"payload":"{}","created_at":{},"expires_at":{}}}}})",
            utils::escape_json(*sealed), created_ms, expires_ms);

        auto reply = request(Method::Post, data_path(id), body);
        if (reply.is_error()) {
            mapping.map_id.clear();
            return Result<std::string>::error_from(reply);
        }

        const int status = reply.value().status;
        if (status == 200 || status == 204) {
            return Result<std::string>::ok(id);
        }
        if (status == 400 && reply.value().body.find("check-and-set") != std::string::npos) {
            // Id already taken; never overwrite
            continue;
        }

        mapping.map_id.clear();
        const auto msg = std::format("vault: create failed with HTTP {}", status);
        log_error(msg);
        return Result<std::string>::error(
            is_unavailable_status(status) ? ErrorCategory::BACKEND_UNAVAILABLE
                                          : ErrorCategory::INTERNAL_ERROR,
            msg);
    }

    mapping.map_id.clear();
    return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
        std::format("vault: no unused map id after {} attempts", kMaxIdAttempts));
}

Result<Mapping> VaultMappingStore::get(const std::string& map_id) const {
    std::shared_lock lock(lifecycle_mutex_);
    if (disposed_) {
        return Result<Mapping>::error(ErrorCategory::LIFECYCLE_ERROR, "mapping store disposed");
    }
    // Ids become URL path segments
    if (!is_valid_map_id(map_id)) {
        return Result<Mapping>::error(ErrorCategory::MAPPING_NOT_FOUND,
            "mapping not found (malformed id)");
    }

    auto reply = request(Method::Get, data_path(map_id));
    if (reply.is_error()) {
        return Result<Mapping>::error_from(reply);
    }

    const int status = reply.value().status;
    if (status == 404) {
        return Result<Mapping>::error(ErrorCategory::MAPPING_NOT_FOUND,
            std::format("mapping '{}' not found", map_id));
    }
    if (status != 200) {
        const auto msg = std::format("vault: read failed with HTTP {}", status);
        log_error(msg);
        return Result<Mapping>::error(
            is_unavailable_status(status) ? ErrorCategory::BACKEND_UNAVAILABLE
                                          : ErrorCategory::INTERNAL_ERROR,
            msg);
    }

    JsonValue doc;
    try {
        doc = JsonValue::parse(reply.value().body);
    } catch (const JsonValue::parse_error&) {
        return Result<Mapping>::error(ErrorCategory::INTERNAL_ERROR,
            "vault: malformed response");
    }
    utils::secure_zero(reply.value().body);

    const auto data = doc["data"]["data"];
    const auto payload = data.value<std::string>("payload", "");
    const auto expires_ms = data.value<int64_t>("expires_at", 0);
    if (payload.empty()) {
        return Result<Mapping>::error(ErrorCategory::INTERNAL_ERROR,
            "vault: stored document has no payload");
    }

    if (expires_ms != 0 && expires_ms <= utils::to_epoch_ms(utils::now())) {
        const auto removed = remove_locked(map_id);
        if (removed.is_error()) {
            log_error(std::format("vault: could not delete expired mapping '{}'", map_id));
        }
        return Result<Mapping>::error(ErrorCategory::MAPPING_NOT_FOUND,
            std::format("mapping '{}' expired", map_id));
    }

    auto plaintext = encryptor_.decrypt(payload, map_id);
    if (!plaintext) {
        return Result<Mapping>::error(ErrorCategory::INTERNAL_ERROR,
            "vault: stored mapping could not be decrypted");
    }

    auto mapping = codec::decode_canonical(*plaintext);
    utils::secure_zero(*plaintext);
    if (!mapping || mapping->map_id != map_id) {
        if (mapping) mapping->scrub();
        return Result<Mapping>::error(ErrorCategory::INTERNAL_ERROR,
            "vault: stored mapping is corrupt");
    }
    return Result<Mapping>::ok(std::move(*mapping));
}

Result<bool> VaultMappingStore::remove(const std::string& map_id) {
    std::shared_lock lock(lifecycle_mutex_);
    if (disposed_) {
        return Result<bool>::error(ErrorCategory::LIFECYCLE_ERROR, "mapping store disposed");
    }
    if (!is_valid_map_id(map_id)) {
        return Result<bool>::ok(false);
    }
    return remove_locked(map_id);
}

Result<bool> VaultMappingStore::remove_locked(const std::string& map_id) const {
    auto reply = request(Method::Delete, metadata_path(map_id));
    if (reply.is_error()) {
        return Result<bool>::error_from(reply);
    }

    const int status = reply.value().status;
    if (status == 200 || status == 204) {
        return Result<bool>::ok(true);
    }
    if (status == 404) {
        return Result<bool>::ok(false);
    }

    const auto msg = std::format("vault: delete failed with HTTP {}", status);
    log_error(msg);
    return Result<bool>::error(
        is_unavailable_status(status) ? ErrorCategory::BACKEND_UNAVAILABLE
                                      : ErrorCategory::INTERNAL_ERROR,
        msg);
}

bool VaultMappingStore::is_healthy() const {
    std::shared_lock lock(lifecycle_mutex_);
    if (disposed_ || !encryptor_.has_key()) return false;

    const auto reply = request(Method::Get, "/v1/sys/health");
    return reply.is_ok() && reply.value().status == 200;
}

void VaultMappingStore::dispose() {
    std::unique_lock lock(lifecycle_mutex_);
    if (disposed_) return;
    utils::secure_zero(config_.token);
    disposed_ = true;
}

} // namespace anonproxy
