#pragma once

#include "config/config_types.hpp"
#include "storage/mapping_encryptor.hpp"
#include "storage/mapping_store.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>

namespace anonproxy {

/**
 * @brief Durable mapping store on HashiCorp Vault KV v2
 *
 * Each mapping is one secret at <mount>/data/<path_prefix>/<map_id>:
 *   {"payload": "MENC:v1:...", "created_at": <ms>, "expires_at": <ms>}
 * The payload is the canonical mapping encoding sealed by MappingEncryptor
 * (mapId as AAD). create() writes with cas=0, so an existing id is never
 * overwritten; a conflict regenerates the id.
 *
 * Transport errors, timeouts, 403 and 5xx map to BACKEND_UNAVAILABLE.
 * One HTTP client per request, so concurrent calls share nothing mutable.
 */
class VaultMappingStore : public IMappingStore {
public:
    VaultMappingStore(VaultStoreConfig config,
                      std::shared_ptr<IKeyManager> key_manager,
                      bool enable_logging = false);
    ~VaultMappingStore() override;

    [[nodiscard]] Result<std::string> create(Mapping& mapping) override;
    [[nodiscard]] Result<Mapping> get(const std::string& map_id) const override;
    Result<bool> remove(const std::string& map_id) override;
    [[nodiscard]] bool is_healthy() const override;
    void dispose() override;
    [[nodiscard]] const char* backend_name() const override { return "vault"; }

    [[nodiscard]] std::string data_path(const std::string& map_id) const;
    [[nodiscard]] std::string metadata_path(const std::string& map_id) const;

    [[nodiscard]] const MappingEncryptor& encryptor() const { return encryptor_; }

private:
    enum class Method { Get, Post, Delete };

    struct HttpReply {
        int status = 0;
        std::string body;
    };

    // BACKEND_UNAVAILABLE on transport failure; any HTTP status is a value
    [[nodiscard]] Result<HttpReply> request(Method method, const std::string& path,
                                            const std::string& body = {}) const;

    // Caller holds lifecycle_mutex_ (shared)
    Result<bool> remove_locked(const std::string& map_id) const;

    void log_error(const std::string& msg) const;

    VaultStoreConfig config_;
    MappingEncryptor encryptor_;
    bool enable_logging_;

    mutable std::shared_mutex lifecycle_mutex_;
    bool disposed_ = false;
};

} // namespace anonproxy
