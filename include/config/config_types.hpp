#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace anonproxy {

// ============================================================================
// Configuration Types
// ============================================================================

struct CustomRuleConfig {
    std::string name;
    std::string pattern;              // ECMAScript regex; whole match is the value
    std::string category;             // credential | connection_string | email | ...
};

struct DetectorConfig {
    size_t min_length = 8;            // Shorter matches are ignored
    std::vector<std::string> exclusions = {
        "localhost", "127.0.0.1", "example.com", "test@example.com"
    };
    std::vector<std::string> disabled_rules;
    std::vector<CustomRuleConfig> custom_rules;
    bool case_sensitive = false;
};

struct MemoryStoreConfig {
    size_t max_entries = 10000;       // Oldest mapping evicted when full
    uint32_t ttl_seconds = 3600;      // 0 = never expire
};

struct VaultStoreConfig {
    std::string address;              // e.g. "https://vault.internal:8200"
    std::string token;                // Or from VAULT_TOKEN env
    std::string mount = "secret";     // KV v2 mount
    std::string path_prefix = "anon-proxy-mappings";
    int timeout_ms = 5000;            // Connect/read/write timeout per request
    bool verify_tls = true;
    uint32_t ttl_seconds = 86400;     // 0 = never expire

    // At-rest encryption key (independent of the signature secret)
    std::string key_provider = "env"; // env | file
    std::string key_env_var = "ANON_PROXY_VAULT_KEY";
    std::string key_file;
};

/**
 * @brief Complete engine configuration, immutable once an engine is built
 */
struct EngineConfig {
    StrategyKind strategy = StrategyKind::HASH_SALT;
    StorageKind storage = StorageKind::MEMORY;
    bool enable_signatures = false;
    std::optional<std::string> signature_secret;
    bool enable_logging = false;
    size_t max_input_bytes = 1024 * 1024;

    DetectorConfig detector;
    MemoryStoreConfig memory;
    VaultStoreConfig vault;
};

} // namespace anonproxy
