#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace anonproxy::api {

// ============================================================================
// Boundary records exchanged with host adapters
// ============================================================================

/**
 * @brief Loosely-typed configuration as received from an adapter
 *
 * Vault settings and the vault encryption key come from the environment
 * (VAULT_ADDR / VAULT_ENDPOINT, VAULT_TOKEN, ANON_PROXY_VAULT_KEY).
 */
struct BoundaryConfig {
    std::string strategy = "hash_salt";     // hash_salt | embeddings
    std::string storage = "memory";         // memory | vault
    bool enable_signatures = false;
    std::optional<std::string> signature_secret;
    bool enable_logging = false;
};

struct HealthResponse {
    bool healthy = false;

    [[nodiscard]] std::string to_json() const;
};

struct AnonymizeResponse {
    bool success = false;
    std::string error;
    std::string error_code;                 // error_category_to_string()
    std::string anon_prompt;
    std::string map_id;
    std::optional<std::string> signature;

    [[nodiscard]] std::string to_json() const;
};

struct DeanonymizeResponse {
    bool success = false;
    std::string error;
    std::string error_code;
    std::string output;

    [[nodiscard]] std::string to_json() const;
};

/**
 * @brief Typed engine configuration from boundary fields
 * @return CONFIGURATION_ERROR on unknown strategy/storage names
 */
[[nodiscard]] Result<EngineConfig> to_engine_config(const BoundaryConfig& config);

// ============================================================================
// Boundary operations
//
// Each call builds one engine, runs one operation and disposes the engine
// exactly once on every path. Failures come back as {success: false, error};
// no exception escapes. With storage = memory, mappings live only as long as
// that one engine, so a later deanonymize call cannot find them.
// ============================================================================

[[nodiscard]] HealthResponse health_check(const BoundaryConfig& config);

[[nodiscard]] AnonymizeResponse anonymize(const BoundaryConfig& config, std::string_view prompt);

[[nodiscard]] DeanonymizeResponse deanonymize(const BoundaryConfig& config,
                                              std::string_view output,
                                              std::string_view map_id,
                                              std::optional<std::string_view> signature = std::nullopt);

} // namespace anonproxy::api
