#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace anonproxy {

// ============================================================================
// ConfigLoader - Extract typed EngineConfig from TOML (toml++)
// ============================================================================

/**
 * @brief Loads and validates engine configuration
 *
 * Layout:
 *   [engine]            strategy, storage, enable_signatures, signature_secret,
 *                       enable_logging, max_input_bytes
 *   [detector]          min_length, exclusions, disabled_rules, case_sensitive
 *   [[detector.custom_rules]]  name, pattern, category
 *   [storage.memory]    max_entries, ttl_seconds
 *   [storage.vault]     address, token, mount, path_prefix, timeout_ms,
 *                       verify_tls, ttl_seconds, key_provider, key_env_var, key_file
 *
 * String values support ${VAR} environment expansion; a top-level
 * include = [...] merges other files underneath the including one.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to anon_proxy.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All validation errors of a config (empty = valid)
     *
     * Messages name the offending field, never its secret value.
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

    /**
     * @brief Fill empty vault address/token from the environment
     *
     * address: VAULT_ADDR, then VAULT_ENDPOINT, then http://127.0.0.1:8200
     * token:   VAULT_TOKEN
     */
    static void apply_env_fallbacks(EngineConfig& config);

private:
    static LoadResult validate_and_return(EngineConfig config);
};

} // namespace anonproxy
