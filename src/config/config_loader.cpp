#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace anonproxy {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr const char* kDefaultVaultAddress = "http://127.0.0.1:8200";

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// Non-negative integer field; throws naming the field on a negative value
template <typename T>
T toml_unsigned(const toml::table& tbl, const std::string_view key,
                const std::string_view section, T default_value) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(default_value));
    if (v < 0) {
        throw std::runtime_error(std::format("{}.{} must not be negative", section, key));
    }
    return static_cast<T>(v);
}

// ---- Sections --------------------------------------------------------------

void extract_engine(const toml::table& root, EngineConfig& cfg) {
    const auto* e = root["engine"].as_table();
    if (!e) return;

    if (const auto name = toml_optional_string(*e, "strategy")) {
        const auto strategy = parse_strategy(*name);
        if (!strategy) {
            throw std::runtime_error(std::format(
                "engine.strategy: unknown strategy '{}' (expected hash_salt or embeddings)", *name));
        }
        cfg.strategy = *strategy;
    }
    if (const auto name = toml_optional_string(*e, "storage")) {
        const auto storage = parse_storage(*name);
        if (!storage) {
            throw std::runtime_error(std::format(
                "engine.storage: unknown storage '{}' (expected memory or vault)", *name));
        }
        cfg.storage = *storage;
    }

    cfg.enable_signatures = (*e)["enable_signatures"].value_or(false);
    if (auto secret = toml_optional_string(*e, "signature_secret"); secret && !secret->empty()) {
        cfg.signature_secret = std::move(*secret);
    }
    cfg.enable_logging = (*e)["enable_logging"].value_or(false);
    cfg.max_input_bytes = toml_unsigned<size_t>(*e, "max_input_bytes", "engine",
                                                cfg.max_input_bytes);
}

void extract_detector(const toml::table& root, DetectorConfig& cfg) {
    const auto* d = root["detector"].as_table();
    if (!d) return;

    cfg.min_length = toml_unsigned<size_t>(*d, "min_length", "detector", cfg.min_length);
    if (d->contains("exclusions")) {
        cfg.exclusions = toml_string_array(*d, "exclusions");
    }
    cfg.disabled_rules = toml_string_array(*d, "disabled_rules");
    cfg.case_sensitive = (*d)["case_sensitive"].value_or(false);

    if (const auto* arr = (*d)["custom_rules"].as_array()) {
        cfg.custom_rules.reserve(arr->size());
        for (const auto& elem : *arr) {
            const auto* r = elem.as_table();
            if (!r) continue;

            CustomRuleConfig rule;
            rule.name = (*r)["name"].value_or(""s);
            rule.pattern = (*r)["pattern"].value_or(""s);
            rule.category = (*r)["category"].value_or("identifier"s);
            cfg.custom_rules.emplace_back(std::move(rule));
        }
    }
}

void extract_memory_store(const toml::table& root, MemoryStoreConfig& cfg) {
    const auto* m = root["storage"]["memory"].as_table();
    if (!m) return;

    cfg.max_entries = toml_unsigned<size_t>(*m, "max_entries", "storage.memory", cfg.max_entries);
    cfg.ttl_seconds = toml_unsigned<uint32_t>(*m, "ttl_seconds", "storage.memory", cfg.ttl_seconds);
}

void extract_vault_store(const toml::table& root, VaultStoreConfig& cfg) {
    const auto* v = root["storage"]["vault"].as_table();
    if (!v) return;

    cfg.address = (*v)["address"].value_or(""s);
    cfg.token = (*v)["token"].value_or(""s);
    cfg.mount = (*v)["mount"].value_or(cfg.mount);
    cfg.path_prefix = (*v)["path_prefix"].value_or(cfg.path_prefix);
    cfg.timeout_ms = (*v)["timeout_ms"].value_or(cfg.timeout_ms);
    cfg.verify_tls = (*v)["verify_tls"].value_or(true);
    cfg.ttl_seconds = toml_unsigned<uint32_t>(*v, "ttl_seconds", "storage.vault", cfg.ttl_seconds);
    cfg.key_provider = (*v)["key_provider"].value_or(cfg.key_provider);
    cfg.key_env_var = (*v)["key_env_var"].value_or(cfg.key_env_var);
    cfg.key_file = (*v)["key_file"].value_or(""s);
}

EngineConfig extract_all_sections(const toml::table& tbl) {
    EngineConfig config;
    extract_engine(tbl, config);
    extract_detector(tbl, config.detector);
    extract_memory_store(tbl, config.memory);
    extract_vault_store(tbl, config.vault);
    ConfigLoader::apply_env_fallbacks(config);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

void ConfigLoader::apply_env_fallbacks(EngineConfig& config) {
    auto& vault = config.vault;
    if (vault.address.empty()) {
        if (const char* addr = std::getenv("VAULT_ADDR"); addr && *addr) {
            vault.address = addr;
        } else if (const char* endpoint = std::getenv("VAULT_ENDPOINT"); endpoint && *endpoint) {
            vault.address = endpoint;
        } else {
            vault.address = kDefaultVaultAddress;
        }
    }
    if (vault.token.empty()) {
        if (const char* token = std::getenv("VAULT_TOKEN"); token && *token) {
            vault.token = token;
        }
    }
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    if (config.enable_signatures &&
        (!config.signature_secret || config.signature_secret->empty())) {
        errors.push_back("engine.signature_secret required when enable_signatures is true");
    }

    if (config.max_input_bytes == 0) {
        errors.push_back("engine.max_input_bytes must be > 0");
    }

    for (size_t i = 0; i < config.detector.custom_rules.size(); ++i) {
        const auto& rule = config.detector.custom_rules[i];
        if (rule.name.empty()) {
            errors.push_back(std::format("detector.custom_rules[{}].name must not be empty", i));
        }
        if (!parse_category(rule.category)) {
            errors.push_back(std::format(
                "detector.custom_rules[{}].category '{}' is not a known category", i, rule.category));
        }
        if (rule.pattern.empty()) {
            errors.push_back(std::format("detector.custom_rules[{}].pattern must not be empty", i));
            continue;
        }
        try {
            std::regex re(rule.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            errors.push_back(std::format(
                "detector.custom_rules[{}].pattern is not a valid regex ({})", i, e.what()));
        }
    }

    if (config.memory.max_entries == 0) {
        errors.push_back("storage.memory.max_entries must be > 0");
    }

    if (config.storage == StorageKind::VAULT) {
        const auto& vault = config.vault;
        if (vault.address.empty()) {
            errors.push_back("storage.vault.address required when storage is vault");
        }
        if (vault.token.empty()) {
            errors.push_back("storage.vault.token (or VAULT_TOKEN) required when storage is vault");
        }
        if (vault.mount.empty()) {
            errors.push_back("storage.vault.mount must not be empty");
        }
        if (vault.timeout_ms <= 0) {
            errors.push_back("storage.vault.timeout_ms must be > 0");
        }
        if (vault.key_provider == "env") {
            if (vault.key_env_var.empty()) {
                errors.push_back("storage.vault.key_env_var required when key_provider is env");
            }
        } else if (vault.key_provider == "file") {
            if (vault.key_file.empty()) {
                errors.push_back("storage.vault.key_file required when key_provider is file");
            }
        } else {
            errors.push_back(std::format(
                "storage.vault.key_provider '{}' is not supported (expected env or file)",
                vault.key_provider));
        }
    }

    return errors;
}

} // namespace anonproxy
