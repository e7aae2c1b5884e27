#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anonproxy {

// ============================================================================
// Sensitivity Categories
// ============================================================================

/**
 * @brief Category of a detected sensitive span
 *
 * Declaration order is the overlap tie-break priority used by the detector
 * (lower value wins).
 */
enum class Category : uint8_t {
    CREDENTIAL,
    CONNECTION_STRING,
    EMAIL,
    NETWORK_ADDRESS,
    IDENTIFIER
};

inline constexpr size_t kCategoryCount = 5;

[[nodiscard]] inline constexpr const char* category_to_string(Category c) {
    switch (c) {
        case Category::CREDENTIAL:        return "credential";
        case Category::CONNECTION_STRING: return "connection_string";
        case Category::EMAIL:             return "email";
        case Category::NETWORK_ADDRESS:   return "network_address";
        case Category::IDENTIFIER:        return "identifier";
    }
    return "identifier";
}

// Upper-case label embedded in placeholders
[[nodiscard]] inline constexpr const char* category_label(Category c) {
    switch (c) {
        case Category::CREDENTIAL:        return "CREDENTIAL";
        case Category::CONNECTION_STRING: return "CONNECTION_STRING";
        case Category::EMAIL:             return "EMAIL";
        case Category::NETWORK_ADDRESS:   return "NETWORK_ADDRESS";
        case Category::IDENTIFIER:        return "IDENTIFIER";
    }
    return "IDENTIFIER";
}

[[nodiscard]] std::optional<Category> parse_category(std::string_view name);

// ============================================================================
// Strategy / Storage Selection
// ============================================================================

enum class StrategyKind : uint8_t {
    HASH_SALT,
    EMBEDDINGS
};

enum class StorageKind : uint8_t {
    MEMORY,
    VAULT
};

[[nodiscard]] inline constexpr const char* strategy_to_string(StrategyKind s) {
    return s == StrategyKind::EMBEDDINGS ? "embeddings" : "hash_salt";
}

[[nodiscard]] inline constexpr const char* storage_to_string(StorageKind s) {
    return s == StorageKind::VAULT ? "vault" : "memory";
}

[[nodiscard]] std::optional<StrategyKind> parse_strategy(std::string_view name);
[[nodiscard]] std::optional<StorageKind> parse_storage(std::string_view name);

// ============================================================================
// Detection
// ============================================================================

/**
 * @brief A sensitive region of one input, as byte offsets [start, end)
 */
struct Span {
    size_t start = 0;
    size_t end = 0;
    Category category = Category::IDENTIFIER;
    std::string value;
    std::string rule;           // Name of the detector rule that matched

    [[nodiscard]] size_t length() const { return end - start; }
};

// ============================================================================
// Mapping
// ============================================================================

struct MappingEntry {
    std::string placeholder;
    std::string original;
    Category category = Category::IDENTIFIER;
};

/**
 * @brief Placeholder -> original correspondence for one anonymize call
 *
 * Holds original sensitive values in plaintext. Owners must call scrub()
 * before dropping a Mapping they no longer need.
 */
struct Mapping {
    std::string map_id;
    StrategyKind strategy = StrategyKind::HASH_SALT;
    std::chrono::system_clock::time_point created_at;
    std::vector<MappingEntry> entries;

    [[nodiscard]] const MappingEntry* find(std::string_view placeholder) const {
        for (const auto& e : entries) {
            if (e.placeholder == placeholder) return &e;
        }
        return nullptr;
    }

    // Zero all original values in place, then drop the entries
    void scrub();
};

/**
 * @brief Keyed integrity proof over a mapping
 *
 * digest is the standard base64 of HMAC-SHA256.
 */
struct Signature {
    std::string map_id;
    std::string digest;
};

// ============================================================================
// Engine Results
// ============================================================================

struct AnonymizeResult {
    std::string anon_prompt;
    std::string map_id;
    std::optional<std::string> signature;
    size_t replaced = 0;        // Number of spans substituted
};

struct EngineInfo {
    StrategyKind strategy = StrategyKind::HASH_SALT;
    StorageKind storage = StorageKind::MEMORY;
    bool signatures_enabled = false;
    bool logging_enabled = false;
    bool storage_healthy = false;
};

} // namespace anonproxy
