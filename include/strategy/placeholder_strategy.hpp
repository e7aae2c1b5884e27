#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace anonproxy {

/**
 * @brief Per-mapping substitution state
 *
 * Holds the fresh salt (hash-salt) and per-category counters (embeddings)
 * of one mapping, plus the memo that keeps the same original on the same
 * placeholder within the mapping. Contains originals; scrubbed on
 * destruction.
 *
 * The source text is the prompt being anonymized. A placeholder that
 * already occurs in it is never issued, since restore could not tell the
 * literal occurrence from the substituted one. The text must outlive the
 * context.
 */
class MappingContext {
public:
    static constexpr size_t kSaltLen = 32;

    // Fresh random salt from RAND_bytes; throws std::runtime_error if the CSPRNG fails
    explicit MappingContext(std::string_view source = {});

    // Fixed salt, for reproducing a mapping deterministically
    explicit MappingContext(const std::array<uint8_t, kSaltLen>& salt,
                            std::string_view source = {});

    ~MappingContext();

    MappingContext(const MappingContext&) = delete;
    MappingContext& operator=(const MappingContext&) = delete;

    [[nodiscard]] const std::array<uint8_t, kSaltLen>& salt() const { return salt_; }

private:
    friend class PlaceholderStrategy;

    static std::string memo_key(Category category, std::string_view original);

    // Issued earlier in this mapping, or present verbatim in the source text
    [[nodiscard]] bool is_taken(const std::string& placeholder) const;

    std::string_view source_;
    std::array<uint8_t, kSaltLen> salt_{};
    std::array<uint32_t, kCategoryCount> counters_{};
    std::unordered_map<std::string, std::string> memo_;     // category|original -> placeholder
    std::unordered_set<std::string> issued_;                // placeholders already handed out
};

/**
 * @brief Placeholder derivation policy (tagged over StrategyKind)
 *
 * - HASH_SALT:  __ANON_<CATEGORY>_<hex>__ where hex is a prefix of
 *               HMAC-SHA256(salt, category || 0x00 || original)
 * - EMBEDDINGS: __SEM_<CATEGORY>_<n>__ with n a per-mapping, per-category counter
 *
 * The "__" delimiters keep placeholders unambiguous inside free text: none
 * is a substring of another, and their inner part never contains "__".
 * Placeholders are reversible only through the mapping store.
 */
class PlaceholderStrategy {
public:
    // "__ANON_CONNECTION_STRING_" + 64 hex + "__"
    static constexpr size_t kMaxPlaceholderLen = 96;

    explicit PlaceholderStrategy(StrategyKind kind) : kind_(kind) {}

    [[nodiscard]] StrategyKind kind() const { return kind_; }

    /**
     * @brief Placeholder for a span within one mapping
     *
     * Same (category, original) in the same context always yields the same
     * placeholder; distinct originals never share one, and none occurs in
     * the context's source text.
     */
    [[nodiscard]] std::string substitute(const Span& span, MappingContext& ctx) const;

    [[nodiscard]] static std::optional<std::string> invert(
        std::string_view placeholder, const Mapping& mapping);

    /**
     * @brief Replace every placeholder of the mapping found in text
     *
     * Single left-to-right pass: restored originals are never rescanned, and
     * placeholders the mapping does not own are left untouched.
     * @param restored If non-null, receives the number of replacements
     */
    [[nodiscard]] static std::string restore(std::string_view text, const Mapping& mapping,
                                             size_t* restored = nullptr);

    // True if text has the reserved placeholder shape
    [[nodiscard]] static bool is_placeholder(std::string_view text);

    // Hash-salt placeholder with a digest prefix of digest_bytes (8..32)
    [[nodiscard]] static std::string hash_salt_placeholder(
        Category category, std::string_view original,
        const std::array<uint8_t, MappingContext::kSaltLen>& salt,
        size_t digest_bytes = 8);

    [[nodiscard]] static std::string embeddings_placeholder(Category category, uint32_t n);

private:
    StrategyKind kind_;
};

} // namespace anonproxy
