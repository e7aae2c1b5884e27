#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <array>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace anonproxy {

/**
 * @brief Rule-based sensitive span detector
 *
 * Every rule is a precompiled regex with a category, an optional capture
 * group holding the sensitive value (so "password: x" only replaces x) and
 * an optional validator (Luhn, SSN ranges, IPv4 octets).
 *
 * Overlap resolution: longer span wins; equal lengths resolve by category
 * priority (credential > connection_string > email > network_address >
 * identifier), then earlier start, then rule declaration order. Output is
 * non-overlapping and sorted by start.
 *
 * Rules run over windows of at most kScanWindow bytes that end on
 * whitespace and overlap by kScanOverlap, so a single regex match attempt
 * never walks more than one window. Unbroken runs longer than
 * kMaxTokenLength (encoded blobs, pasted binaries) are not scanned.
 */
class SpanDetector {
public:
    using Validator = bool (*)(std::string_view);

    static constexpr size_t kMaxTokenLength = 2048;
    static constexpr size_t kScanWindow = 8192;
    static constexpr size_t kScanOverlap = 512;

    struct Rule {
        std::string name;
        Category category = Category::IDENTIFIER;
        std::regex pattern;
        size_t value_group = 0;       // 0 = whole match
        Validator validator = nullptr;
    };

    struct Stats {
        size_t total = 0;
        std::array<size_t, kCategoryCount> by_category{};
    };

    /**
     * @throws std::invalid_argument on a custom rule with a bad regex or
     *         unknown category (ConfigLoader::validate_config reports these
     *         before an engine is built)
     */
    explicit SpanDetector(const DetectorConfig& config = {});

    /**
     * @brief Detect sensitive spans
     * @return Non-overlapping spans sorted by start; empty if none
     */
    [[nodiscard]] std::vector<Span> detect(std::string_view text) const;

    [[nodiscard]] bool has_sensitive_spans(std::string_view text) const {
        return !detect(text).empty();
    }

    [[nodiscard]] Stats stats(std::string_view text) const;

    [[nodiscard]] std::vector<std::string> rule_names() const;

private:
    struct Candidate {
        Span span;
        size_t rule_index = 0;
    };

    void add_builtin_rules();
    void add_rule(std::string name, Category category, const char* pattern,
                  size_t value_group = 0, Validator validator = nullptr);

    [[nodiscard]] bool is_excluded(std::string_view value) const;

    // [begin, end) holds no run longer than kMaxTokenLength
    void scan_segment(std::string_view text, size_t begin, size_t end,
                      std::vector<Candidate>& out) const;
    void scan_window(std::string_view text, size_t begin, size_t end,
                     std::vector<Candidate>& out) const;

    DetectorConfig config_;
    std::regex::flag_type flags_;
    std::unordered_set<std::string> exclusions_;    // lower-cased
    std::unordered_set<std::string> disabled_;
    std::vector<Rule> rules_;
};

} // namespace anonproxy
