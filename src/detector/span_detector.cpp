#include "detector/span_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <iterator>
#include <map>
#include <stdexcept>

namespace anonproxy {

namespace {

// Whitespace as the rules' \s sees it
constexpr std::string_view kSpaceChars = " \t\n\r\f\v";

bool is_space(char c) {
    return kSpaceChars.find(c) != std::string_view::npos;
}

/**
 * @brief Luhn algorithm validation for credit card numbers
 * @param number Digits with optional space/hyphen separators
 * @return true if passes Luhn check
 */
bool luhn_validate(std::string_view number) {
    std::string digits;
    digits.reserve(number.size());
    for (char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

/**
 * @brief Validate SSN is not obviously fake
 * SSN cannot start with 000, 666, or 900-999
 */
bool validate_ssn(std::string_view value) {
    std::string digits;
    digits.reserve(9);
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() != 9) {
        return false;
    }

    const int area = (digits[0] - '0') * 100 + (digits[1] - '0') * 10 + (digits[2] - '0');
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }

    // Group number (middle 2) cannot be 00
    if (digits[3] == '0' && digits[4] == '0') {
        return false;
    }

    // Serial number (last 4) cannot be 0000
    return digits.compare(5, 4, "0000") != 0;
}

/**
 * @brief Every dotted octet must be 0-255; optional port 1-65535
 */
bool validate_ipv4(std::string_view value) {
    std::string_view addr = value;
    const size_t colon = value.find(':');
    if (colon != std::string_view::npos) {
        addr = value.substr(0, colon);
        const auto port_str = value.substr(colon + 1);
        unsigned port = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 || port > 65535) {
            return false;
        }
    }

    int octets = 0;
    size_t pos = 0;
    while (pos <= addr.size()) {
        size_t dot = addr.find('.', pos);
        if (dot == std::string_view::npos) dot = addr.size();
        const auto part = addr.substr(pos, dot - pos);
        unsigned v = 0;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), v);
        if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size() || v > 255) {
            return false;
        }
        ++octets;
        pos = dot + 1;
    }
    return octets == 4;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

SpanDetector::SpanDetector(const DetectorConfig& config)
    : config_(config),
      flags_(std::regex::ECMAScript | std::regex::optimize |
             (config.case_sensitive ? std::regex::flag_type{} : std::regex::icase)) {

    for (const auto& e : config_.exclusions) {
        exclusions_.insert(utils::to_lower(e));
    }
    for (const auto& r : config_.disabled_rules) {
        disabled_.insert(utils::to_lower(r));
    }

    add_builtin_rules();

    for (const auto& custom : config_.custom_rules) {
        const auto category = parse_category(custom.category);
        if (!category) {
            throw std::invalid_argument(
                std::format("custom rule '{}': unknown category '{}'", custom.name, custom.category));
        }
        if (disabled_.contains(utils::to_lower(custom.name))) continue;
        try {
            rules_.push_back(Rule{custom.name, *category, std::regex(custom.pattern, flags_), 0, nullptr});
        } catch (const std::regex_error& e) {
            throw std::invalid_argument(
                std::format("custom rule '{}': invalid pattern ({})", custom.name, e.what()));
        }
    }
}

void SpanDetector::add_rule(std::string name, Category category, const char* pattern,
                            size_t value_group, Validator validator) {
    if (disabled_.contains(name)) return;
    rules_.push_back(Rule{std::move(name), category, std::regex(pattern, flags_),
                          value_group, validator});
}

void SpanDetector::add_builtin_rules() {
    // Compile regex patterns once (matching a precompiled std::regex is const and thread-safe)

    // ---- Credentials ----
    add_rule("api_key", Category::CREDENTIAL,
        R"((?:api[_-]?key|apikey|key)["'\s]*[:=]["'\s]*([A-Za-z0-9_\-.]{16,}))", 1);
    add_rule("access_token", Category::CREDENTIAL,
        R"((?:access[_-]?token|accesstoken|token)["'\s]*[:=]["'\s]*([A-Za-z0-9_\-.]{16,}))", 1);
    add_rule("secret_key", Category::CREDENTIAL,
        R"((?:secret[_-]?key|secretkey|secret)["'\s]*[:=]["'\s]*([A-Za-z0-9_\-.]{16,}))", 1);
    add_rule("bearer_token", Category::CREDENTIAL,
        R"(Bearer\s+([A-Za-z0-9_\-.~+/]{16,}=*))", 1);
    add_rule("jwt", Category::CREDENTIAL,
        R"(eyJ[A-Za-z0-9_\-]+\.eyJ[A-Za-z0-9_\-]+\.[A-Za-z0-9_\-]+)");
    add_rule("password", Category::CREDENTIAL,
        R"((?:password|passwd|pwd)["'\s]*[:=]["'\s]*([^\s"',;]{8,}))", 1);
    add_rule("aws_access_key", Category::CREDENTIAL,
        R"(\bAKIA[0-9A-Z]{16}\b)");
    add_rule("provider_key", Category::CREDENTIAL,
        R"(\b(?:(?:sk|pk|rk)-(?:[A-Za-z0-9]+-)*[A-Za-z0-9]{16,}|gh[pousr]_[A-Za-z0-9]{36,}|xox[abprs]-[A-Za-z0-9\-]{10,})\b)");
    add_rule("hex_secret", Category::CREDENTIAL,
        R"(\b[A-Fa-f0-9]{32,}\b)");

    // ---- Connection strings ----
    add_rule("url_credentials", Category::CONNECTION_STRING,
        R"(\b[A-Za-z][A-Za-z0-9+.\-]*://[^\s:/@'"]+:[^\s@/'"]+@[^\s/'"?#,;]+(?:/[^\s'",;]*)?)");
    add_rule("database_url", Category::CONNECTION_STRING,
        R"((?:database[_-]?url|db[_-]?url|connection[_-]?string)["'\s]*[:=]["'\s]*([^\s"']{10,}))", 1);

    // ---- Email ----
    add_rule("email", Category::EMAIL,
        R"(\b[A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,}\b)");

    // ---- Network addresses ----
    add_rule("ipv4", Category::NETWORK_ADDRESS,
        R"(\b(?:\d{1,3}\.){3}\d{1,3}(?::\d{1,5})?\b)", 0, validate_ipv4);
    add_rule("host_assignment", Category::NETWORK_ADDRESS,
        R"((?:hostname|host|server)["'\s]*[:=]["'\s]*([A-Za-z0-9](?:[A-Za-z0-9\-]*[A-Za-z0-9])?(?:\.[A-Za-z0-9](?:[A-Za-z0-9\-]*[A-Za-z0-9])?)+))", 1);

    // ---- Identifiers ----
    add_rule("uuid", Category::IDENTIFIER,
        R"(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\b)");
    add_rule("ssn", Category::IDENTIFIER,
        R"(\b\d{3}-\d{2}-\d{4}\b)", 0, validate_ssn);
    add_rule("credit_card", Category::IDENTIFIER,
        R"(\b(?:\d[ \-]?){12,18}\d\b)", 0, luhn_validate);
    add_rule("phone", Category::IDENTIFIER,
        R"((?:\+?1[\-.\s]?)?\(?\b[0-9]{3}\)?[\-.\s]?[0-9]{3}[\-.\s]?[0-9]{4}\b)");
}

// ============================================================================
// Detection
// ============================================================================

bool SpanDetector::is_excluded(std::string_view value) const {
    return exclusions_.contains(utils::to_lower(value));
}

void SpanDetector::scan_window(std::string_view text, size_t begin, size_t end,
                               std::vector<Candidate>& out) const {
    auto flags = std::regex_constants::match_default;
    if (begin > 0) {
        flags |= std::regex_constants::match_prev_avail;
    }
    if (end < text.size()) {
        flags |= std::regex_constants::match_not_eol;
        if (!is_space(text[end - 1]) && !is_space(text[end])) {
            flags |= std::regex_constants::match_not_eow;
        }
    }

    const char* first = text.data() + begin;
    const char* last = text.data() + end;

    for (size_t ri = 0; ri < rules_.size(); ++ri) {
        const auto& rule = rules_[ri];
        for (auto it = std::cregex_iterator(first, last, rule.pattern, flags);
             it != std::cregex_iterator(); ++it) {
            const auto& m = *it;
            const size_t g = (rule.value_group < m.size() && m[rule.value_group].matched)
                ? rule.value_group : 0;

            const auto start = begin + static_cast<size_t>(m.position(g));
            const auto len = static_cast<size_t>(m.length(g));
            const std::string_view value = text.substr(start, len);

            if (len < config_.min_length || is_excluded(value)) continue;
            if (rule.validator && !rule.validator(value)) continue;

            Candidate c;
            c.span.start = start;
            c.span.end = start + len;
            c.span.category = rule.category;
            c.span.value = std::string(value);
            c.span.rule = rule.name;
            c.rule_index = ri;
            out.push_back(std::move(c));
        }
    }
}

void SpanDetector::scan_segment(std::string_view text, size_t begin, size_t end,
                                std::vector<Candidate>& out) const {
    size_t pos = begin;
    while (pos < end) {
        size_t win_end = end;
        if (end - pos > kScanWindow) {
            // End just after whitespace in the second half of the window
            const size_t ws = text.find_last_of(kSpaceChars, pos + kScanWindow - 1);
            win_end = (ws != std::string_view::npos && ws >= pos + kScanWindow / 2)
                ? ws + 1 : pos + kScanWindow;
        }
        scan_window(text, pos, win_end, out);
        if (win_end >= end) break;

        // Re-read the tail from a token start so matches spanning the cut are seen whole
        size_t next = win_end - kScanOverlap;
        const size_t ws = text.find_last_of(kSpaceChars, next - 1);
        if (ws != std::string_view::npos && ws >= pos) {
            next = ws + 1;
        }
        pos = std::max(next, pos + 1);
    }
}

std::vector<Span> SpanDetector::detect(std::string_view text) const {
    if (text.empty()) return {};

    std::vector<Candidate> candidates;

    // Oversized runs split the text into independently scanned segments
    size_t segment_begin = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (is_space(text[pos])) {
            ++pos;
            continue;
        }
        size_t run_end = pos;
        while (run_end < text.size() && !is_space(text[run_end])) ++run_end;
        if (run_end - pos > kMaxTokenLength) {
            scan_segment(text, segment_begin, pos, candidates);
            segment_begin = run_end;
        }
        pos = run_end;
    }
    scan_segment(text, segment_begin, text.size(), candidates);

    std::sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            if (a.span.length() != b.span.length()) return a.span.length() > b.span.length();
            if (a.span.category != b.span.category) return a.span.category < b.span.category;
            if (a.span.start != b.span.start) return a.span.start < b.span.start;
            return a.rule_index < b.rule_index;
        });

    // Accepted intervals keyed by start
    std::map<size_t, Span> accepted;
    for (auto& c : candidates) {
        auto next = accepted.lower_bound(c.span.start);
        if (next != accepted.end() && next->second.start < c.span.end) continue;
        if (next != accepted.begin() && std::prev(next)->second.end > c.span.start) continue;
        accepted.emplace(c.span.start, std::move(c.span));
    }

    std::vector<Span> result;
    result.reserve(accepted.size());
    for (auto& [start, span] : accepted) {
        result.push_back(std::move(span));
    }
    return result;
}

SpanDetector::Stats SpanDetector::stats(std::string_view text) const {
    Stats s;
    for (const auto& span : detect(text)) {
        ++s.total;
        ++s.by_category[static_cast<size_t>(span.category)];
    }
    return s;
}

std::vector<std::string> SpanDetector::rule_names() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& r : rules_) {
        names.push_back(r.name);
    }
    return names;
}

} // namespace anonproxy
