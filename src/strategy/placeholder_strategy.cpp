#include "strategy/placeholder_strategy.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <unordered_map>

namespace anonproxy {

namespace {

constexpr std::string_view kDelim = "__";
constexpr std::string_view kHashPrefix = "__ANON_";
constexpr std::string_view kSemPrefix = "__SEM_";

// Digest prefix widths tried in order when two originals collide
constexpr size_t kDigestWidths[] = {8, 12, 16, 32};

} // anonymous namespace

// ============================================================================
// MappingContext
// ============================================================================

MappingContext::MappingContext(std::string_view source)
    : source_(source) {
    if (RAND_bytes(salt_.data(), static_cast<int>(salt_.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed generating mapping salt");
    }
}

MappingContext::MappingContext(const std::array<uint8_t, kSaltLen>& salt,
                               std::string_view source)
    : source_(source), salt_(salt) {}

MappingContext::~MappingContext() {
    OPENSSL_cleanse(salt_.data(), salt_.size());
    // Keys embed originals
    while (!memo_.empty()) {
        auto node = memo_.extract(memo_.begin());
        utils::secure_zero(node.key());
    }
    issued_.clear();
}

std::string MappingContext::memo_key(Category category, std::string_view original) {
    std::string key;
    key.reserve(original.size() + 2);
    key += static_cast<char>('0' + static_cast<int>(category));
    key += '\0';
    key.append(original);
    return key;
}

bool MappingContext::is_taken(const std::string& placeholder) const {
    return issued_.contains(placeholder) ||
           source_.find(placeholder) != std::string_view::npos;
}

// ============================================================================
// Placeholder derivation
// ============================================================================

std::string PlaceholderStrategy::hash_salt_placeholder(
    Category category, std::string_view original,
    const std::array<uint8_t, MappingContext::kSaltLen>& salt,
    size_t digest_bytes) {

    const std::string_view label = category_label(category);
    std::string data;
    data.reserve(label.size() + 1 + original.size());
    data.append(label);
    data += '\0';
    data.append(original);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const auto* ok = HMAC(EVP_sha256(), salt.data(), static_cast<int>(salt.size()),
                          reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                          digest, &digest_len);
    utils::secure_zero(data);
    if (!ok) {
        throw std::runtime_error("HMAC-SHA256 failed deriving placeholder");
    }

    const size_t width = std::min<size_t>(std::max<size_t>(digest_bytes, 8), digest_len);
    return std::format("{}{}_{}{}", kHashPrefix, label,
                       utils::bytes_to_hex(digest, width), kDelim);
}

std::string PlaceholderStrategy::embeddings_placeholder(Category category, uint32_t n) {
    return std::format("{}{}_{}{}", kSemPrefix, category_label(category), n, kDelim);
}

std::string PlaceholderStrategy::substitute(const Span& span, MappingContext& ctx) const {
    auto key = MappingContext::memo_key(span.category, span.value);
    if (auto it = ctx.memo_.find(key); it != ctx.memo_.end()) {
        utils::secure_zero(key);
        return it->second;
    }

    std::string placeholder;
    switch (kind_) {
        case StrategyKind::HASH_SALT: {
            for (size_t width : kDigestWidths) {
                placeholder = hash_salt_placeholder(span.category, span.value, ctx.salt_, width);
                if (!ctx.is_taken(placeholder)) break;
                placeholder.clear();
            }
            if (placeholder.empty()) {
                utils::secure_zero(key);
                throw std::runtime_error("placeholder collision could not be resolved");
            }
            break;
        }
        case StrategyKind::EMBEDDINGS: {
            // Skip numbers whose placeholder the prompt already spells out
            auto& counter = ctx.counters_[static_cast<size_t>(span.category)];
            do {
                placeholder = embeddings_placeholder(span.category, ++counter);
            } while (ctx.is_taken(placeholder));
            break;
        }
    }

    ctx.issued_.insert(placeholder);
    ctx.memo_.emplace(std::move(key), placeholder);
    return placeholder;
}

// ============================================================================
// Inversion
// ============================================================================

std::optional<std::string> PlaceholderStrategy::invert(
    std::string_view placeholder, const Mapping& mapping) {
    if (const auto* entry = mapping.find(placeholder)) {
        return entry->original;
    }
    return std::nullopt;
}

bool PlaceholderStrategy::is_placeholder(std::string_view text) {
    std::string_view inner;
    if (text.starts_with(kHashPrefix)) {
        inner = text.substr(kHashPrefix.size());
    } else if (text.starts_with(kSemPrefix)) {
        inner = text.substr(kSemPrefix.size());
    } else {
        return false;
    }
    if (text.size() > kMaxPlaceholderLen || !inner.ends_with(kDelim)) return false;
    inner.remove_suffix(kDelim.size());
    if (inner.empty() || inner.find(kDelim) != std::string_view::npos) return false;

    for (char c : inner) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'f') ||
                        (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

std::string PlaceholderStrategy::restore(std::string_view text, const Mapping& mapping,
                                         size_t* restored) {
    size_t count = 0;
    if (mapping.entries.empty() || text.size() < 4) {
        if (restored) *restored = 0;
        return std::string(text);
    }

    std::unordered_map<std::string_view, const std::string*> lookup;
    lookup.reserve(mapping.entries.size());
    for (const auto& e : mapping.entries) {
        lookup.emplace(e.placeholder, &e.original);
    }

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;

    while (pos < text.size()) {
        const size_t open = text.find(kDelim, pos);
        if (open == std::string_view::npos) break;

        const size_t close = text.find(kDelim, open + kDelim.size());
        if (close == std::string_view::npos) break;

        const size_t len = close + kDelim.size() - open;
        if (len <= kMaxPlaceholderLen) {
            const auto it = lookup.find(text.substr(open, len));
            if (it != lookup.end()) {
                out.append(text.substr(pos, open - pos));
                out.append(*it->second);
                pos = open + len;
                ++count;
                continue;
            }
        }
        // No match starting here; a placeholder may still start one byte later ("___ANON_...")
        out.append(text.substr(pos, open + 1 - pos));
        pos = open + 1;
    }

    if (pos < text.size()) {
        out.append(text.substr(pos));
    }
    if (restored) *restored = count;
    return out;
}

} // namespace anonproxy
