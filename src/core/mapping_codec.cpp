#include "core/mapping_codec.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <limits>

namespace anonproxy::codec {

namespace {

constexpr std::string_view kMagic = "AMAP";
constexpr uint8_t kVersion = 1;

void put_u32(std::string& out, uint32_t v) {
    out += static_cast<char>((v >> 24) & 0xFF);
    out += static_cast<char>((v >> 16) & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
    out += static_cast<char>(v & 0xFF);
}

void put_u64(std::string& out, uint64_t v) {
    put_u32(out, static_cast<uint32_t>(v >> 32));
    put_u32(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
}

void put_field(std::string& out, std::string_view field) {
    put_u32(out, static_cast<uint32_t>(field.size()));
    out.append(field);
}

class Reader {
public:
    explicit Reader(std::string_view data) : data_(data) {}

    bool u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }

    bool u32(uint32_t& v) {
        if (remaining() < 4) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) {
            v = (v << 8) | static_cast<uint8_t>(data_[pos_++]);
        }
        return true;
    }

    bool u64(uint64_t& v) {
        uint32_t hi = 0;
        uint32_t lo = 0;
        if (!u32(hi) || !u32(lo)) return false;
        v = (static_cast<uint64_t>(hi) << 32) | lo;
        return true;
    }

    bool field(std::string& out) {
        uint32_t len = 0;
        if (!u32(len) || remaining() < len) return false;
        out.assign(data_.substr(pos_, len));
        pos_ += len;
        return true;
    }

    bool raw(std::string_view expected) {
        if (remaining() < expected.size()) return false;
        if (data_.substr(pos_, expected.size()) != expected) return false;
        pos_ += expected.size();
        return true;
    }

    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

private:
    std::string_view data_;
    size_t pos_ = 0;
};

} // anonymous namespace

std::string encode_canonical(const Mapping& mapping) {
    size_t total = kMagic.size() + 1 + 4 + mapping.map_id.size() + 4 + 16 + 8 + 4;
    for (const auto& e : mapping.entries) {
        total += 12 + e.placeholder.size() + e.original.size() + 24;
    }

    std::string out;
    out.reserve(total);
    out.append(kMagic);
    out += static_cast<char>(kVersion);
    put_field(out, mapping.map_id);
    put_field(out, strategy_to_string(mapping.strategy));
    put_u64(out, static_cast<uint64_t>(utils::to_epoch_ms(mapping.created_at)));
    put_u32(out, static_cast<uint32_t>(mapping.entries.size()));
    for (const auto& e : mapping.entries) {
        put_field(out, e.placeholder);
        put_field(out, e.original);
        put_field(out, category_to_string(e.category));
    }
    return out;
}

std::optional<Mapping> decode_canonical(std::string_view bytes) {
    Reader r(bytes);
    uint8_t version = 0;
    if (!r.raw(kMagic) || !r.u8(version) || version != kVersion) {
        return std::nullopt;
    }

    Mapping m;
    std::string strategy_name;
    uint64_t created_ms = 0;
    uint32_t count = 0;
    if (!r.field(m.map_id) || !r.field(strategy_name) ||
        !r.u64(created_ms) || !r.u32(count)) {
        return std::nullopt;
    }

    const auto strategy = parse_strategy(strategy_name);
    if (!strategy || created_ms > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    m.strategy = *strategy;
    m.created_at = utils::from_epoch_ms(static_cast<int64_t>(created_ms));

    // Each entry needs at least 12 bytes of length prefixes
    if (count > r.remaining() / 12) return std::nullopt;
    m.entries.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
        MappingEntry e;
        std::string category_name;
        if (!r.field(e.placeholder) || !r.field(e.original) || !r.field(category_name)) {
            m.scrub();
            return std::nullopt;
        }
        const auto category = parse_category(category_name);
        if (!category) {
            m.scrub();
            return std::nullopt;
        }
        e.category = *category;
        m.entries.push_back(std::move(e));
    }

    if (r.remaining() != 0) {
        m.scrub();
        return std::nullopt;
    }
    return m;
}

} // namespace anonproxy::codec
