#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace anonproxy::codec {

/**
 * @brief Canonical binary encoding of a Mapping
 *
 * Layout (all integers big-endian):
 *   "AMAP" | u8 version(1)
 *   | u32 len | map_id
 *   | u32 len | strategy name
 *   | u64 created_at (ms since epoch)
 *   | u32 entry count
 *   | per entry: u32 len | placeholder, u32 len | original, u32 len | category name
 *
 * Every field is length-prefixed and entries keep their order, so equal
 * mappings always encode to identical bytes. Used as the signed message and
 * as the plaintext stored (encrypted) by the vault backend.
 */
[[nodiscard]] std::string encode_canonical(const Mapping& mapping);

/**
 * @brief Inverse of encode_canonical
 * @return nullopt on bad magic/version, truncation, trailing bytes or
 *         unknown strategy/category names
 */
[[nodiscard]] std::optional<Mapping> decode_canonical(std::string_view bytes);

} // namespace anonproxy::codec
