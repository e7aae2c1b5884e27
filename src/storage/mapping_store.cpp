#include "storage/mapping_store.hpp"
#include "core/utils.hpp"

#include <openssl/rand.h>

#include <stdexcept>

namespace anonproxy {

std::string generate_map_id() {
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed generating map id");
    }
    return utils::bytes_to_hex(bytes, sizeof(bytes));
}

bool is_valid_map_id(std::string_view map_id) {
    if (map_id.size() != 32) return false;
    for (char c : map_id) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

} // namespace anonproxy
