#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace anonproxy {

std::optional<Category> parse_category(std::string_view name) {
    static const std::unordered_map<std::string, Category> lookup = {
        {"credential",        Category::CREDENTIAL},
        {"connection_string", Category::CONNECTION_STRING},
        {"connection-string", Category::CONNECTION_STRING},
        {"email",             Category::EMAIL},
        {"network_address",   Category::NETWORK_ADDRESS},
        {"network-address",   Category::NETWORK_ADDRESS},
        {"identifier",        Category::IDENTIFIER},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<StrategyKind> parse_strategy(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "hash_salt") return StrategyKind::HASH_SALT;
    if (lower == "embeddings") return StrategyKind::EMBEDDINGS;
    return std::nullopt;
}

std::optional<StorageKind> parse_storage(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "memory") return StorageKind::MEMORY;
    if (lower == "vault") return StorageKind::VAULT;
    return std::nullopt;
}

void Mapping::scrub() {
    for (auto& e : entries) {
        utils::secure_zero(e.original);
        e.placeholder.clear();
    }
    entries.clear();
}

} // namespace anonproxy
