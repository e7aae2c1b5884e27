#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace anonproxy {

/**
 * @brief Keyed storage from mapId to Mapping
 *
 * Backends: MemoryMappingStore (volatile) and VaultMappingStore (durable,
 * encrypted at rest). Implementations are safe for concurrent use; a
 * mapping is never observable by get() before create() has returned.
 *
 * Errors: MAPPING_NOT_FOUND (unknown or expired id), BACKEND_UNAVAILABLE
 * (transient backend failure), LIFECYCLE_ERROR (after dispose()).
 */
class IMappingStore {
public:
    virtual ~IMappingStore() = default;

    /**
     * @brief Store a new mapping under a fresh id
     *
     * Assigns the generated id to mapping.map_id before storing a copy.
     * An id collision is resolved by regenerating, never by overwriting.
     * @return The assigned map_id
     */
    [[nodiscard]] virtual Result<std::string> create(Mapping& mapping) = 0;

    /**
     * @brief Fetch a copy of a mapping
     *
     * The returned copy holds plaintext originals; callers scrub() it when done.
     */
    [[nodiscard]] virtual Result<Mapping> get(const std::string& map_id) const = 0;

    /**
     * @return true if a mapping was removed, false if none existed
     *         (backends that cannot tell report true once the delete is accepted)
     */
    virtual Result<bool> remove(const std::string& map_id) = 0;

    [[nodiscard]] virtual bool is_healthy() const = 0;

    /**
     * @brief Release backend resources and scrub held secrets (idempotent)
     */
    virtual void dispose() = 0;

    [[nodiscard]] virtual const char* backend_name() const = 0;
};

/**
 * @brief Fresh mapping id: 16 CSPRNG bytes, hex-encoded (32 chars)
 * @throws std::runtime_error if RAND_bytes fails
 */
[[nodiscard]] std::string generate_map_id();

// True for ids of the generate_map_id() shape
[[nodiscard]] bool is_valid_map_id(std::string_view map_id);

// Attempts at finding an unused id before create() gives up
inline constexpr int kMaxIdAttempts = 5;

} // namespace anonproxy
