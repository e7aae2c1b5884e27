#pragma once

#include "config/config_types.hpp"
#include "storage/mapping_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace anonproxy {

/**
 * @brief Volatile in-process mapping store
 *
 * - shared_mutex: concurrent get(), exclusive create()/remove()
 * - TTL expiry: expired mappings read as not found, purged on create()
 * - Capacity: oldest mapping evicted when max_entries is reached
 * - Every original is scrubbed on remove, eviction, purge and dispose
 */
class MemoryMappingStore : public IMappingStore {
public:
    explicit MemoryMappingStore(MemoryStoreConfig config = {});
    ~MemoryMappingStore() override;

    [[nodiscard]] Result<std::string> create(Mapping& mapping) override;
    [[nodiscard]] Result<Mapping> get(const std::string& map_id) const override;
    Result<bool> remove(const std::string& map_id) override;
    [[nodiscard]] bool is_healthy() const override;
    void dispose() override;
    [[nodiscard]] const char* backend_name() const override { return "memory"; }

    [[nodiscard]] size_t size() const;

    struct Stats {
        uint64_t created;
        uint64_t evicted;
        uint64_t expired;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .created = created_.load(std::memory_order_relaxed),
            .evicted = evicted_.load(std::memory_order_relaxed),
            .expired = expired_.load(std::memory_order_relaxed),
        };
    }

private:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        Mapping mapping;
        Clock::time_point expires_at;   // time_point::max() = never
        uint64_t seq = 0;               // insertion order
    };

    [[nodiscard]] bool expired(const Slot& slot, Clock::time_point now) const {
        return slot.expires_at <= now;
    }

    // Caller holds the unique lock
    void erase_locked(std::unordered_map<std::string, Slot>::iterator it);
    void purge_expired_locked(Clock::time_point now);

    MemoryStoreConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Slot> table_;
    std::map<uint64_t, std::string> order_;     // seq -> map_id, oldest first
    uint64_t next_seq_ = 0;
    bool disposed_ = false;

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> evicted_{0};
    std::atomic<uint64_t> expired_{0};
};

} // namespace anonproxy
