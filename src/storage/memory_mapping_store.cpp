#include "storage/memory_mapping_store.hpp"

#include <format>
#include <mutex>

namespace anonproxy {

MemoryMappingStore::MemoryMappingStore(MemoryStoreConfig config)
    : config_(std::move(config)) {}

MemoryMappingStore::~MemoryMappingStore() {
    dispose();
}

Result<std::string> MemoryMappingStore::create(Mapping& mapping) {
    std::unique_lock lock(mutex_);
    if (disposed_) {
        return Result<std::string>::error(ErrorCategory::LIFECYCLE_ERROR, "mapping store disposed");
    }

    const auto now = Clock::now();
    purge_expired_locked(now);

    while (!order_.empty() && table_.size() >= config_.max_entries) {
        const auto oldest = table_.find(order_.begin()->second);
        if (oldest == table_.end()) {
            order_.erase(order_.begin());
            continue;
        }
        erase_locked(oldest);
        evicted_.fetch_add(1, std::memory_order_relaxed);
    }

    std::string id;
    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        auto candidate = generate_map_id();
        if (!table_.contains(candidate)) {
            id = std::move(candidate);
            break;
        }
    }
    if (id.empty()) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("no unused map id after {} attempts", kMaxIdAttempts));
    }

    mapping.map_id = id;

    Slot slot;
    slot.mapping = mapping;
    slot.expires_at = config_.ttl_seconds == 0
        ? Clock::time_point::max()
        : now + std::chrono::seconds(config_.ttl_seconds);
    slot.seq = next_seq_++;

    order_.emplace(slot.seq, id);
    table_.emplace(id, std::move(slot));
    created_.fetch_add(1, std::memory_order_relaxed);
    return Result<std::string>::ok(std::move(id));
}

Result<Mapping> MemoryMappingStore::get(const std::string& map_id) const {
    std::shared_lock lock(mutex_);
    if (disposed_) {
        return Result<Mapping>::error(ErrorCategory::LIFECYCLE_ERROR, "mapping store disposed");
    }

    const auto it = table_.find(map_id);
    if (it == table_.end() || expired(it->second, Clock::now())) {
        return Result<Mapping>::error(ErrorCategory::MAPPING_NOT_FOUND,
            std::format("mapping '{}' not found", map_id));
    }
    return Result<Mapping>::ok(it->second.mapping);
}

Result<bool> MemoryMappingStore::remove(const std::string& map_id) {
    std::unique_lock lock(mutex_);
    if (disposed_) {
        return Result<bool>::error(ErrorCategory::LIFECYCLE_ERROR, "mapping store disposed");
    }

    const auto it = table_.find(map_id);
    if (it == table_.end()) {
        return Result<bool>::ok(false);
    }
    erase_locked(it);
    return Result<bool>::ok(true);
}

bool MemoryMappingStore::is_healthy() const {
    std::shared_lock lock(mutex_);
    return !disposed_;
}

void MemoryMappingStore::dispose() {
    std::unique_lock lock(mutex_);
    if (disposed_) return;

    for (auto& [id, slot] : table_) {
        slot.mapping.scrub();
    }
    table_.clear();
    order_.clear();
    disposed_ = true;
}

size_t MemoryMappingStore::size() const {
    std::shared_lock lock(mutex_);
    return table_.size();
}

void MemoryMappingStore::erase_locked(std::unordered_map<std::string, Slot>::iterator it) {
    if (it == table_.end()) return;
    it->second.mapping.scrub();
    order_.erase(it->second.seq);
    table_.erase(it);
}

void MemoryMappingStore::purge_expired_locked(Clock::time_point now) {
    if (config_.ttl_seconds == 0) return;

    // Uniform TTL: insertion order is expiry order
    while (!order_.empty()) {
        const auto it = table_.find(order_.begin()->second);
        if (it == table_.end()) {
            order_.erase(order_.begin());
            continue;
        }
        if (!expired(it->second, now)) break;
        erase_locked(it);
        expired_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace anonproxy
