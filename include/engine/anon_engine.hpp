#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/span_detector.hpp"
#include "security/signer.hpp"
#include "storage/mapping_store.hpp"
#include "strategy/placeholder_strategy.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace anonproxy {

/**
 * @brief Anonymization engine: Detector -> Strategy -> MappingStore (-> Signer)
 *
 * Lifecycle: Created -> Ready -> Disposed. Construction validates the whole
 * configuration first; calls after dispose() fail with LIFECYCLE_ERROR.
 *
 * Thread-safe: concurrent anonymize/deanonymize calls touch only their own
 * mapping, and the store serializes access to its table.
 */
class AnonEngine {
    // Restricts construction to create() while still allowing std::make_unique
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    enum class State : uint8_t { CREATED, READY, DISPOSED };

    /**
     * @brief Validate config and build an engine with its own store
     * @return CONFIGURATION_ERROR listing every problem; nothing is built
     */
    [[nodiscard]] static Result<std::unique_ptr<AnonEngine>> create(EngineConfig config);

    /**
     * @brief Build an engine over an existing store
     *
     * The engine disposes the store on dispose(); config.storage only
     * labels info().
     */
    [[nodiscard]] static Result<std::unique_ptr<AnonEngine>> create(
        EngineConfig config, std::shared_ptr<IMappingStore> store);

    AnonEngine(ConstructionKey, EngineConfig config, std::shared_ptr<IMappingStore> store);
    ~AnonEngine();

    AnonEngine(const AnonEngine&) = delete;
    AnonEngine& operator=(const AnonEngine&) = delete;

    /**
     * @brief Replace sensitive spans with placeholders and store the mapping
     *
     * A mapping is stored even when nothing was detected, so the returned
     * map_id is always valid for deanonymize().
     * @return INVALID_INPUT on empty, oversized or non-UTF-8 prompts
     */
    [[nodiscard]] Result<AnonymizeResult> anonymize(std::string_view prompt);

    /**
     * @brief Restore the originals of a mapping's placeholders in output
     *
     * With signatures enabled the signature is mandatory and verified
     * against the stored mapping (SIGNATURE_INVALID otherwise). With
     * signatures disabled a supplied signature is ignored.
     */
    [[nodiscard]] Result<std::string> deanonymize(
        std::string_view output, std::string_view map_id,
        std::optional<std::string_view> signature = std::nullopt);

    // Remove a mapping before it expires
    Result<bool> delete_mapping(std::string_view map_id);

    /**
     * @brief Round trip on a fixed synthetic prompt; never throws
     */
    [[nodiscard]] bool health_check();

    [[nodiscard]] EngineInfo info() const;

    // Release the store and scrub its contents (idempotent)
    void dispose();

    [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const EngineConfig& config() const { return config_; }
    [[nodiscard]] const SpanDetector& detector() const { return detector_; }

private:
    [[nodiscard]] static Result<std::shared_ptr<IMappingStore>> build_store(const EngineConfig& config);

    template <typename T>
    [[nodiscard]] Result<T> lifecycle_error() const {
        return Result<T>::error(ErrorCategory::LIFECYCLE_ERROR,
            state() == State::DISPOSED ? "engine disposed" : "engine not ready");
    }

    void log_info(const std::string& msg) const;
    void log_warn(const std::string& msg) const;

    EngineConfig config_;               // signature_secret moved into signer_
    SpanDetector detector_;
    PlaceholderStrategy strategy_;
    std::unique_ptr<Signer> signer_;
    std::shared_ptr<IMappingStore> store_;
    std::atomic<State> state_{State::CREATED};
};

} // namespace anonproxy
