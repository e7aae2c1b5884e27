#include "api/boundary.hpp"
#include "core/utils.hpp"
#include "engine/anon_engine.hpp"

#include <format>
#include <memory>

namespace anonproxy::api {

namespace {

/**
 * @brief Owns one engine and disposes it exactly once on scope exit
 */
class EngineGuard {
public:
    explicit EngineGuard(std::unique_ptr<AnonEngine> engine) : engine_(std::move(engine)) {}

    ~EngineGuard() {
        if (engine_) {
            engine_->dispose();
        }
    }

    EngineGuard(const EngineGuard&) = delete;
    EngineGuard& operator=(const EngineGuard&) = delete;

    AnonEngine* operator->() const { return engine_.get(); }

private:
    std::unique_ptr<AnonEngine> engine_;
};

Result<std::unique_ptr<AnonEngine>> build_engine(const BoundaryConfig& config) {
    auto engine_config = to_engine_config(config);
    if (engine_config.is_error()) {
        return Result<std::unique_ptr<AnonEngine>>::error_from(engine_config);
    }
    return AnonEngine::create(std::move(engine_config.value()));
}

template <typename Response, typename T>
Response failure(const Result<T>& result) {
    Response response;
    response.success = false;
    response.error = result.error_message();
    response.error_code = error_category_to_string(result.error_category());
    return response;
}

template <typename Response>
Response failure(ErrorCategory category, std::string message) {
    Response response;
    response.success = false;
    response.error = std::move(message);
    response.error_code = error_category_to_string(category);
    return response;
}

std::string error_json(const std::string& error, const std::string& error_code) {
    return std::format(R"({{"success":false,"error":"{}","errorCode":"{}"}})",
        utils::escape_json(error), utils::escape_json(error_code));
}

} // anonymous namespace

// ============================================================================
// Records
// ============================================================================

std::string HealthResponse::to_json() const {
    return std::format(R"({{"healthy":{}}})", utils::booltostr(healthy));
}

std::string AnonymizeResponse::to_json() const {
    if (!success) {
        return error_json(error, error_code);
    }
    std::string out = std::format(R"({{"success":true,"anonPrompt":"{}","mapId":"{}")",
        utils::escape_json(anon_prompt), utils::escape_json(map_id));
    if (signature) {
        out += std::format(R"(,"signature":"{}")", utils::escape_json(*signature));
    }
    out += '}';
    return out;
}

std::string DeanonymizeResponse::to_json() const {
    if (!success) {
        return error_json(error, error_code);
    }
    return std::format(R"({{"success":true,"output":"{}"}})", utils::escape_json(output));
}

Result<EngineConfig> to_engine_config(const BoundaryConfig& config) {
    const auto strategy = parse_strategy(config.strategy);
    if (!strategy) {
        return Result<EngineConfig>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("unknown strategy '{}' (expected hash_salt or embeddings)", config.strategy));
    }
    const auto storage = parse_storage(config.storage);
    if (!storage) {
        return Result<EngineConfig>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("unknown storage '{}' (expected memory or vault)", config.storage));
    }

    EngineConfig out;
    out.strategy = *strategy;
    out.storage = *storage;
    out.enable_signatures = config.enable_signatures;
    if (config.signature_secret && !config.signature_secret->empty()) {
        out.signature_secret = config.signature_secret;
    }
    out.enable_logging = config.enable_logging;
    return Result<EngineConfig>::ok(std::move(out));
}

// ============================================================================
// Operations
// ============================================================================

HealthResponse health_check(const BoundaryConfig& config) {
    HealthResponse response;
    try {
        auto engine = build_engine(config);
        if (engine.is_error()) {
            return response;
        }
        EngineGuard guard(std::move(engine.value()));
        response.healthy = guard->health_check();
    } catch (const std::exception& e) {
        if (config.enable_logging) {
            utils::log::error(std::format("health_check: {}", e.what()));
        }
        response.healthy = false;
    }
    return response;
}

AnonymizeResponse anonymize(const BoundaryConfig& config, std::string_view prompt) {
    try {
        auto engine = build_engine(config);
        if (engine.is_error()) {
            return failure<AnonymizeResponse>(engine);
        }
        EngineGuard guard(std::move(engine.value()));

        auto result = guard->anonymize(prompt);
        if (result.is_error()) {
            return failure<AnonymizeResponse>(result);
        }

        AnonymizeResponse response;
        response.success = true;
        response.anon_prompt = std::move(result.value().anon_prompt);
        response.map_id = std::move(result.value().map_id);
        response.signature = std::move(result.value().signature);
        return response;
    } catch (const std::exception& e) {
        return failure<AnonymizeResponse>(ErrorCategory::INTERNAL_ERROR, e.what());
    }
}

DeanonymizeResponse deanonymize(const BoundaryConfig& config,
                                std::string_view output,
                                std::string_view map_id,
                                std::optional<std::string_view> signature) {
    try {
        auto engine = build_engine(config);
        if (engine.is_error()) {
            return failure<DeanonymizeResponse>(engine);
        }
        EngineGuard guard(std::move(engine.value()));

        auto result = guard->deanonymize(output, map_id, signature);
        if (result.is_error()) {
            return failure<DeanonymizeResponse>(result);
        }

        DeanonymizeResponse response;
        response.success = true;
        response.output = std::move(result.value());
        return response;
    } catch (const std::exception& e) {
        return failure<DeanonymizeResponse>(ErrorCategory::INTERNAL_ERROR, e.what());
    }
}

} // namespace anonproxy::api
