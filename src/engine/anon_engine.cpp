#include "engine/anon_engine.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "security/env_key_manager.hpp"
#include "security/local_key_manager.hpp"
#include "storage/memory_mapping_store.hpp"
#include "storage/vault_mapping_store.hpp"

#include <format>
#include <stdexcept>

namespace anonproxy {

namespace {

// Fixed synthetic prompt for health_check(): one credential, one email
constexpr std::string_view kHealthProbe =
    "health probe: api_key=hc0123456789abcdef0123 contact probe@anon-proxy.invalid";

void scrub_spans(std::vector<Span>& spans) {
    for (auto& span : spans) {
        utils::secure_zero(span.value);
    }
    spans.clear();
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<AnonEngine>> AnonEngine::create(EngineConfig config) {
    using R = Result<std::unique_ptr<AnonEngine>>;

    ConfigLoader::apply_env_fallbacks(config);
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "invalid configuration:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return R::error(ErrorCategory::CONFIGURATION_ERROR, std::move(combined));
    }

    auto store = build_store(config);
    if (store.is_error()) {
        return R::error_from(store);
    }
    return create(std::move(config), std::move(store.value()));
}

Result<std::unique_ptr<AnonEngine>> AnonEngine::create(
    EngineConfig config, std::shared_ptr<IMappingStore> store) {
    using R = Result<std::unique_ptr<AnonEngine>>;

    if (!store) {
        return R::error(ErrorCategory::CONFIGURATION_ERROR, "no mapping store supplied");
    }

    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "invalid configuration:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return R::error(ErrorCategory::CONFIGURATION_ERROR, std::move(combined));
    }

    std::unique_ptr<AnonEngine> engine;
    try {
        engine = std::make_unique<AnonEngine>(ConstructionKey{}, std::move(config), std::move(store));
    } catch (const std::invalid_argument& e) {
        return R::error(ErrorCategory::CONFIGURATION_ERROR, e.what());
    } catch (const std::exception& e) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("engine construction failed: {}", e.what()));
    }

    engine->state_.store(State::READY, std::memory_order_release);
    engine->log_info(std::format("engine ready: strategy={} storage={} signatures={} rules={}",
        strategy_to_string(engine->config_.strategy),
        engine->store_->backend_name(),
        utils::booltostr(engine->signer_ != nullptr),
        engine->detector_.rule_names().size()));
    return R::ok(std::move(engine));
}

AnonEngine::AnonEngine(ConstructionKey, EngineConfig config, std::shared_ptr<IMappingStore> store)
    : config_(std::move(config)),
      detector_(config_.detector),
      strategy_(config_.strategy),
      store_(std::move(store)) {
    if (config_.signature_secret) {
        if (config_.enable_signatures) {
            signer_ = std::make_unique<Signer>(std::move(*config_.signature_secret));
        }
        utils::secure_zero(*config_.signature_secret);
        config_.signature_secret.reset();
    }
}

AnonEngine::~AnonEngine() {
    dispose();
}

Result<std::shared_ptr<IMappingStore>> AnonEngine::build_store(const EngineConfig& config) {
    using R = Result<std::shared_ptr<IMappingStore>>;

    if (config.storage == StorageKind::MEMORY) {
        return R::ok(std::make_shared<MemoryMappingStore>(config.memory));
    }

    std::shared_ptr<IKeyManager> key_manager;
    try {
        if (config.vault.key_provider == "file") {
            key_manager = std::make_shared<LocalKeyManager>(config.vault.key_file);
        } else {
            auto env_keys = std::make_shared<EnvKeyManager>(config.vault.key_env_var);
            if (!env_keys->is_valid()) {
                return R::error(ErrorCategory::CONFIGURATION_ERROR,
                    std::format("vault encryption key unavailable: {}", env_keys->load_error()));
            }
            key_manager = std::move(env_keys);
        }
    } catch (const std::exception& e) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("vault key manager failed: {}", e.what()));
    }

    if (!key_manager->get_active_key()) {
        return R::error(ErrorCategory::CONFIGURATION_ERROR, "vault encryption key unavailable");
    }
    return R::ok(std::make_shared<VaultMappingStore>(
        config.vault, std::move(key_manager), config.enable_logging));
}

// ============================================================================
// Operations
// ============================================================================

Result<AnonymizeResult> AnonEngine::anonymize(std::string_view prompt) {
    if (state() != State::READY) {
        return lifecycle_error<AnonymizeResult>();
    }
    if (prompt.empty()) {
        return Result<AnonymizeResult>::error(ErrorCategory::INVALID_INPUT,
            "prompt must not be empty");
    }
    if (prompt.size() > config_.max_input_bytes) {
        return Result<AnonymizeResult>::error(ErrorCategory::INVALID_INPUT,
            std::format("prompt is {} bytes (limit {})", prompt.size(), config_.max_input_bytes));
    }
    if (!utils::is_valid_utf8(prompt)) {
        return Result<AnonymizeResult>::error(ErrorCategory::INVALID_INPUT,
            "prompt is not valid UTF-8 text");
    }

    std::vector<Span> spans;
    Mapping mapping;
    try {
        spans = detector_.detect(prompt);

        MappingContext ctx(prompt);
        mapping.strategy = strategy_.kind();
        mapping.created_at = utils::from_epoch_ms(utils::to_epoch_ms(utils::now()));

        std::vector<std::string> placeholders;
        placeholders.reserve(spans.size());
        for (const auto& span : spans) {
            auto placeholder = strategy_.substitute(span, ctx);
            if (!mapping.find(placeholder)) {
                mapping.entries.push_back(MappingEntry{placeholder, span.value, span.category});
            }
            placeholders.push_back(std::move(placeholder));
        }

        // Right-to-left so earlier offsets stay valid
        std::string anon(prompt);
        for (size_t i = spans.size(); i-- > 0;) {
            anon.replace(spans[i].start, spans[i].length(), placeholders[i]);
        }
        const size_t replaced = spans.size();
        scrub_spans(spans);

        auto created = store_->create(mapping);
        if (created.is_error()) {
            mapping.scrub();
            log_warn(std::format("anonymize failed: {} ({})",
                error_category_to_string(created.error_category()), created.error_message()));
            return Result<AnonymizeResult>::error_from(created);
        }

        AnonymizeResult result;
        result.anon_prompt = std::move(anon);
        result.map_id = created.value();
        result.replaced = replaced;

        if (signer_) {
            try {
                result.signature = signer_->sign(mapping);
            } catch (const std::exception& e) {
                mapping.scrub();
                // All-or-nothing: an unsigned mapping must not stay behind
                const auto removed = store_->remove(result.map_id);
                if (removed.is_error()) {
                    log_warn(std::format("could not remove unsigned mapping {}: {}",
                        result.map_id, removed.error_message()));
                }
                return Result<AnonymizeResult>::error(ErrorCategory::INTERNAL_ERROR,
                    std::format("signing failed: {}", e.what()));
            }
        }
        mapping.scrub();

        log_info(std::format("anonymize: map_id={} spans={} strategy={}",
            result.map_id, result.replaced, strategy_to_string(strategy_.kind())));
        return Result<AnonymizeResult>::ok(std::move(result));

    } catch (const std::exception& e) {
        scrub_spans(spans);
        mapping.scrub();
        return Result<AnonymizeResult>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("anonymize failed: {}", e.what()));
    }
}

Result<std::string> AnonEngine::deanonymize(std::string_view output, std::string_view map_id,
                                            std::optional<std::string_view> signature) {
    if (state() != State::READY) {
        return lifecycle_error<std::string>();
    }
    if (output.empty()) {
        return Result<std::string>::error(ErrorCategory::INVALID_INPUT, "output must not be empty");
    }
    if (map_id.empty()) {
        return Result<std::string>::error(ErrorCategory::INVALID_INPUT, "map_id must not be empty");
    }

    try {
        const std::string id(map_id);
        auto fetched = store_->get(id);
        if (fetched.is_error()) {
            if (fetched.error_category() == ErrorCategory::MAPPING_NOT_FOUND) {
                log_info(std::format("mapping_not_found: map_id={}", id));
            } else {
                log_warn(std::format("deanonymize failed: {} ({})",
                    error_category_to_string(fetched.error_category()), fetched.error_message()));
            }
            return Result<std::string>::error_from(fetched);
        }

        Mapping mapping = std::move(fetched.value());
        if (signer_) {
            if (!signature || signature->empty()) {
                mapping.scrub();
                log_warn(std::format("signature_invalid: map_id={} reason=missing", id));
                return Result<std::string>::error(ErrorCategory::SIGNATURE_INVALID,
                    "signature required");
            }
            if (!signer_->verify(mapping, *signature)) {
                mapping.scrub();
                log_warn(std::format("signature_invalid: map_id={} reason=mismatch", id));
                return Result<std::string>::error(ErrorCategory::SIGNATURE_INVALID,
                    "signature verification failed");
            }
        }

        if (mapping.map_id != id) {
            mapping.scrub();
            log_warn(std::format("deanonymize: store returned a different mapping for map_id={}", id));
            return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                "stored mapping does not match the requested map_id");
        }

        size_t restored = 0;
        auto text = PlaceholderStrategy::restore(output, mapping, &restored);
        const size_t total = mapping.entries.size();
        mapping.scrub();

        log_info(std::format("deanonymize: map_id={} restored={} entries={}", id, restored, total));
        return Result<std::string>::ok(std::move(text));

    } catch (const std::exception& e) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("deanonymize failed: {}", e.what()));
    }
}

Result<bool> AnonEngine::delete_mapping(std::string_view map_id) {
    if (state() != State::READY) {
        return lifecycle_error<bool>();
    }
    if (map_id.empty()) {
        return Result<bool>::error(ErrorCategory::INVALID_INPUT, "map_id must not be empty");
    }

    auto removed = store_->remove(std::string(map_id));
    if (removed.is_ok()) {
        log_info(std::format("delete_mapping: map_id={} removed={}",
            map_id, utils::booltostr(removed.value())));
    }
    return removed;
}

bool AnonEngine::health_check() {
    try {
        if (state() != State::READY) return false;

        auto anon = anonymize(kHealthProbe);
        if (anon.is_error()) {
            log_warn(std::format("health_check: anonymize failed ({})",
                error_category_to_string(anon.error_category())));
            return false;
        }

        const auto& a = anon.value();
        std::optional<std::string_view> sig;
        if (a.signature) sig = *a.signature;

        auto restored = deanonymize(a.anon_prompt, a.map_id, sig);
        const bool healthy = restored.is_ok() &&
                             restored.value() == kHealthProbe &&
                             a.anon_prompt != kHealthProbe;

        const auto removed = store_->remove(a.map_id);
        if (removed.is_error()) {
            log_warn(std::format("health_check: probe mapping not removed ({})",
                error_category_to_string(removed.error_category())));
        }

        if (!healthy) {
            log_warn("health_check: round trip mismatch");
        }
        return healthy;
    } catch (const std::exception& e) {
        log_warn(std::format("health_check: {}", e.what()));
        return false;
    }
}

EngineInfo AnonEngine::info() const {
    EngineInfo out;
    out.strategy = config_.strategy;
    out.storage = config_.storage;
    out.signatures_enabled = signer_ != nullptr;
    out.logging_enabled = config_.enable_logging;
    out.storage_healthy = state() == State::READY && store_->is_healthy();
    return out;
}

void AnonEngine::dispose() {
    const auto prev = state_.exchange(State::DISPOSED, std::memory_order_acq_rel);
    if (prev == State::DISPOSED) return;

    if (store_) {
        store_->dispose();
    }
    log_info("engine disposed");
}

// ============================================================================
// Logging
// ============================================================================

void AnonEngine::log_info(const std::string& msg) const {
    if (config_.enable_logging) {
        utils::log::info(msg);
    }
}

void AnonEngine::log_warn(const std::string& msg) const {
    if (config_.enable_logging) {
        utils::log::warn(msg);
    }
}

} // namespace anonproxy
