#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

using namespace anonproxy;

namespace {

bool has_error(const std::vector<std::string>& errors, std::string_view needle) {
    for (const auto& e : errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

struct TempDir {
    std::filesystem::path path;
    TempDir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("anon_proxy_config_" + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::string write(const std::string& name, const std::string& content) const {
        const auto p = path / name;
        std::ofstream(p) << content;
        return p.string();
    }
};

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.strategy == StrategyKind::HASH_SALT);
    CHECK(cfg.storage == StorageKind::MEMORY);
    CHECK_FALSE(cfg.enable_signatures);
    CHECK_FALSE(cfg.signature_secret.has_value());
    CHECK(cfg.max_input_bytes == 1024 * 1024);
    CHECK(cfg.detector.min_length == 8);
    CHECK(cfg.memory.max_entries == 10000);
    CHECK(cfg.memory.ttl_seconds == 3600);
    CHECK(cfg.vault.mount == "secret");
}

TEST_CASE("ConfigLoader: every section", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[engine]
strategy = "embeddings"
storage = "vault"
enable_signatures = true
signature_secret = "s3cr3t"
enable_logging = true
max_input_bytes = 4096

[detector]
min_length = 10
exclusions = ["corp.internal"]
disabled_rules = ["phone", "uuid"]
case_sensitive = true

[[detector.custom_rules]]
name = "employee_id"
pattern = "\\bEMP-[0-9]{6}\\b"
category = "identifier"

[[detector.custom_rules]]
name = "ticket"
pattern = "TCK-[0-9]+"
category = "credential"

[storage.memory]
max_entries = 50
ttl_seconds = 0

[storage.vault]
address = "https://vault.internal:8200"
token = "hvs.test"
mount = "kv"
path_prefix = "anon"
timeout_ms = 750
verify_tls = false
ttl_seconds = 600
key_provider = "file"
key_file = "/etc/anon-proxy/mapping.keys"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.strategy == StrategyKind::EMBEDDINGS);
    CHECK(cfg.storage == StorageKind::VAULT);
    CHECK(cfg.enable_signatures);
    CHECK(cfg.signature_secret == std::optional<std::string>("s3cr3t"));
    CHECK(cfg.enable_logging);
    CHECK(cfg.max_input_bytes == 4096);

    CHECK(cfg.detector.min_length == 10);
    CHECK(cfg.detector.exclusions == std::vector<std::string>{"corp.internal"});
    CHECK(cfg.detector.disabled_rules.size() == 2);
    CHECK(cfg.detector.case_sensitive);
    REQUIRE(cfg.detector.custom_rules.size() == 2);
    CHECK(cfg.detector.custom_rules[0].name == "employee_id");
    CHECK(cfg.detector.custom_rules[0].pattern == R"(\bEMP-[0-9]{6}\b)");
    CHECK(cfg.detector.custom_rules[1].category == "credential");

    CHECK(cfg.memory.max_entries == 50);
    CHECK(cfg.memory.ttl_seconds == 0);

    CHECK(cfg.vault.address == "https://vault.internal:8200");
    CHECK(cfg.vault.token == "hvs.test");
    CHECK(cfg.vault.mount == "kv");
    CHECK(cfg.vault.path_prefix == "anon");
    CHECK(cfg.vault.timeout_ms == 750);
    CHECK_FALSE(cfg.vault.verify_tls);
    CHECK(cfg.vault.ttl_seconds == 600);
    CHECK(cfg.vault.key_provider == "file");
    CHECK(cfg.vault.key_file == "/etc/anon-proxy/mapping.keys");
}

TEST_CASE("ConfigLoader: unknown enum values are rejected", "[config]") {
    auto r1 = ConfigLoader::load_from_string("[engine]\nstrategy = \"rot13\"\n");
    CHECK_FALSE(r1.success);
    CHECK(r1.error_message.find("engine.strategy") != std::string::npos);

    auto r2 = ConfigLoader::load_from_string("[engine]\nstorage = \"redis\"\n");
    CHECK_FALSE(r2.success);
    CHECK(r2.error_message.find("engine.storage") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML and negative numbers", "[config]") {
    CHECK_FALSE(ConfigLoader::load_from_string("[engine\nstrategy = ").success);

    const auto r = ConfigLoader::load_from_string("[storage.memory]\nttl_seconds = -5\n");
    CHECK_FALSE(r.success);
    CHECK(r.error_message.find("storage.memory.ttl_seconds") != std::string::npos);
}

TEST_CASE("ConfigLoader: environment expansion", "[config][env]") {
    ::setenv("ANON_PROXY_TEST_SECRET", "from-env-secret", 1);
    const auto r = ConfigLoader::load_from_string(R"(
[engine]
enable_signatures = true
signature_secret = "${ANON_PROXY_TEST_SECRET}"
)");
    ::unsetenv("ANON_PROXY_TEST_SECRET");

    REQUIRE(r.success);
    CHECK(r.config.signature_secret == std::optional<std::string>("from-env-secret"));
}

TEST_CASE("ConfigLoader: unset variable leaves the secret missing", "[config][env]") {
    ::unsetenv("ANON_PROXY_TEST_UNSET_SECRET");
    const auto r = ConfigLoader::load_from_string(R"(
[engine]
enable_signatures = true
signature_secret = "${ANON_PROXY_TEST_UNSET_SECRET}"
)");

    CHECK_FALSE(r.success);
    CHECK(r.error_message.find("engine.signature_secret") != std::string::npos);
}

TEST_CASE("ConfigLoader: vault address and token fallbacks", "[config][env]") {
    ::unsetenv("VAULT_ADDR");
    ::setenv("VAULT_ENDPOINT", "http://vault-endpoint:8200", 1);
    ::setenv("VAULT_TOKEN", "hvs.env-token", 1);

    EngineConfig cfg;
    cfg.storage = StorageKind::VAULT;
    ConfigLoader::apply_env_fallbacks(cfg);
    CHECK(cfg.vault.address == "http://vault-endpoint:8200");
    CHECK(cfg.vault.token == "hvs.env-token");

    ::setenv("VAULT_ADDR", "http://vault-addr:8200", 1);
    EngineConfig preferred;
    ConfigLoader::apply_env_fallbacks(preferred);
    CHECK(preferred.vault.address == "http://vault-addr:8200");

    EngineConfig explicit_cfg;
    explicit_cfg.vault.address = "https://configured:8200";
    ConfigLoader::apply_env_fallbacks(explicit_cfg);
    CHECK(explicit_cfg.vault.address == "https://configured:8200");

    ::unsetenv("VAULT_ADDR");
    ::unsetenv("VAULT_ENDPOINT");
    ::unsetenv("VAULT_TOKEN");

    EngineConfig fallback;
    ConfigLoader::apply_env_fallbacks(fallback);
    CHECK(fallback.vault.address == "http://127.0.0.1:8200");
    CHECK(fallback.vault.token.empty());
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: validate_config", "[config][validation]") {
    SECTION("default config is valid") {
        CHECK(ConfigLoader::validate_config(EngineConfig{}).empty());
    }

    SECTION("signatures without a secret") {
        EngineConfig cfg;
        cfg.enable_signatures = true;
        CHECK(has_error(ConfigLoader::validate_config(cfg), "engine.signature_secret"));
        cfg.signature_secret = "";
        CHECK(has_error(ConfigLoader::validate_config(cfg), "engine.signature_secret"));
    }

    SECTION("zero limits") {
        EngineConfig cfg;
        cfg.max_input_bytes = 0;
        cfg.memory.max_entries = 0;
        const auto errors = ConfigLoader::validate_config(cfg);
        CHECK(has_error(errors, "engine.max_input_bytes"));
        CHECK(has_error(errors, "storage.memory.max_entries"));
    }

    SECTION("bad custom rules") {
        EngineConfig cfg;
        cfg.detector.custom_rules.push_back({"", "x+", "identifier"});
        cfg.detector.custom_rules.push_back({"bad_regex", "(unclosed", "identifier"});
        cfg.detector.custom_rules.push_back({"bad_category", "y+", "planet"});
        const auto errors = ConfigLoader::validate_config(cfg);
        CHECK(has_error(errors, "custom_rules[0].name"));
        CHECK(has_error(errors, "custom_rules[1].pattern"));
        CHECK(has_error(errors, "custom_rules[2].category"));
    }

    SECTION("vault settings only checked for vault storage") {
        EngineConfig cfg;
        cfg.vault.mount = "";
        CHECK(ConfigLoader::validate_config(cfg).empty());

        cfg.storage = StorageKind::VAULT;
        cfg.vault.timeout_ms = 0;
        cfg.vault.key_provider = "kms";
        const auto errors = ConfigLoader::validate_config(cfg);
        CHECK(has_error(errors, "storage.vault.address"));
        CHECK(has_error(errors, "storage.vault.token"));
        CHECK(has_error(errors, "storage.vault.mount"));
        CHECK(has_error(errors, "storage.vault.timeout_ms"));
        CHECK(has_error(errors, "storage.vault.key_provider"));
    }

    SECTION("file key provider needs a path") {
        EngineConfig cfg;
        cfg.storage = StorageKind::VAULT;
        cfg.vault.address = "http://127.0.0.1:8200";
        cfg.vault.token = "t";
        cfg.vault.key_provider = "file";
        CHECK(has_error(ConfigLoader::validate_config(cfg), "storage.vault.key_file"));
    }

    SECTION("errors never echo the secret") {
        EngineConfig cfg;
        cfg.storage = StorageKind::VAULT;
        cfg.vault.token = "hvs.super-secret-token";
        cfg.vault.mount = "";
        for (const auto& e : ConfigLoader::validate_config(cfg)) {
            CHECK(e.find("hvs.super-secret-token") == std::string::npos);
        }
    }
}

// ============================================================================
// Files and includes
// ============================================================================

TEST_CASE("ConfigLoader: load_from_file with include", "[config][file]") {
    TempDir dir;
    dir.write("rules.toml", R"(
[detector]
min_length = 12

[[detector.custom_rules]]
name = "employee_id"
pattern = "EMP-[0-9]{6}"
category = "identifier"
)");
    const auto main_path = dir.write("anon_proxy.toml", R"(
include = ["rules.toml"]

[engine]
strategy = "embeddings"

[detector]
min_length = 9
)");

    const auto r = ConfigLoader::load_from_file(main_path);
    REQUIRE(r.success);
    CHECK(r.config.strategy == StrategyKind::EMBEDDINGS);
    // Including file wins for scalars
    CHECK(r.config.detector.min_length == 9);
    REQUIRE(r.config.detector.custom_rules.size() == 1);
    CHECK(r.config.detector.custom_rules[0].name == "employee_id");
}

TEST_CASE("ConfigLoader: circular include", "[config][file]") {
    TempDir dir;
    dir.write("a.toml", "include = [\"b.toml\"]\n");
    const auto b = dir.write("b.toml", "include = [\"a.toml\"]\n");

    const auto r = ConfigLoader::load_from_file(b);
    CHECK_FALSE(r.success);
}

TEST_CASE("ConfigLoader: missing file", "[config][file]") {
    const auto r = ConfigLoader::load_from_file("/nonexistent/anon_proxy.toml");
    CHECK_FALSE(r.success);
    CHECK(r.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: shipped sample config parses", "[config][file]") {
    ::setenv("ANON_PROXY_SIGNATURE_SECRET", "sample-secret", 1);
    const auto r = ConfigLoader::load_from_file("config/anon_proxy.toml");
    ::unsetenv("ANON_PROXY_SIGNATURE_SECRET");

    REQUIRE(r.success);
    CHECK(r.config.enable_signatures);
    REQUIRE(r.config.detector.custom_rules.size() == 1);
    CHECK(r.config.detector.custom_rules[0].name == "employee_id");
}
