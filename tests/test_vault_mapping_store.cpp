#include <catch2/catch_test_macros.hpp>
#include "storage/vault_mapping_store.hpp"
#include "mocks/fake_vault_server.hpp"
#include "mocks/mock_key_manager.hpp"

using namespace anonproxy;
using anonproxy::testing::FakeVaultServer;
using anonproxy::testing::MockKeyManager;

namespace {

VaultStoreConfig vault_config(const FakeVaultServer& server) {
    VaultStoreConfig cfg;
    cfg.address = server.address();
    cfg.token = server.token();
    cfg.timeout_ms = 2000;
    cfg.verify_tls = false;
    return cfg;
}

Mapping make_mapping() {
    Mapping m;
    m.strategy = StrategyKind::HASH_SALT;
    m.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000));
    m.entries = {
        {"__ANON_CREDENTIAL_0011223344556677__", "sk-1234567890abcdef", Category::CREDENTIAL},
        {"__ANON_EMAIL_8899aabbccddeeff__", "admin@company.com", Category::EMAIL},
    };
    return m;
}

} // anonymous namespace

// ============================================================================
// Paths
// ============================================================================

TEST_CASE("VaultMappingStore: KV v2 paths", "[store][vault]") {
    VaultStoreConfig cfg;
    cfg.address = "http://127.0.0.1:8200/";
    cfg.mount = "/kv/";
    cfg.path_prefix = "/team/anon/";
    VaultMappingStore store(cfg, std::make_shared<MockKeyManager>());

    CHECK(store.data_path("abc") == "/v1/kv/data/team/anon/abc");
    CHECK(store.metadata_path("abc") == "/v1/kv/metadata/team/anon/abc");

    cfg.path_prefix = "";
    VaultMappingStore flat(cfg, std::make_shared<MockKeyManager>());
    CHECK(flat.data_path("abc") == "/v1/kv/data/abc");
}

// ============================================================================
// Against an in-process Vault
// ============================================================================

TEST_CASE("VaultMappingStore: create then get", "[store][vault]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    auto m = make_mapping();
    const auto id = store.create(m);
    REQUIRE(id.is_ok());
    CHECK(is_valid_map_id(id.value()));
    CHECK(m.map_id == id.value());
    CHECK(server.secret_count() == 1);

    const auto got = store.get(id.value());
    REQUIRE(got.is_ok());
    CHECK(got.value().map_id == id.value());
    CHECK(got.value().created_at == m.created_at);
    REQUIRE(got.value().entries.size() == 2);
    CHECK(got.value().entries[0].original == "sk-1234567890abcdef");
    CHECK(got.value().entries[1].placeholder == "__ANON_EMAIL_8899aabbccddeeff__");
}

TEST_CASE("VaultMappingStore: originals never reach Vault in plaintext", "[store][vault][security]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    auto m = make_mapping();
    REQUIRE(store.create(m).is_ok());

    const auto body = server.last_write_body();
    CHECK(body.find("MENC:v1:") != std::string::npos);
    CHECK(body.find(R"("cas":0)") != std::string::npos);
    CHECK(body.find("sk-1234567890abcdef") == std::string::npos);
    CHECK(body.find("admin@company.com") == std::string::npos);
    CHECK(body.find("__ANON_EMAIL_") == std::string::npos);
}

TEST_CASE("VaultMappingStore: check-and-set conflict regenerates the id", "[store][vault]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    server.force_cas_conflicts(2);
    auto m = make_mapping();
    const auto id = store.create(m);
    REQUIRE(id.is_ok());
    CHECK(server.write_count() == 3);
    CHECK(server.secret_count() == 1);
    CHECK(store.get(id.value()).is_ok());
}

TEST_CASE("VaultMappingStore: persistent conflicts give up", "[store][vault]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    server.force_cas_conflicts(kMaxIdAttempts);
    auto m = make_mapping();
    const auto id = store.create(m);
    REQUIRE(id.is_error());
    CHECK(id.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK(m.map_id.empty());
    CHECK(server.secret_count() == 0);
}

TEST_CASE("VaultMappingStore: unknown and malformed ids", "[store][vault]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    CHECK(store.get("00000000000000000000000000000000").error_category() ==
          ErrorCategory::MAPPING_NOT_FOUND);
    CHECK(store.get("../../sys/raw").error_category() == ErrorCategory::MAPPING_NOT_FOUND);
    CHECK_FALSE(store.remove("../../sys/raw").value());
}

TEST_CASE("VaultMappingStore: expired mappings are deleted on read", "[store][vault][ttl]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    auto m = make_mapping();
    const auto id = store.create(m).value();

    server.expire_all();
    CHECK(store.get(id).error_category() == ErrorCategory::MAPPING_NOT_FOUND);
    CHECK(server.delete_count() == 1);
    CHECK(server.secret_count() == 0);
}

TEST_CASE("VaultMappingStore: remove", "[store][vault]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    auto m = make_mapping();
    const auto id = store.create(m).value();

    const auto removed = store.remove(id);
    REQUIRE(removed.is_ok());
    CHECK(removed.value());
    CHECK(store.get(id).error_category() == ErrorCategory::MAPPING_NOT_FOUND);
}

TEST_CASE("VaultMappingStore: backend failures", "[store][vault][errors]") {
    FakeVaultServer server;

    SECTION("5xx") {
        VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());
        auto m = make_mapping();
        const auto id = store.create(m).value();

        server.set_fail_status(503);
        CHECK(store.get(id).error_category() == ErrorCategory::BACKEND_UNAVAILABLE);
        auto other = make_mapping();
        CHECK(store.create(other).error_category() == ErrorCategory::BACKEND_UNAVAILABLE);
        CHECK(store.remove(id).error_category() == ErrorCategory::BACKEND_UNAVAILABLE);
        CHECK_FALSE(store.is_healthy());

        server.set_fail_status(0);
        CHECK(store.get(id).is_ok());
    }

    SECTION("wrong token") {
        auto cfg = vault_config(server);
        cfg.token = "wrong-token";
        VaultMappingStore store(cfg, std::make_shared<MockKeyManager>());
        auto m = make_mapping();
        CHECK(store.create(m).error_category() == ErrorCategory::BACKEND_UNAVAILABLE);
    }

    SECTION("unreachable") {
        VaultStoreConfig cfg;
        cfg.address = "http://127.0.0.1:1";
        cfg.token = "t";
        cfg.timeout_ms = 500;
        VaultMappingStore store(cfg, std::make_shared<MockKeyManager>());
        auto m = make_mapping();
        CHECK(store.create(m).error_category() == ErrorCategory::BACKEND_UNAVAILABLE);
        CHECK(store.get("00000000000000000000000000000000").error_category() ==
              ErrorCategory::BACKEND_UNAVAILABLE);
        CHECK_FALSE(store.is_healthy());
    }
}

TEST_CASE("VaultMappingStore: record sealed under a lost key", "[store][vault]") {
    FakeVaultServer server;
    auto km = std::make_shared<MockKeyManager>();
    VaultMappingStore store(vault_config(server), km);

    auto m = make_mapping();
    const auto id = store.create(m).value();

    VaultMappingStore other_key(vault_config(server), std::make_shared<MockKeyManager>(7));
    CHECK(other_key.get(id).error_category() == ErrorCategory::INTERNAL_ERROR);

    km->clear();
    CHECK_FALSE(store.is_healthy());
    auto next = make_mapping();
    CHECK(store.create(next).error_category() == ErrorCategory::INTERNAL_ERROR);
}

TEST_CASE("VaultMappingStore: health and dispose", "[store][vault][lifecycle]") {
    FakeVaultServer server;
    VaultMappingStore store(vault_config(server), std::make_shared<MockKeyManager>());

    CHECK(store.is_healthy());
    store.dispose();
    store.dispose();

    CHECK_FALSE(store.is_healthy());
    auto m = make_mapping();
    CHECK(store.create(m).error_category() == ErrorCategory::LIFECYCLE_ERROR);
    CHECK(store.get("00000000000000000000000000000000").error_category() ==
          ErrorCategory::LIFECYCLE_ERROR);
    CHECK(store.remove("00000000000000000000000000000000").error_category() ==
          ErrorCategory::LIFECYCLE_ERROR);
}
