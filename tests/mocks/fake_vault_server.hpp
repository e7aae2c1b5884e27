#pragma once

#include "core/json.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <atomic>
#include <cstdint>
#include <format>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace anonproxy::testing {

/**
 * @brief In-process HashiCorp Vault KV v2 subset on httplib::Server
 *
 * Serves POST/GET <mount>/data/<path>, DELETE <mount>/metadata/<path> and
 * GET /v1/sys/health on 127.0.0.1 with a random port. Honors options.cas = 0
 * and X-Vault-Token.
 */
class FakeVaultServer {
public:
    explicit FakeVaultServer(std::string token = "test-token") : token_(std::move(token)) {
        server_.Post(R"(/v1/([^/]+)/data/(.+))",
            [this](const httplib::Request& req, httplib::Response& res) { handle_write(req, res); });
        server_.Get(R"(/v1/([^/]+)/data/(.+))",
            [this](const httplib::Request& req, httplib::Response& res) { handle_read(req, res); });
        server_.Delete(R"(/v1/([^/]+)/metadata/(.+))",
            [this](const httplib::Request& req, httplib::Response& res) { handle_delete(req, res); });
        server_.Get("/v1/sys/health",
            [this](const httplib::Request&, httplib::Response& res) {
                if (const int s = fail_status_.load(); s != 0) {
                    res.status = s;
                    return;
                }
                res.set_content(R"({"initialized":true,"sealed":false,"standby":false})",
                                "application/json");
            });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeVaultServer() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    FakeVaultServer(const FakeVaultServer&) = delete;
    FakeVaultServer& operator=(const FakeVaultServer&) = delete;

    [[nodiscard]] std::string address() const {
        return std::format("http://127.0.0.1:{}", port_);
    }

    [[nodiscard]] const std::string& token() const { return token_; }

    // Every request answers with this status (0 = normal behaviour)
    void set_fail_status(int status) { fail_status_.store(status); }

    // The next n writes fail with a check-and-set conflict
    void force_cas_conflicts(int n) { forced_conflicts_.store(n); }

    // Rewrite every stored expires_at into the past
    void expire_all() {
        std::lock_guard lock(mutex_);
        for (auto& [path, secret] : secrets_) {
            secret.expires_at = 1;
        }
    }

    [[nodiscard]] size_t secret_count() const {
        std::lock_guard lock(mutex_);
        return secrets_.size();
    }

    [[nodiscard]] std::string last_write_body() const {
        std::lock_guard lock(mutex_);
        return last_write_body_;
    }

    [[nodiscard]] uint64_t write_count() const { return write_count_.load(); }
    [[nodiscard]] uint64_t delete_count() const { return delete_count_.load(); }

private:
    struct Secret {
        std::string payload;
        int64_t created_at = 0;
        int64_t expires_at = 0;
    };

    bool authorized(const httplib::Request& req, httplib::Response& res) const {
        if (req.get_header_value("X-Vault-Token") != token_) {
            res.status = 403;
            res.set_content(R"({"errors":["permission denied"]})", "application/json");
            return false;
        }
        if (const int s = fail_status_.load(); s != 0) {
            res.status = s;
            res.set_content(R"({"errors":["injected failure"]})", "application/json");
            return false;
        }
        return true;
    }

    static std::string key_of(const httplib::Request& req) {
        return std::format("{}/{}", req.matches[1].str(), req.matches[2].str());
    }

    void handle_write(const httplib::Request& req, httplib::Response& res) {
        if (!authorized(req, res)) return;
        write_count_.fetch_add(1);

        JsonValue doc;
        try {
            doc = JsonValue::parse(req.body);
        } catch (const JsonValue::parse_error&) {
            res.status = 400;
            res.set_content(R"({"errors":["failed to parse JSON input"]})", "application/json");
            return;
        }

        std::lock_guard lock(mutex_);
        last_write_body_ = req.body;

        const auto key = key_of(req);
        const bool cas_create = doc["options"].value<int64_t>("cas", -1) == 0;
        if (forced_conflicts_.load() > 0 || (cas_create && secrets_.contains(key))) {
            if (forced_conflicts_.load() > 0) forced_conflicts_.fetch_sub(1);
            res.status = 400;
            res.set_content(
                R"({"errors":["check-and-set parameter did not match the current version"]})",
                "application/json");
            return;
        }

        const auto data = doc["data"];
        Secret secret;
        secret.payload = data.value<std::string>("payload", "");
        secret.created_at = data.value<int64_t>("created_at", 0);
        secret.expires_at = data.value<int64_t>("expires_at", 0);
        secrets_[key] = std::move(secret);

        res.status = 200;
        res.set_content(R"({"data":{"version":1}})", "application/json");
    }

    void handle_read(const httplib::Request& req, httplib::Response& res) {
        if (!authorized(req, res)) return;

        std::lock_guard lock(mutex_);
        const auto it = secrets_.find(key_of(req));
        if (it == secrets_.end()) {
            res.status = 404;
            res.set_content(R"({"errors":[]})", "application/json");
            return;
        }

        res.status = 200;
        res.set_content(std::format(
            R"({{"data":{{"data":{{"payload":"{}","created_at":{},"expires_at":{}}},"metadata":{{"version":1}}}}}})",
            it->second.payload, it->second.created_at, it->second.expires_at),
            "application/json");
    }

    void handle_delete(const httplib::Request& req, httplib::Response& res) {
        if (!authorized(req, res)) return;
        delete_count_.fetch_add(1);

        std::lock_guard lock(mutex_);
        secrets_.erase(key_of(req));
        res.status = 204;
    }

    std::string token_;
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, Secret> secrets_;
    std::string last_write_body_;

    std::atomic<int> fail_status_{0};
    std::atomic<int> forced_conflicts_{0};
    std::atomic<uint64_t> write_count_{0};
    std::atomic<uint64_t> delete_count_{0};
};

} // namespace anonproxy::testing
