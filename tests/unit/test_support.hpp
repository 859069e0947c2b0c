// Harbor test helpers: scripted upstream transport and pool builders

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../src/gateway/errors.hpp"
#include "../../src/gateway/upstream.hpp"
#include "../../src/gateway/upstream_client.hpp"
#include "../../src/http/http.hpp"

namespace harbor::testing {

/// Transport whose answers come from a callback instead of the network
class ScriptedTransport : public gateway::UpstreamTransport {
public:
    using Script = std::function<gateway::ExchangeResult(gateway::UpstreamServer&,
                                                         const http::Request&,
                                                         const gateway::ExchangeTimeouts&)>;

    explicit ScriptedTransport(Script script = {}) : script_(std::move(script)) {}

    gateway::ExchangeResult exchange(gateway::UpstreamServer& server, const http::Request& request,
                                     const gateway::ExchangeTimeouts& timeouts,
                                     const core::CancellationToken&) override {
        calls_.fetch_add(1);
        {
            std::lock_guard lock(mutex_);
            seen_.push_back(server.host());
        }
        Script script;
        {
            std::lock_guard lock(mutex_);
            script = script_;
        }
        if (!script) {
            return ok(default_body(server));
        }
        return script(server, request, timeouts);
    }

    void set_script(Script script) {
        std::lock_guard lock(mutex_);
        script_ = std::move(script);
    }

    [[nodiscard]] int calls() const { return calls_.load(); }

    /// Hosts contacted, in order
    [[nodiscard]] std::vector<std::string> seen() const {
        std::lock_guard lock(mutex_);
        return seen_;
    }

    void clear_seen() {
        std::lock_guard lock(mutex_);
        seen_.clear();
    }

    static gateway::ExchangeResult ok(std::string body, uint16_t status = 200,
                                      http::Headers headers = {}) {
        gateway::ExchangeResult result;
        result.response.status = static_cast<http::StatusCode>(status);
        result.response.headers = std::move(headers);
        result.response.body = std::move(body);
        return result;
    }

    static gateway::ExchangeResult failure(gateway::ProxyErrc error) {
        gateway::ExchangeResult result;
        result.error = error;
        return result;
    }

private:
    static std::string default_body(const gateway::UpstreamServer& server) {
        return "hello from " + server.host();
    }

    mutable std::mutex mutex_;
    Script script_;
    std::atomic<int> calls_{0};
    std::vector<std::string> seen_;
};

inline gateway::UpstreamServerSpec server_spec(std::string host, uint32_t weight = 1,
                                               gateway::ServerRole role =
                                                   gateway::ServerRole::Primary) {
    gateway::UpstreamServerSpec spec;
    spec.host = std::move(host);
    spec.port = 80;
    spec.weight = weight;
    spec.role = role;
    return spec;
}

inline std::shared_ptr<gateway::UpstreamPool> make_pool(
    std::vector<gateway::UpstreamServerSpec> servers, uint32_t max_fails = 3,
    gateway::BalancingPolicy policy = gateway::BalancingPolicy::RoundRobin) {
    gateway::PoolOptions options;
    options.policy = policy;
    options.health.max_fails = max_fails;
    options.health.fail_timeout = std::chrono::seconds(30);
    return std::make_shared<gateway::UpstreamPool>("backend", std::move(servers), options);
}

inline http::Request make_request(http::Method method, std::string path,
                                  std::string client_ip = "192.0.2.10") {
    http::Request request;
    request.method = method;
    request.path = std::move(path);
    request.host = "app.example.com";
    request.client_ip = std::move(client_ip);
    return request;
}

}  // namespace harbor::testing
