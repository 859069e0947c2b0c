// Harbor Load Balancer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../src/gateway/connection_pool.hpp"
#include "../../src/gateway/errors.hpp"
#include "../../src/gateway/health_checker.hpp"
#include "../../src/gateway/load_balancer.hpp"
#include "../../src/gateway/upstream.hpp"

using namespace harbor::gateway;

namespace {

UpstreamServerSpec spec(std::string host, uint32_t weight = 1,
                        ServerRole role = ServerRole::Primary) {
    UpstreamServerSpec s;
    s.host = std::move(host);
    s.port = 80;
    s.weight = weight;
    s.role = role;
    return s;
}

std::shared_ptr<UpstreamPool> make_pool(std::vector<UpstreamServerSpec> servers,
                                        BalancingPolicy policy) {
    PoolOptions options;
    options.policy = policy;
    options.health.max_fails = 1;
    options.health.fail_timeout = std::chrono::seconds(30);
    return std::make_shared<UpstreamPool>("test", std::move(servers), options);
}

std::string pick(UpstreamPool& pool, std::string_view key = "") {
    UpstreamServer* server = pool.select(key, ExcludedServers{});
    return server ? server->host() : std::string("<none>");
}

void mark_unhealthy(HealthChecker& checker, UpstreamPool& pool, std::string_view address) {
    UpstreamServer* server = pool.find(address);
    REQUIRE(server != nullptr);
    checker.report_failure(pool, *server, ProxyErrc::connect_refused);
    REQUIRE(server->state() == ServerState::Unhealthy);
}

}  // namespace

TEST_CASE("Round robin cycles through servers", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a"), spec("b")}, BalancingPolicy::RoundRobin);

    REQUIRE(pick(*pool) == "a");
    REQUIRE(pick(*pool) == "b");
    REQUIRE(pick(*pool) == "a");
    REQUIRE(pick(*pool) == "b");
}

TEST_CASE("Round robin spreads many picks evenly", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a"), spec("b"), spec("c")}, BalancingPolicy::RoundRobin);

    // 100 picks over 3 servers: each gets floor(100/3) or ceil(100/3)
    std::map<std::string, int> counts;
    for (int i = 0; i < 100; ++i) {
        counts[pick(*pool)]++;
    }
    REQUIRE(counts.size() == 3);
    for (const auto& [host, count] : counts) {
        REQUIRE(count >= 33);
        REQUIRE(count <= 34);
    }

    for (int i = 0; i < 200; ++i) {
        counts[pick(*pool)]++;
    }
    REQUIRE(counts["a"] == 100);
    REQUIRE(counts["b"] == 100);
    REQUIRE(counts["c"] == 100);
}

TEST_CASE("Round robin skips excluded servers", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a"), spec("b"), spec("c")}, BalancingPolicy::RoundRobin);

    ExcludedServers excluded;
    excluded.insert(pool->find("b:80"));

    for (int i = 0; i < 6; ++i) {
        UpstreamServer* server = pool->select("", excluded);
        REQUIRE(server != nullptr);
        REQUIRE(server->host() != "b");
    }
}

TEST_CASE("Weighted round robin honours 3:2:1 within one cycle", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a", 3), spec("b", 2), spec("c", 1)},
                          BalancingPolicy::WeightedRoundRobin);

    std::vector<std::string> sequence;
    std::map<std::string, int> counts;
    for (int i = 0; i < 6; ++i) {
        sequence.push_back(pick(*pool));
        counts[sequence.back()]++;
    }
    REQUIRE(counts["a"] == 3);
    REQUIRE(counts["b"] == 2);
    REQUIRE(counts["c"] == 1);

    // No server repeats back to back while another has not been picked yet
    for (size_t i = 1; i < sequence.size(); ++i) {
        if (sequence[i] != sequence[i - 1]) {
            continue;
        }
        std::map<std::string, int> seen;
        for (size_t j = 0; j < i; ++j) {
            seen[sequence[j]]++;
        }
        REQUIRE(seen.size() == 3);
    }
}

TEST_CASE("Smooth weighted round robin interleaves picks", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a", 5), spec("b", 1), spec("c", 1)},
                          BalancingPolicy::WeightedRoundRobin);

    std::vector<std::string> sequence;
    for (int i = 0; i < 7; ++i) {
        sequence.push_back(pick(*pool));
    }
    REQUIRE(sequence == std::vector<std::string>{"a", "a", "b", "a", "c", "a", "a"});

    // The pattern repeats every total-weight picks
    std::map<std::string, int> counts;
    for (int i = 0; i < 70; ++i) {
        counts[pick(*pool)]++;
    }
    REQUIRE(counts["a"] == 50);
    REQUIRE(counts["b"] == 10);
    REQUIRE(counts["c"] == 10);
}

TEST_CASE("Least connections prefers the idlest server", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a"), spec("b"), spec("c")}, BalancingPolicy::LeastConnections);

    UpstreamServer& a = *pool->find("a:80");
    UpstreamServer& b = *pool->find("b:80");

    ConnectionManager::ActiveAttempt a1(a);
    ConnectionManager::ActiveAttempt a2(a);
    ConnectionManager::ActiveAttempt b1(b);

    REQUIRE(a.active_connections() == 2);
    REQUIRE(b.active_connections() == 1);
    REQUIRE(pick(*pool) == "c");

    {
        ConnectionManager::ActiveAttempt c1(*pool->find("c:80"));
        ConnectionManager::ActiveAttempt c2(*pool->find("c:80"));
        REQUIRE(pick(*pool) == "b");
    }
    REQUIRE(pool->find("c:80")->active_connections() == 0);
}

TEST_CASE("IP hash is stable per key", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a"), spec("b"), spec("c")}, BalancingPolicy::IpHash);

    std::string first = pick(*pool, "203.0.113.7");
    for (int i = 0; i < 20; ++i) {
        REQUIRE(pick(*pool, "203.0.113.7") == first);
    }

    // Different clients spread over more than one server
    std::map<std::string, int> counts;
    for (int i = 0; i < 100; ++i) {
        counts[pick(*pool, "10.0.0." + std::to_string(i))]++;
    }
    REQUIRE(counts.size() > 1);
}

TEST_CASE("Consistent hash ring", "[gateway][load_balancer]") {
    SECTION("ring holds points per unit of weight") {
        auto pool = make_pool({spec("a", 1), spec("b", 2)}, BalancingPolicy::ConsistentHash);
        std::vector<UpstreamServer*> group;
        for (const auto& server : pool->servers()) {
            group.push_back(server.get());
        }
        ConsistentHashBalancer balancer(group);
        REQUIRE(balancer.ring_size() <= 3 * ConsistentHashBalancer::kPointsPerWeight);
        REQUIRE(balancer.ring_size() > 2 * ConsistentHashBalancer::kPointsPerWeight);
    }

    SECTION("losing a server only moves its own keys") {
        auto pool =
            make_pool({spec("a"), spec("b"), spec("c")}, BalancingPolicy::ConsistentHash);
        HealthChecker checker({pool});

        std::map<std::string, std::string> before;
        for (int i = 0; i < 200; ++i) {
            std::string key = "user-" + std::to_string(i);
            before[key] = pick(*pool, key);
        }

        mark_unhealthy(checker, *pool, "b:80");

        for (const auto& [key, host] : before) {
            std::string after = pick(*pool, key);
            REQUIRE(after != "b");
            if (host != "b") {
                REQUIRE(after == host);
            }
        }
    }
}

TEST_CASE("Unhealthy servers are skipped", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a"), spec("b")}, BalancingPolicy::RoundRobin);
    HealthChecker checker({pool});

    mark_unhealthy(checker, *pool, "b:80");

    for (int i = 0; i < 5; ++i) {
        REQUIRE(pick(*pool) == "a");
    }
    REQUIRE(pool->has_eligible());

    mark_unhealthy(checker, *pool, "a:80");
    REQUIRE(pick(*pool) == "<none>");
    REQUIRE_FALSE(pool->has_eligible());
}

TEST_CASE("Backups serve only when no primary is eligible", "[gateway][load_balancer]") {
    auto pool = make_pool({spec("a"), spec("b"), spec("backup", 1, ServerRole::Backup)},
                          BalancingPolicy::RoundRobin);
    HealthChecker checker({pool});

    for (int i = 0; i < 6; ++i) {
        REQUIRE(pick(*pool) != "backup");
    }

    mark_unhealthy(checker, *pool, "a:80");
    REQUIRE(pick(*pool) == "b");

    mark_unhealthy(checker, *pool, "b:80");
    REQUIRE(pick(*pool) == "backup");
    REQUIRE(pool->has_eligible());

    SECTION("primaries excluded by the request also fall back to backups") {
        auto fresh = make_pool({spec("a"), spec("backup", 1, ServerRole::Backup)},
                               BalancingPolicy::RoundRobin);
        ExcludedServers excluded;
        excluded.insert(fresh->find("a:80"));
        UpstreamServer* server = fresh->select("", excluded);
        REQUIRE(server != nullptr);
        REQUIRE(server->role() == ServerRole::Backup);
    }
}

TEST_CASE("Servers at max_connections are not selected", "[gateway][load_balancer]") {
    UpstreamServerSpec limited = spec("a");
    limited.max_connections = 1;
    auto pool = make_pool({limited, spec("b")}, BalancingPolicy::RoundRobin);

    ConnectionManager::ActiveAttempt busy(*pool->find("a:80"));
    for (int i = 0; i < 4; ++i) {
        REQUIRE(pick(*pool) == "b");
    }
}

TEST_CASE("Pool construction validates servers", "[gateway][load_balancer]") {
    REQUIRE_THROWS_AS(make_pool({spec("backup", 1, ServerRole::Backup)},
                                BalancingPolicy::RoundRobin),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(make_pool({spec("a", 0)}, BalancingPolicy::RoundRobin),
                      std::invalid_argument);
    REQUIRE(parse_balancing_policy("least_connections") == BalancingPolicy::LeastConnections);
    REQUIRE_FALSE(parse_balancing_policy("fastest").has_value());
}
