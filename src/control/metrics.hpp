// Harbor Metrics - Header
// Lock-free counters shared by all request threads

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace harbor::control {

/// Metrics snapshot at a point in time
struct MetricsSnapshot {
    // Request metrics
    uint64_t total_requests = 0;
    uint64_t total_errors = 0;
    uint64_t total_timeouts = 0;

    // Connection metrics
    uint64_t active_connections = 0;
    uint64_t total_connections = 0;
    uint64_t rejected_connections = 0;

    // Latency metrics (microseconds)
    uint64_t total_latency_us = 0;
    uint64_t min_latency_us = 0;
    uint64_t max_latency_us = 0;

    // Bandwidth metrics (bytes)
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;

    // HTTP status code counters
    uint64_t status_2xx = 0;
    uint64_t status_3xx = 0;
    uint64_t status_4xx = 0;
    uint64_t status_5xx = 0;

    // Proxy outcomes
    uint64_t upstream_attempts = 0;
    uint64_t upstream_retries = 0;
    uint64_t upstream_failures = 0;
    uint64_t rate_limited = 0;
    uint64_t no_healthy_upstream = 0;
    uint64_t client_disconnects = 0;

    // Cache outcomes
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    uint64_t cache_stale = 0;
    uint64_t cache_bypass = 0;
    uint64_t cache_store_failures = 0;
    uint64_t background_refreshes = 0;

    // Derived metrics
    [[nodiscard]] double error_rate() const noexcept {
        if (total_requests == 0) return 0.0;
        return static_cast<double>(total_errors) / static_cast<double>(total_requests);
    }

    [[nodiscard]] double avg_latency_us() const noexcept {
        if (total_requests == 0) return 0.0;
        return static_cast<double>(total_latency_us) / static_cast<double>(total_requests);
    }

    [[nodiscard]] double cache_hit_ratio() const noexcept {
        uint64_t lookups = cache_hits + cache_misses + cache_stale;
        if (lookups == 0) return 0.0;
        return static_cast<double>(cache_hits + cache_stale) / static_cast<double>(lookups);
    }
};

/// Process-wide metrics collector (lock-free)
class ProxyMetrics {
public:
    ProxyMetrics() = default;
    ~ProxyMetrics() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    ProxyMetrics(const ProxyMetrics&) = delete;
    ProxyMetrics& operator=(const ProxyMetrics&) = delete;
    ProxyMetrics(ProxyMetrics&&) = delete;
    ProxyMetrics& operator=(ProxyMetrics&&) = delete;

    void record_request() noexcept { bump(total_requests_); }
    void record_error() noexcept { bump(total_errors_); }
    void record_timeout() noexcept { bump(total_timeouts_); }

    void record_connection() noexcept {
        bump(total_connections_);
        bump(active_connections_);
    }
    void record_connection_close() noexcept {
        active_connections_.fetch_sub(1, std::memory_order_relaxed);
    }
    void record_connection_rejected() noexcept { bump(rejected_connections_); }

    /// Record request latency
    void record_latency(std::chrono::microseconds latency) noexcept {
        uint64_t latency_us = static_cast<uint64_t>(latency.count());

        total_latency_us_.fetch_add(latency_us, std::memory_order_relaxed);

        uint64_t current_min = min_latency_us_.load(std::memory_order_relaxed);
        while (latency_us < current_min || current_min == 0) {
            if (min_latency_us_.compare_exchange_weak(current_min, latency_us,
                std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }

        uint64_t current_max = max_latency_us_.load(std::memory_order_relaxed);
        while (latency_us > current_max) {
            if (max_latency_us_.compare_exchange_weak(current_max, latency_us,
                std::memory_order_relaxed, std::memory_order_relaxed)) {
                break;
            }
        }
    }

    void record_bytes_received(uint64_t bytes) noexcept {
        bytes_received_.fetch_add(bytes, std::memory_order_relaxed);
    }
    void record_bytes_sent(uint64_t bytes) noexcept {
        bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
    }

    /// Record HTTP status code
    void record_status_code(uint16_t status_code) noexcept {
        if (status_code >= 200 && status_code < 300) {
            bump(status_2xx_);
        } else if (status_code >= 300 && status_code < 400) {
            bump(status_3xx_);
        } else if (status_code >= 400 && status_code < 500) {
            bump(status_4xx_);
        } else if (status_code >= 500 && status_code < 600) {
            bump(status_5xx_);
        }
    }

    void record_upstream_attempt() noexcept { bump(upstream_attempts_); }
    void record_upstream_retry() noexcept { bump(upstream_retries_); }
    void record_upstream_failure() noexcept { bump(upstream_failures_); }
    void record_rate_limited() noexcept { bump(rate_limited_); }
    void record_no_healthy_upstream() noexcept { bump(no_healthy_upstream_); }
    void record_client_disconnect() noexcept { bump(client_disconnects_); }

    void record_cache_hit() noexcept { bump(cache_hits_); }
    void record_cache_miss() noexcept { bump(cache_misses_); }
    void record_cache_stale() noexcept { bump(cache_stale_); }
    void record_cache_bypass() noexcept { bump(cache_bypass_); }
    void record_cache_store_failure() noexcept { bump(cache_store_failures_); }
    void record_background_refresh() noexcept { bump(background_refreshes_); }

    /// Get current metrics snapshot
    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot snap;

        snap.total_requests = load(total_requests_);
        snap.total_errors = load(total_errors_);
        snap.total_timeouts = load(total_timeouts_);

        snap.active_connections = load(active_connections_);
        snap.total_connections = load(total_connections_);
        snap.rejected_connections = load(rejected_connections_);

        snap.total_latency_us = load(total_latency_us_);
        snap.min_latency_us = load(min_latency_us_);
        snap.max_latency_us = load(max_latency_us_);

        snap.bytes_received = load(bytes_received_);
        snap.bytes_sent = load(bytes_sent_);

        snap.status_2xx = load(status_2xx_);
        snap.status_3xx = load(status_3xx_);
        snap.status_4xx = load(status_4xx_);
        snap.status_5xx = load(status_5xx_);

        snap.upstream_attempts = load(upstream_attempts_);
        snap.upstream_retries = load(upstream_retries_);
        snap.upstream_failures = load(upstream_failures_);
        snap.rate_limited = load(rate_limited_);
        snap.no_healthy_upstream = load(no_healthy_upstream_);
        snap.client_disconnects = load(client_disconnects_);

        snap.cache_hits = load(cache_hits_);
        snap.cache_misses = load(cache_misses_);
        snap.cache_stale = load(cache_stale_);
        snap.cache_bypass = load(cache_bypass_);
        snap.cache_store_failures = load(cache_store_failures_);
        snap.background_refreshes = load(background_refreshes_);

        return snap;
    }

private:
    static void bump(std::atomic<uint64_t>& counter) noexcept {
        counter.fetch_add(1, std::memory_order_relaxed);
    }
    static uint64_t load(const std::atomic<uint64_t>& counter) noexcept {
        return counter.load(std::memory_order_relaxed);
    }

    // Request counters
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> total_errors_{0};
    std::atomic<uint64_t> total_timeouts_{0};

    // Connection counters
    std::atomic<uint64_t> active_connections_{0};
    std::atomic<uint64_t> total_connections_{0};
    std::atomic<uint64_t> rejected_connections_{0};

    // Latency counters
    std::atomic<uint64_t> total_latency_us_{0};
    std::atomic<uint64_t> min_latency_us_{0};
    std::atomic<uint64_t> max_latency_us_{0};

    // Bandwidth counters
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> bytes_sent_{0};

    // HTTP status counters
    std::atomic<uint64_t> status_2xx_{0};
    std::atomic<uint64_t> status_3xx_{0};
    std::atomic<uint64_t> status_4xx_{0};
    std::atomic<uint64_t> status_5xx_{0};

    // Proxy counters
    std::atomic<uint64_t> upstream_attempts_{0};
    std::atomic<uint64_t> upstream_retries_{0};
    std::atomic<uint64_t> upstream_failures_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> no_healthy_upstream_{0};
    std::atomic<uint64_t> client_disconnects_{0};

    // Cache counters
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cache_misses_{0};
    std::atomic<uint64_t> cache_stale_{0};
    std::atomic<uint64_t> cache_bypass_{0};
    std::atomic<uint64_t> cache_store_failures_{0};
    std::atomic<uint64_t> background_refreshes_{0};
};

/// RAII helper for request timing
class RequestTimer {
public:
    explicit RequestTimer(ProxyMetrics& metrics)
        : metrics_(metrics)
        , start_time_(std::chrono::steady_clock::now()) {
        metrics_.record_request();
    }

    ~RequestTimer() {
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);
        metrics_.record_latency(duration);
    }

    RequestTimer(const RequestTimer&) = delete;
    RequestTimer& operator=(const RequestTimer&) = delete;

private:
    ProxyMetrics& metrics_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace harbor::control
