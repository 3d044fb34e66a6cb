#pragma once

#include "loadwatch/metrics/registry.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace loadwatch::metrics {

/// Status label used when a connection closes before any response status exists
inline constexpr int kClientClosedRequest = 499;

/**
 * @brief Which signal ended a request
 */
enum class TerminalReason : int {
    COMPLETED = 0,   ///< Response fully written
    CLOSED = 1       ///< Connection closed or handler abandoned the request
};

[[nodiscard]] const char* to_string(TerminalReason reason) noexcept;

// ============================================================================
// In-flight request token
// ============================================================================

/**
 * @brief State token for one request between start and its terminal signal
 *
 * PENDING -> FINALIZED happens once, by compare-and-set. Only the caller
 * that wins the transition performs the terminal bookkeeping.
 */
class InFlightRequest {
public:
    enum class State : std::uint8_t { PENDING, FINALIZED };

    InFlightRequest(std::string method, std::string path,
                    std::chrono::steady_clock::time_point start_time);

    InFlightRequest(const InFlightRequest&) = delete;
    InFlightRequest& operator=(const InFlightRequest&) = delete;

    /**
     * @return true for exactly one caller over the token's lifetime
     */
    [[nodiscard]] bool try_finalize() noexcept;

    [[nodiscard]] bool is_finalized() const noexcept;

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::chrono::steady_clock::time_point start_time() const noexcept { return start_time_; }

    /// Milliseconds elapsed since start, measured on the monotonic clock
    [[nodiscard]] double elapsed_ms() const noexcept;

private:
    std::string method_;
    std::string path_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<State> state_{State::PENDING};
};

// ============================================================================
// Collector
// ============================================================================

/**
 * @brief Live request instrumentation on top of a MetricsRegistry
 *
 * Registers:
 * - http_request_duration_ms (histogram; labels method, route, status_code)
 * - http_active_connections (gauge)
 *
 * None of the request-path operations throw. A failure while recording is
 * logged at DEBUG and surfaces only as a missing observation.
 */
class RequestCollector {
public:
    /**
     * @throws std::invalid_argument if the metric names are already registered
     */
    explicit RequestCollector(MetricsRegistry& registry,
                              HistogramBuckets buckets = HistogramBuckets::default_duration_ms());

    RequestCollector(const RequestCollector&) = delete;
    RequestCollector& operator=(const RequestCollector&) = delete;

    /**
     * @brief Begin tracking a request; call before handler dispatch
     * @return Token to pass to on_request_terminal(); nullptr only if the
     *         token itself could not be allocated
     */
    [[nodiscard]] std::shared_ptr<InFlightRequest> on_request_start(const std::string& method,
                                                                    const std::string& path) noexcept;

    /**
     * @brief Terminal signal; duration is taken from the token's start time
     * @return true if this call finalized the request, false if another
     *         signal already did (or request is null)
     */
    bool on_request_terminal(const std::shared_ptr<InFlightRequest>& request,
                             const std::string& route, int status_code,
                             TerminalReason reason = TerminalReason::COMPLETED) noexcept;

    /**
     * @brief Terminal signal with a caller-measured duration
     */
    bool on_request_terminal(const std::shared_ptr<InFlightRequest>& request,
                             const std::string& route, int status_code,
                             double duration_ms, TerminalReason reason) noexcept;

    /// Requests started and not yet finalized; never negative
    [[nodiscard]] std::int64_t active_connections() const noexcept;

    /// Exposition text of the whole underlying registry
    [[nodiscard]] std::string snapshot() const;

    [[nodiscard]] const HistogramFamily& duration_histogram() const noexcept { return duration_; }
    [[nodiscard]] MetricsRegistry& registry() noexcept { return registry_; }

private:
    MetricsRegistry& registry_;
    HistogramFamily& duration_;
    Gauge& active_gauge_;
    // Shared with the gauge's collect callback, which may outlive this object
    std::shared_ptr<std::atomic<std::int64_t>> active_;

    void record(const InFlightRequest& request, const std::string& route,
                int status_code, double duration_ms, TerminalReason reason) noexcept;
};

// ============================================================================
// RAII scope
// ============================================================================

/**
 * @brief Ties a request's terminal signals to a scope
 *
 * complete() is the normal-finish signal. The destructor raises the close
 * signal; if complete() already ran, the close is a no-op.
 */
class RequestScope {
public:
    RequestScope(RequestCollector& collector, const std::string& method, const std::string& path);
    ~RequestScope();

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

    /// Route label and status to use if the close signal fires first
    void set_route(std::string route);
    void set_status(int status_code);

    /// @return true if this call finalized the request
    bool complete(const std::string& route, int status_code);

    /// @return true if this call finalized the request
    bool close();

    [[nodiscard]] const std::shared_ptr<InFlightRequest>& request() const noexcept { return request_; }

private:
    RequestCollector& collector_;
    std::shared_ptr<InFlightRequest> request_;
    std::string route_;
    int status_code_ = kClientClosedRequest;
};

} // namespace loadwatch::metrics
