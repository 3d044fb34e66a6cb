#include "loadwatch/metrics/request_collector.h"
#include "loadwatch/utils/logger.h"

#include <string>
#include <utility>

namespace loadwatch::metrics {

const char* to_string(TerminalReason reason) noexcept {
    switch (reason) {
        case TerminalReason::COMPLETED: return "completed";
        case TerminalReason::CLOSED:    return "closed";
    }
    return "unknown";
}

// ============================================================================
// InFlightRequest
// ============================================================================

InFlightRequest::InFlightRequest(std::string method, std::string path,
                                 std::chrono::steady_clock::time_point start_time)
    : method_(std::move(method))
    , path_(std::move(path))
    , start_time_(start_time) {
}

bool InFlightRequest::try_finalize() noexcept {
    State expected = State::PENDING;
    return state_.compare_exchange_strong(expected, State::FINALIZED,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire);
}

bool InFlightRequest::is_finalized() const noexcept {
    return state_.load(std::memory_order_acquire) == State::FINALIZED;
}

double InFlightRequest::elapsed_ms() const noexcept {
    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

// ============================================================================
// RequestCollector
// ============================================================================

RequestCollector::RequestCollector(MetricsRegistry& registry, HistogramBuckets buckets)
    : registry_(registry)
    , duration_(registry.add_histogram("http_request_duration_ms",
                                       "Duration of HTTP requests in ms",
                                       {"method", "route", "status_code"},
                                       std::move(buckets)))
    , active_gauge_(registry.add_gauge("http_active_connections",
                                       "Number of requests currently in flight"))
    , active_(std::make_shared<std::atomic<std::int64_t>>(0)) {
    active_gauge_.set_collect([active = active_]() {
        return static_cast<double>(active->load(std::memory_order_relaxed));
    });
}

std::shared_ptr<InFlightRequest> RequestCollector::on_request_start(const std::string& method,
                                                                    const std::string& path) noexcept {
    try {
        auto request = std::make_shared<InFlightRequest>(method, path,
                                                         std::chrono::steady_clock::now());
        active_->fetch_add(1, std::memory_order_relaxed);
        return request;
    } catch (const std::exception& e) {
        LoggerFactory::get_logger("collector").debug(std::string("request start not recorded: ") + e.what());
        return nullptr;
    }
}

bool RequestCollector::on_request_terminal(const std::shared_ptr<InFlightRequest>& request,
                                           const std::string& route, int status_code,
                                           TerminalReason reason) noexcept {
    if (!request) {
        return false;
    }
    return on_request_terminal(request, route, status_code, request->elapsed_ms(), reason);
}

bool RequestCollector::on_request_terminal(const std::shared_ptr<InFlightRequest>& request,
                                           const std::string& route, int status_code,
                                           double duration_ms, TerminalReason reason) noexcept {
    if (!request || !request->try_finalize()) {
        return false;
    }

    active_->fetch_sub(1, std::memory_order_relaxed);
    record(*request, route, status_code, duration_ms, reason);
    return true;
}

void RequestCollector::record(const InFlightRequest& request, const std::string& route,
                              int status_code, double duration_ms,
                              TerminalReason reason) noexcept {
    try {
        const std::string& label_route = route.empty() ? request.path() : route;
        duration_.observe({request.method(), label_route, std::to_string(status_code)},
                          duration_ms < 0.0 ? 0.0 : duration_ms);
    } catch (const std::exception& e) {
        LoggerFactory::get_logger("collector").log(
            LogLevel::DEBUG, std::string("request duration not recorded: ") + e.what(),
            {{"method", request.method()}, {"path", request.path()}, {"reason", to_string(reason)}});
    }
}

std::int64_t RequestCollector::active_connections() const noexcept {
    return active_->load(std::memory_order_relaxed);
}

std::string RequestCollector::snapshot() const {
    return registry_.expose();
}

// ============================================================================
// RequestScope
// ============================================================================

RequestScope::RequestScope(RequestCollector& collector, const std::string& method,
                           const std::string& path)
    : collector_(collector)
    , request_(collector.on_request_start(method, path))
    , route_(path) {
}

RequestScope::~RequestScope() {
    close();
}

void RequestScope::set_route(std::string route) {
    route_ = std::move(route);
}

void RequestScope::set_status(int status_code) {
    status_code_ = status_code;
}

bool RequestScope::complete(const std::string& route, int status_code) {
    route_ = route;
    status_code_ = status_code;
    return collector_.on_request_terminal(request_, route, status_code, TerminalReason::COMPLETED);
}

bool RequestScope::close() {
    return collector_.on_request_terminal(request_, route_, status_code_, TerminalReason::CLOSED);
}

} // namespace loadwatch::metrics
