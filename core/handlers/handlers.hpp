#pragma once

#include "route/router.hpp"

#include <string>

namespace loadwatch {

namespace metrics {
class MetricsRegistry;
}

namespace handlers {

/// GET /health -> {"ok":true}
std::expected<Response, NetworkError> get_health(const Request&);

/// Exposition text of the registry with the Prometheus content type
Handler make_metrics_handler(const metrics::MetricsRegistry& registry);

/**
 * @brief Install /health and the metrics endpoint on a router
 */
void register_builtin_routes(Router& router, const metrics::MetricsRegistry& registry,
                             const std::string& metrics_path = "/metrics");

} // namespace handlers
} // namespace loadwatch
