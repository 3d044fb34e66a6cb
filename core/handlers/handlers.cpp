#include "handlers/handlers.hpp"

#include "loadwatch/metrics/registry.h"

#include <nlohmann/json.hpp>

namespace loadwatch::handlers {

std::expected<Response, NetworkError> get_health(const Request&) {
    nlohmann::json response = {{"ok", true}};
    return Response::ok(response.dump());
}

Handler make_metrics_handler(const metrics::MetricsRegistry& registry) {
    return [&registry](const Request&) -> std::expected<Response, NetworkError> {
        return Response::ok(registry.expose(), metrics::MetricsRegistry::content_type());
    };
}

void register_builtin_routes(Router& router, const metrics::MetricsRegistry& registry,
                             const std::string& metrics_path) {
    router.get("/health", get_health);
    router.get(metrics_path, make_metrics_handler(registry));
}

} // namespace loadwatch::handlers
