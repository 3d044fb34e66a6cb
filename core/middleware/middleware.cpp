#include "middleware/middleware.hpp"

#include "loadwatch/metrics/request_collector.h"
#include "loadwatch/utils/logger.h"

#include <chrono>
#include <memory>

namespace loadwatch {

std::string middleware_result_to_string(MiddlewareResult result) {
    switch (result) {
        case MiddlewareResult::COMPLETED: return "COMPLETED";
        case MiddlewareResult::INTERRUPTED: return "INTERRUPTED";
        case MiddlewareResult::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// ============================================================================
// MiddlewareChain
// ============================================================================

void MiddlewareChain::push_back(Middleware middleware) {
    push_back("middleware_" + std::to_string(middlewares_.size()), std::move(middleware));
}

void MiddlewareChain::push_back(const std::string& name, Middleware middleware) {
    middleware_names_.push_back(name);
    middlewares_.push_back(std::move(middleware));
}

void MiddlewareChain::clear() {
    middlewares_.clear();
    middleware_names_.clear();
}

MiddlewareResult MiddlewareChain::handle(Request& request, Response& response,
                                         const Terminal& terminal) const {
    auto& logger = LoggerFactory::get_logger("middleware");

    if (middlewares_.size() > MAX_CHAIN_DEPTH) {
        logger.error("Middleware chain too deep: " + std::to_string(middlewares_.size()));
        response = Response::internal_error();
        return MiddlewareResult::ERROR;
    }

    bool terminal_reached = false;
    std::size_t current_index = 0;

    std::function<void(std::size_t)> run = [&](std::size_t index) {
        if (index == middlewares_.size()) {
            terminal_reached = true;
            if (terminal) terminal(request, response);
            return;
        }
        current_index = index;
        bool next_called = false;
        middlewares_[index](request, response, [&run, &next_called, index]() {
            if (next_called) return;
            next_called = true;
            run(index + 1);
        });
    };

    try {
        run(0);
    } catch (const std::exception& e) {
        const std::string where = current_index < middleware_names_.size()
            ? middleware_names_[current_index] : "handler";
        logger.log(LogLevel::ERROR, "Unhandled exception in request chain",
                   {{"stage", terminal_reached ? "handler" : where}, {"error", e.what()}});
        response = Response::internal_error();
        return MiddlewareResult::ERROR;
    }

    return terminal_reached ? MiddlewareResult::COMPLETED : MiddlewareResult::INTERRUPTED;
}

// ============================================================================
// Factory
// ============================================================================

Middleware MiddlewareFactory::create_request_logger(Logger& logger) {
    return [&logger](Request& req, Response& res, const Next& next) {
        auto start = std::chrono::steady_clock::now();

        next();

        if (!logger.is_enabled(LogLevel::INFO)) return;
        auto duration = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start);
        logger.log(LogLevel::INFO, req.method + " " + req.path, {
            {"method", req.method},
            {"path", req.path},
            {"route", req.matched_route.empty() ? "-" : req.matched_route},
            {"status", std::to_string(res.status_code)},
            {"duration_ms", std::to_string(duration.count())},
        });
    };
}

Middleware MiddlewareFactory::create_metrics(metrics::RequestCollector& collector) {
    return [&collector](Request& req, Response& res, const Next& next) {
        auto scope = std::make_shared<metrics::RequestScope>(collector, req.method, req.path);
        req.metrics_scope = scope;

        next();

        scope->set_route(req.matched_route);
        scope->set_status(res.status_code);
    };
}

} // namespace loadwatch
