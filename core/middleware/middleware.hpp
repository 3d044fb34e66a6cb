#pragma once

#include "http/http_types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace loadwatch {

class Logger;

namespace metrics {
class RequestCollector;
}

using Next = std::function<void()>;
using Middleware = std::function<void(Request&, Response&, const Next&)>;
using Terminal = std::function<void(Request&, Response&)>;

enum class MiddlewareResult {
    COMPLETED,     // the terminal handler ran
    INTERRUPTED,   // a middleware answered without calling next()
    ERROR          // an exception escaped; response replaced by a 500
};

[[nodiscard]] std::string middleware_result_to_string(MiddlewareResult result);

/**
 * @brief Ordered middleware around a terminal handler
 *
 * next() runs the rest of the chain and then the terminal, so code after
 * next() observes the final response. Calling next() twice is a no-op.
 */
class MiddlewareChain {
public:
    // Chain depth limit (stack usage grows with each nested next())
    static constexpr std::size_t MAX_CHAIN_DEPTH = 100;

    void push_back(Middleware middleware);
    void push_back(const std::string& name, Middleware middleware);

    MiddlewareResult handle(Request& request, Response& response, const Terminal& terminal) const;

    [[nodiscard]] std::size_t size() const { return middlewares_.size(); }
    [[nodiscard]] bool empty() const { return middlewares_.empty(); }
    void clear();

    [[nodiscard]] std::vector<std::string> get_middleware_names() const { return middleware_names_; }

private:
    std::vector<Middleware> middlewares_;
    std::vector<std::string> middleware_names_;
};

class MiddlewareFactory {
public:
    /**
     * @brief Access log: one INFO line per request with method, path,
     *        route, status and duration fields
     */
    static Middleware create_request_logger(Logger& logger);

    /**
     * @brief Live request instrumentation
     *
     * Starts a RequestScope before the rest of the chain and attaches it to
     * the request. After the handler it records the matched route and
     * status; the server raises the completion signal once the response is
     * written, and a scope dropped without completion counts as closed.
     */
    static Middleware create_metrics(metrics::RequestCollector& collector);
};

} // namespace loadwatch
