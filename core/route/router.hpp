#pragma once

#include "http/http_types.hpp"

#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loadwatch {

using Handler = std::function<std::expected<Response, NetworkError>(const Request&)>;

template<typename Func>
concept SyncHandler = requires(Func f, const Request& req) {
    { f(req) } -> std::convertible_to<std::expected<Response, NetworkError>>;
};

// Route pattern for dynamic routing
struct RoutePattern {
    std::string original_path;
    std::vector<std::string> param_names;
    std::regex compiled_regex;
    bool has_dynamic_parts = false;

    explicit RoutePattern(std::string_view path);
};

/**
 * @brief Result of resolving a request against the routing table
 */
struct RouteMatch {
    std::string handler_key;
    std::string route_template;   ///< Registered path, e.g. "/users/:id"
    std::unordered_map<std::string, std::string> params;
};

// Route matcher using trie for static routes and regex for dynamic
class RouteMatcher {
public:
    RouteMatcher();

    void add_route(const std::string& method, const std::string& path, const std::string& handler_key);

    [[nodiscard]] std::optional<RouteMatch> match_route(const std::string& method,
                                                        const std::string& path) const;

private:
    struct TrieNode {
        std::unordered_map<std::string, std::unique_ptr<TrieNode>> children;
        std::string handler_key;
        std::string route_template;
        bool is_terminal = false;
    };

    struct DynamicRoute {
        std::string method;
        RoutePattern pattern;
        std::string handler_key;
    };

    std::unique_ptr<TrieNode> static_root_;
    std::vector<DynamicRoute> dynamic_routes_;
    mutable std::shared_mutex mutex_;

    static std::vector<std::string> split_path(const std::string& method, const std::string& path);
};

/**
 * @brief Method + path routing to synchronous handlers
 *
 * Static paths resolve through a trie; paths with ":name" segments are
 * matched by regex in registration order.
 */
class Router {
public:
    Router() = default;

    template<SyncHandler Func>
    void get(const std::string& path, Func&& handler) {
        register_handler("GET", path, Handler(std::forward<Func>(handler)));
    }

    template<SyncHandler Func>
    void post(const std::string& path, Func&& handler) {
        register_handler("POST", path, Handler(std::forward<Func>(handler)));
    }

    template<SyncHandler Func>
    void put(const std::string& path, Func&& handler) {
        register_handler("PUT", path, Handler(std::forward<Func>(handler)));
    }

    template<SyncHandler Func>
    void del(const std::string& path, Func&& handler) {
        register_handler("DELETE", path, Handler(std::forward<Func>(handler)));
    }

    [[nodiscard]] std::optional<RouteMatch> match(const std::string& method, const std::string& path) const;

    /**
     * @brief Resolve and run the handler for a request
     *
     * Stamps request.matched_route and request.path_params on a match.
     * Unknown routes produce a 404 JSON response, not an error.
     */
    std::expected<Response, NetworkError> dispatch(Request& request) const;

    [[nodiscard]] std::size_t route_count() const;

private:
    std::unordered_map<std::string, Handler> handlers_;
    RouteMatcher matcher_;
    mutable std::shared_mutex handlers_mutex_;

    void register_handler(const std::string& method, const std::string& path, Handler handler);
};

} // namespace loadwatch
