#include "route/router.hpp"

#include <mutex>
#include <stdexcept>

namespace loadwatch {

namespace {

std::string escape_regex(const std::string& segment) {
    static const std::regex special(R"([.*+?^${}()|\[\]\\])");
    return std::regex_replace(segment, special, R"(\$&)");
}

} // namespace

// RoutePattern implementation
RoutePattern::RoutePattern(std::string_view path) : original_path(path) {
    std::string regex_pattern = "^";
    std::string current_segment;

    auto flush_segment = [&]() {
        if (current_segment.empty()) return;
        if (current_segment.starts_with(':')) {
            param_names.push_back(current_segment.substr(1));
            regex_pattern += "([^/]+)";
            has_dynamic_parts = true;
        } else {
            regex_pattern += escape_regex(current_segment);
        }
        current_segment.clear();
    };

    for (char c : path) {
        if (c == '/') {
            flush_segment();
            regex_pattern += "/";
        } else {
            current_segment += c;
        }
    }
    flush_segment();

    regex_pattern += "$";
    compiled_regex = std::regex(regex_pattern);
}

// ============================================================================
// RouteMatcher
// ============================================================================

RouteMatcher::RouteMatcher() : static_root_(std::make_unique<TrieNode>()) {}

void RouteMatcher::add_route(const std::string& method, const std::string& path, const std::string& handler_key) {
    RoutePattern pattern(path);
    std::unique_lock lock(mutex_);

    if (pattern.has_dynamic_parts) {
        dynamic_routes_.push_back(DynamicRoute{method, std::move(pattern), handler_key});
        return;
    }

    TrieNode* current = static_root_.get();
    for (const std::string& part : split_path(method, path)) {
        auto& child = current->children[part];
        if (!child) {
            child = std::make_unique<TrieNode>();
        }
        current = child.get();
    }
    current->is_terminal = true;
    current->handler_key = handler_key;
    current->route_template = path;
}

std::optional<RouteMatch> RouteMatcher::match_route(const std::string& method, const std::string& path) const {
    std::shared_lock lock(mutex_);

    const TrieNode* current = static_root_.get();
    for (const std::string& part : split_path(method, path)) {
        auto it = current->children.find(part);
        if (it == current->children.end()) {
            current = nullptr;
            break;
        }
        current = it->second.get();
    }
    if (current && current->is_terminal) {
        return RouteMatch{current->handler_key, current->route_template, {}};
    }

    for (const auto& route : dynamic_routes_) {
        if (route.method != method) continue;

        std::smatch matches;
        if (std::regex_match(path, matches, route.pattern.compiled_regex)) {
            RouteMatch result{route.handler_key, route.pattern.original_path, {}};
            for (std::size_t i = 1; i < matches.size() && i - 1 < route.pattern.param_names.size(); ++i) {
                result.params[route.pattern.param_names[i - 1]] = matches[i].str();
            }
            return result;
        }
    }

    return std::nullopt;
}

// Method is the first trie level, then one level per non-empty path segment
std::vector<std::string> RouteMatcher::split_path(const std::string& method, const std::string& path) {
    std::vector<std::string> parts{method};
    std::string current;

    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

// ============================================================================
// Router
// ============================================================================

void Router::register_handler(const std::string& method, const std::string& path, Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Router: empty handler for " + method + " " + path);
    }
    std::string handler_key = method + ":" + path;
    {
        std::unique_lock lock(handlers_mutex_);
        handlers_[handler_key] = std::move(handler);
    }
    matcher_.add_route(method, path, handler_key);
}

std::optional<RouteMatch> Router::match(const std::string& method, const std::string& path) const {
    return matcher_.match_route(method, path);
}

std::expected<Response, NetworkError> Router::dispatch(Request& request) const {
    auto match_result = matcher_.match_route(request.method, request.path);
    if (!match_result) {
        return Response::not_found();
    }

    Handler handler;
    {
        std::shared_lock lock(handlers_mutex_);
        auto it = handlers_.find(match_result->handler_key);
        if (it == handlers_.end()) {
            return Response::not_found();
        }
        handler = it->second;
    }

    request.matched_route = match_result->route_template;
    request.path_params = std::move(match_result->params);
    return handler(request);
}

std::size_t Router::route_count() const {
    std::shared_lock lock(handlers_mutex_);
    return handlers_.size();
}

} // namespace loadwatch
