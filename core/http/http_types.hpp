#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace loadwatch {

namespace metrics {
class RequestScope;
}

// Error types for std::expected
enum class NetworkError {
    BIND_FAILED,
    LISTEN_FAILED,
    ACCEPT_FAILED,
    READ_FAILED,
    WRITE_FAILED,
    TIMEOUT,
    CONNECTION_CLOSED,
    INVALID_REQUEST,
    REQUEST_TOO_LARGE
};

[[nodiscard]] std::string error_to_string(NetworkError error);

/**
 * @brief Parsed HTTP/1.x request
 *
 * Header names are stored lowercase.
 */
struct Request {
    std::string method;
    std::string path;
    std::string query_string;
    std::string version;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    // Filled in by the router
    std::unordered_map<std::string, std::string> path_params;
    std::string matched_route;

    // Set by the metrics middleware; the server signals completion on it
    std::shared_ptr<metrics::RequestScope> metrics_scope;

    [[nodiscard]] std::optional<std::string> get_header(const std::string& name) const;
};

struct Response {
    int status_code = 200;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    static Response ok(std::string body = "", std::string content_type = "application/json");
    static Response error(int code, const std::string& message);
    static Response not_found();
    static Response internal_error();

    void set_header(const std::string& name, const std::string& value);

    /// Serialise as an HTTP/1.1 message; Content-Length is always set
    [[nodiscard]] std::string to_http_response() const;
};

[[nodiscard]] const char* reason_phrase(int status_code) noexcept;

/**
 * @brief Parse a complete request (head plus body) from raw bytes
 */
[[nodiscard]] std::expected<Request, NetworkError> parse_http_request(std::string_view data);

} // namespace loadwatch
