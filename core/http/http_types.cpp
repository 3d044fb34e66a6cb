#include "http/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

namespace loadwatch {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
}

} // namespace

std::string error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::BIND_FAILED: return "Failed to bind socket";
        case NetworkError::LISTEN_FAILED: return "Failed to listen on socket";
        case NetworkError::ACCEPT_FAILED: return "Failed to accept connection";
        case NetworkError::READ_FAILED: return "Failed to read from socket";
        case NetworkError::WRITE_FAILED: return "Failed to write to socket";
        case NetworkError::TIMEOUT: return "Operation timed out";
        case NetworkError::CONNECTION_CLOSED: return "Connection closed";
        case NetworkError::INVALID_REQUEST: return "Invalid HTTP request";
        case NetworkError::REQUEST_TOO_LARGE: return "Request exceeds size limit";
    }
    return "Unknown error";
}

// ============================================================================
// Request / Response
// ============================================================================

std::optional<std::string> Request::get_header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? std::optional<std::string>(it->second) : std::nullopt;
}

Response Response::ok(std::string body, std::string content_type) {
    return Response{200, {{"content-type", std::move(content_type)}}, std::move(body)};
}

Response Response::error(int code, const std::string& message) {
    nlohmann::json j = {{"error", message}};
    return Response{code, {{"content-type", "application/json"}}, j.dump()};
}

Response Response::not_found() {
    return error(404, "Not Found");
}

Response Response::internal_error() {
    return error(500, "Internal Server Error");
}

void Response::set_header(const std::string& name, const std::string& value) {
    headers[to_lower(name)] = value;
}

std::string Response::to_http_response() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code << " " << reason_phrase(status_code) << "\r\n";

    for (const auto& [key, value] : headers) {
        if (key == "content-length") continue;
        oss << key << ": " << value << "\r\n";
    }
    oss << "content-length: " << body.size() << "\r\n";
    oss << "\r\n";
    oss << body;
    return oss.str();
}

const char* reason_phrase(int status_code) noexcept {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: break;
    }
    if (status_code >= 200 && status_code < 300) return "OK";
    if (status_code >= 400 && status_code < 500) return "Client Error";
    return "Server Error";
}

// ============================================================================
// Parsing
// ============================================================================

std::expected<Request, NetworkError> parse_http_request(std::string_view data) {
    auto head_end = data.find("\r\n\r\n");
    if (head_end == std::string_view::npos) {
        return std::unexpected(NetworkError::INVALID_REQUEST);
    }

    std::istringstream iss(std::string(data.substr(0, head_end + 2)));
    Request req;

    std::string request_line;
    std::getline(iss, request_line);
    if (!request_line.empty() && request_line.back() == '\r') request_line.pop_back();

    // METHOD TARGET HTTP/VERSION
    static const std::regex request_regex(R"(([A-Z]+) ([^\s]+) HTTP/([0-9\.]+))");
    std::smatch match;
    if (!std::regex_match(request_line, match, request_regex)) {
        return std::unexpected(NetworkError::INVALID_REQUEST);
    }

    req.method = match[1].str();
    std::string target = match[2].str();
    req.version = match[3].str();

    if (auto q = target.find('?'); q != std::string::npos) {
        req.query_string = target.substr(q + 1);
        target.resize(q);
    }
    req.path = std::move(target);

    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            return std::unexpected(NetworkError::INVALID_REQUEST);
        }
        std::string key = line.substr(0, colon_pos);
        std::string value = line.substr(colon_pos + 1);
        trim(key);
        trim(value);
        req.headers[to_lower(key)] = value;
    }

    std::size_t content_length = 0;
    if (auto cl = req.get_header("content-length")) {
        auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), content_length);
        if (ec != std::errc() || ptr != cl->data() + cl->size()) {
            return std::unexpected(NetworkError::INVALID_REQUEST);
        }
    }

    auto body = data.substr(head_end + 4);
    if (body.size() < content_length) {
        return std::unexpected(NetworkError::INVALID_REQUEST);
    }
    req.body.assign(body.substr(0, content_length));
    return req;
}

} // namespace loadwatch
