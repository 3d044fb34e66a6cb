#include "loadwatch_server.hpp"

#include "loadwatch/metrics/request_collector.h"
#include "loadwatch/utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <optional>
#include <string_view>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace loadwatch {

namespace {

constexpr int kAcceptPollMs = 200;
constexpr std::size_t kReadChunk = 8192;

// Content-Length from a request head; 0 when absent, nullopt when malformed
std::optional<std::size_t> content_length_of(std::string_view head) {
    std::size_t pos = 0;
    while (pos < head.size()) {
        auto eol = head.find("\r\n", pos);
        if (eol == std::string_view::npos) eol = head.size();
        auto line = head.substr(pos, eol - pos);
        pos = eol + 2;

        constexpr std::string_view kName = "content-length:";
        if (line.size() < kName.size()) continue;
        bool matches = std::equal(kName.begin(), kName.end(), line.begin(),
                                  [](char a, char b) {
                                      return a == std::tolower(static_cast<unsigned char>(b));
                                  });
        if (!matches) continue;

        auto value = line.substr(kName.size());
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);

        std::size_t length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        return length;
    }
    return 0;
}

void set_socket_timeout(int fd, int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(int socket_fd) : socket_fd_(socket_fd) {}

Connection::~Connection() {
    if (socket_fd_ != -1) {
        close(socket_fd_);
    }
}

std::expected<Request, NetworkError> Connection::read_request(std::size_t max_bytes) {
    std::string buffer;
    char chunk[kReadChunk];
    std::size_t head_end = std::string::npos;
    std::size_t expected_total = 0;

    while (true) {
        ssize_t bytes_read = recv(socket_fd_, chunk, sizeof(chunk), 0);
        if (bytes_read < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return std::unexpected(NetworkError::TIMEOUT);
            }
            return std::unexpected(NetworkError::READ_FAILED);
        }
        if (bytes_read == 0) {
            return std::unexpected(NetworkError::CONNECTION_CLOSED);
        }

        buffer.append(chunk, static_cast<std::size_t>(bytes_read));
        if (buffer.size() > max_bytes) {
            return std::unexpected(NetworkError::REQUEST_TOO_LARGE);
        }

        if (head_end == std::string::npos) {
            head_end = buffer.find("\r\n\r\n");
            if (head_end == std::string::npos) continue;

            auto length = content_length_of(std::string_view(buffer).substr(0, head_end));
            if (!length) {
                return std::unexpected(NetworkError::INVALID_REQUEST);
            }
            expected_total = head_end + 4 + *length;
            if (expected_total > max_bytes) {
                return std::unexpected(NetworkError::REQUEST_TOO_LARGE);
            }
        }

        if (buffer.size() >= expected_total) {
            break;
        }
    }

    return parse_http_request(buffer);
}

std::expected<void, NetworkError> Connection::write_response(const Response& response) {
    const std::string http_response = response.to_http_response();
    std::size_t sent = 0;

    while (sent < http_response.size()) {
        ssize_t n = send(socket_fd_, http_response.data() + sent, http_response.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return std::unexpected(NetworkError::TIMEOUT);
            }
            return std::unexpected(NetworkError::WRITE_FAILED);
        }
        sent += static_cast<std::size_t>(n);
    }
    return {};
}

// ============================================================================
// Server
// ============================================================================

Server::Server(ServerSettings settings, std::shared_ptr<Router> router, MiddlewareChain middleware)
    : settings_(std::move(settings))
    , router_(std::move(router))
    , middleware_(std::move(middleware)) {
}

Server::~Server() {
    shutdown();
    close_listener();
}

std::expected<void, NetworkError> Server::bind() {
    if (server_socket_ != -1) {
        return {};
    }
    auto socket_result = setup_socket();
    if (!socket_result) {
        close_listener();
        return socket_result;
    }
    auto event_result = setup_event_loop();
    if (!event_result) {
        close_listener();
        return event_result;
    }
    return {};
}

std::expected<void, NetworkError> Server::setup_socket() {
    server_socket_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_socket_ == -1) {
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    // Enable address reuse
    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(settings_.port));
    if (inet_pton(AF_INET, settings_.bind_address.c_str(), &server_addr.sin_addr) != 1) {
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    if (::bind(server_socket_, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == -1) {
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    if (listen(server_socket_, SOMAXCONN) == -1) {
        return std::unexpected(NetworkError::LISTEN_FAILED);
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_socket_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_.store(ntohs(bound.sin_port));
    }
    return {};
}

std::expected<void, NetworkError> Server::setup_event_loop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ == -1) {
        return std::unexpected(NetworkError::LISTEN_FAILED);
    }

    epoll_event event{};
    event.events = EPOLLIN;
    event.data.fd = server_socket_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_socket_, &event) == -1) {
        return std::unexpected(NetworkError::LISTEN_FAILED);
    }
    return {};
}

std::expected<ConnectionHandle, NetworkError> Server::accept_connection() {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    int client_socket = accept4(server_socket_, reinterpret_cast<sockaddr*>(&client_addr),
                                &client_len, SOCK_CLOEXEC);
    if (client_socket == -1) {
        return std::unexpected(NetworkError::ACCEPT_FAILED);
    }

    set_socket_timeout(client_socket, settings_.read_timeout_ms);
    return std::make_shared<Connection>(client_socket);
}

std::expected<void, NetworkError> Server::run() {
    auto& logger = LoggerFactory::get_logger("server");

    if (!router_) {
        logger.error("No router configured");
        return std::unexpected(NetworkError::BIND_FAILED);
    }

    auto bind_result = bind();
    if (!bind_result) {
        logger.with_field("address", settings_.bind_address)
              .with_field("port", settings_.port)
              .error(error_to_string(bind_result.error()));
        return bind_result;
    }

    running_.store(!stop_requested_.load());
    logger.with_field("address", settings_.bind_address)
          .with_field("port", port())
          .info("Listening");

    std::expected<void, NetworkError> result;
    while (running_.load()) {
        epoll_event event{};
        int ready = epoll_wait(epoll_fd_, &event, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger.error(std::string("epoll_wait failed: ") + std::strerror(errno));
            result = std::unexpected(NetworkError::ACCEPT_FAILED);
            break;
        }
        if (ready == 0) continue;

        auto connection = accept_connection();
        if (!connection) {
            logger.debug(error_to_string(connection.error()));
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            ++open_connections_;
        }
        std::thread([this, conn = std::move(*connection)]() mutable {
            handle_connection(std::move(conn));
            std::lock_guard<std::mutex> lock(connections_mutex_);
            --open_connections_;
            connections_cv_.notify_all();
        }).detach();
    }

    running_.store(false);
    close_listener();

    std::unique_lock<std::mutex> lock(connections_mutex_);
    connections_cv_.wait(lock, [this]() { return open_connections_ == 0; });
    logger.info("Server stopped");
    return result;
}

void Server::shutdown() {
    stop_requested_.store(true);
    running_.store(false);
}

void Server::close_listener() {
    if (epoll_fd_ != -1) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (server_socket_ != -1) {
        close(server_socket_);
        server_socket_ = -1;
    }
}

void Server::handle_connection(ConnectionHandle conn) {
    auto& logger = LoggerFactory::get_logger("server");

    try {
        auto request = conn->read_request(settings_.max_request_bytes);
        if (!request) {
            ++failed_reads_;
            logger.log(LogLevel::DEBUG, "Request read failed",
                       {{"error", error_to_string(request.error())}});

            std::optional<Response> reply;
            switch (request.error()) {
                case NetworkError::REQUEST_TOO_LARGE:
                    reply = Response::error(413, "Request too large");
                    break;
                case NetworkError::INVALID_REQUEST:
                    reply = Response::error(400, "Bad request");
                    break;
                case NetworkError::TIMEOUT:
                    reply = Response::error(408, "Request timeout");
                    break;
                default:
                    break;
            }
            if (reply) {
                reply->set_header("connection", "close");
                if (auto sent = conn->write_response(*reply); !sent) {
                    logger.log(LogLevel::DEBUG, "Error response not delivered",
                               {{"error", error_to_string(sent.error())}});
                }
            }
            return;
        }

        ++total_requests_;
        Response response = process(*request);
        auto written = conn->write_response(response);

        auto scope = std::move(request->metrics_scope);
        if (scope) {
            if (written) {
                scope->complete(request->matched_route, response.status_code);
            } else {
                scope->set_route(request->matched_route);
                scope->set_status(response.status_code);
                scope->close();
            }
        }

        if (!written) {
            ++failed_writes_;
            logger.log(LogLevel::DEBUG, "Response write failed",
                       {{"error", error_to_string(written.error())}, {"path", request->path}});
        }
    } catch (const std::exception& e) {
        logger.log(LogLevel::ERROR, "Connection handler failed", {{"error", e.what()}});
    }
}

Response Server::process(Request& request) {
    Response response;
    middleware_.handle(request, response, [this](Request& req, Response& res) {
        auto result = router_->dispatch(req);
        if (result) {
            res = std::move(*result);
        } else {
            LoggerFactory::get_logger("server").log(
                LogLevel::WARN, "Handler failed",
                {{"path", req.path}, {"error", error_to_string(result.error())}});
            res = Response::internal_error();
        }
    });
    response.set_header("connection", "close");
    return response;
}

Server::Stats Server::get_stats() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return Stats{total_requests_.load(), failed_reads_.load(), failed_writes_.load(), open_connections_};
}

} // namespace loadwatch
