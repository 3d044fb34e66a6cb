#pragma once

#include "http/http_types.hpp"
#include "middleware/middleware.hpp"
#include "route/router.hpp"

#include "loadwatch/config/app_config.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>

namespace loadwatch {

// Connection abstraction; owns the client socket
class Connection {
public:
    explicit Connection(int socket_fd);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Read one request, bounded by max_bytes and the socket read timeout
     */
    std::expected<Request, NetworkError> read_request(std::size_t max_bytes);

    std::expected<void, NetworkError> write_response(const Response& response);

    int get_socket() const { return socket_fd_; }

private:
    int socket_fd_;
};

using ConnectionHandle = std::shared_ptr<Connection>;

/**
 * @brief Blocking HTTP/1.1 server, one thread per connection
 *
 * Every connection serves a single request and is then closed. Requests run
 * through the middleware chain and finish in the router.
 */
class Server {
public:
    Server(ServerSettings settings, std::shared_ptr<Router> router, MiddlewareChain middleware = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Bind the listening socket; port 0 picks an ephemeral port
     */
    std::expected<void, NetworkError> bind();

    /**
     * @brief Accept loop; returns after shutdown() once in-flight
     *        connections have finished. Binds first if bind() was not called.
     */
    std::expected<void, NetworkError> run();

    /// Stop accepting; safe to call from any thread, more than once
    void shutdown();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /// Port actually bound, 0 before bind()
    [[nodiscard]] int port() const { return bound_port_.load(); }

    struct Stats {
        std::uint64_t total_requests = 0;
        std::uint64_t failed_reads = 0;
        std::uint64_t failed_writes = 0;
        std::size_t open_connections = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    ServerSettings settings_;
    std::shared_ptr<Router> router_;
    MiddlewareChain middleware_;

    int server_socket_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> bound_port_{0};

    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> failed_reads_{0};
    std::atomic<std::uint64_t> failed_writes_{0};

    mutable std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::size_t open_connections_ = 0;

    std::expected<void, NetworkError> setup_socket();
    std::expected<void, NetworkError> setup_event_loop();
    std::expected<ConnectionHandle, NetworkError> accept_connection();
    void handle_connection(ConnectionHandle conn);
    Response process(Request& request);
    void close_listener();
};

} // namespace loadwatch
