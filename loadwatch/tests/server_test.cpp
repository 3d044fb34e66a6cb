#include <gtest/gtest.h>

#include "handlers/handlers.hpp"
#include "loadwatch_server.hpp"
#include "middleware/middleware.hpp"
#include "route/router.hpp"

#include "loadwatch/metrics/registry.h"
#include "loadwatch/metrics/request_collector.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace loadwatch;

namespace {

/// Sends raw bytes to 127.0.0.1:port and reads until the server closes
std::optional<std::string> round_trip(int port, const std::string& raw) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == -1) return std::nullopt;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        close(fd);
        return std::nullopt;
    }

    std::size_t sent = 0;
    while (sent < raw.size()) {
        ssize_t n = send(fd, raw.data() + sent, raw.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            return std::nullopt;
        }
        sent += static_cast<std::size_t>(n);
    }

    std::string response;
    char buf[4096];
    ssize_t n = 0;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<std::size_t>(n));
    }
    close(fd);
    return response;
}

bool wait_until(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto router = std::make_shared<Router>();
        handlers::register_builtin_routes(*router, registry_);
        router->get("/items/:id", [](const Request& req) -> std::expected<Response, NetworkError> {
            return Response::ok("item " + req.path_params.at("id"), "text/plain");
        });
        router->post("/echo", [](const Request& req) -> std::expected<Response, NetworkError> {
            return Response::ok(req.body, "text/plain");
        });

        MiddlewareChain chain;
        chain.push_back("metrics", MiddlewareFactory::create_metrics(collector_));

        ServerSettings settings;
        settings.bind_address = "127.0.0.1";
        settings.port = 0;
        settings.read_timeout_ms = 1000;
        settings.max_request_bytes = 1024;

        server_ = std::make_unique<Server>(settings, router, std::move(chain));
        auto bound = server_->bind();
        ASSERT_TRUE(bound.has_value()) << error_to_string(bound.error());
        ASSERT_GT(server_->port(), 0);

        thread_ = std::thread([this]() { run_result_ = server_->run(); });
        ASSERT_TRUE(wait_until([this]() { return server_->is_running(); }));
    }

    void TearDown() override {
        if (server_) server_->shutdown();
        if (thread_.joinable()) thread_.join();
    }

    std::uint64_t count_for(const metrics::LabelValues& labels) const {
        auto series = collector_.duration_histogram().series(labels);
        return series ? series->count : 0;
    }

    metrics::MetricsRegistry registry_;
    metrics::RequestCollector collector_{registry_};
    std::unique_ptr<Server> server_;
    std::thread thread_;
    std::expected<void, NetworkError> run_result_;
};

TEST_F(ServerTest, HealthEndpoint) {
    auto response = round_trip(server_->port(), "GET /health HTTP/1.1\r\nHost: test\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(response->find("connection: close\r\n"), std::string::npos);
    EXPECT_NE(response->find("{\"ok\":true}"), std::string::npos);
}

TEST_F(ServerTest, RequestIsRecordedUnderRouteTemplate) {
    auto response = round_trip(server_->port(), "GET /items/17 HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_NE(response->find("item 17"), std::string::npos);

    ASSERT_TRUE(wait_until([this]() { return count_for({"GET", "/items/:id", "200"}) == 1; }));
    EXPECT_EQ(count_for({"GET", "/items/17", "200"}), 0u);
    EXPECT_TRUE(wait_until([this]() { return collector_.active_connections() == 0; }));
}

TEST_F(ServerTest, MetricsEndpointExposesHistogram) {
    ASSERT_TRUE(round_trip(server_->port(), "GET /items/1 HTTP/1.1\r\n\r\n").has_value());
    ASSERT_TRUE(wait_until([this]() { return count_for({"GET", "/items/:id", "200"}) == 1; }));

    auto response = round_trip(server_->port(), "GET /metrics HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_NE(response->find("content-type: text/plain; version=0.0.4; charset=utf-8\r\n"),
              std::string::npos);
    EXPECT_NE(response->find("# TYPE http_request_duration_ms histogram"), std::string::npos);
    EXPECT_NE(response->find(
        "http_request_duration_ms_count{method=\"GET\",route=\"/items/:id\",status_code=\"200\"} 1"),
        std::string::npos);
    // The scrape itself is in flight while the registry renders
    EXPECT_NE(response->find("http_active_connections 1\n"), std::string::npos);
}

TEST_F(ServerTest, UnknownRouteIs404WithPathLabel) {
    auto response = round_trip(server_->port(), "GET /missing HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_TRUE(wait_until([this]() { return count_for({"GET", "/missing", "404"}) == 1; }));
}

TEST_F(ServerTest, RequestBodyDelivered) {
    auto response = round_trip(server_->port(),
                               "POST /echo HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->substr(response->size() - 5), "hello");
}

TEST_F(ServerTest, OversizedRequestRejected) {
    auto response = round_trip(server_->port(),
                               "POST /echo HTTP/1.1\r\nContent-Length: 4096\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->rfind("HTTP/1.1 413 ", 0), 0u);
}

TEST_F(ServerTest, MalformedRequestRejected) {
    auto response = round_trip(server_->port(), "NOT A REQUEST\r\n\r\n");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->rfind("HTTP/1.1 400 ", 0), 0u);
}

TEST_F(ServerTest, ShutdownStopsRunLoop) {
    server_->shutdown();
    thread_.join();

    EXPECT_TRUE(run_result_.has_value());
    EXPECT_FALSE(server_->is_running());
    EXPECT_EQ(server_->get_stats().open_connections, 0u);
}

} // namespace
