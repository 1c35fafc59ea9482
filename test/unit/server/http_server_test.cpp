#include <gtest/gtest.h>
#include <httplib.h>
#include <stdexcept>
#include "querygen/server/http_server.h"

namespace querygen {
namespace server {
namespace {

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.listen_address = "127.0.0.1";
        config.port = 0;  // Let the kernel pick a free port
        config.timeout_seconds = 5;
    }

    void TearDown() override {
        if (server && server->IsRunning()) {
            server->Stop();
        }
    }

    httplib::Client Client() const {
        return httplib::Client("127.0.0.1", server->port());
    }

    ServerConfig config;
    std::unique_ptr<HttpServer> server;
};

TEST_F(HttpServerTest, StartStop) {
    server = std::make_unique<HttpServer>(config);

    EXPECT_FALSE(server->IsRunning());

    EXPECT_NO_THROW({
        server->Start();
    });

    EXPECT_TRUE(server->IsRunning());
    EXPECT_GT(server->port(), 0);

    EXPECT_NO_THROW({
        server->Stop();
    });

    EXPECT_FALSE(server->IsRunning());
}

TEST_F(HttpServerTest, DoubleStart) {
    server = std::make_unique<HttpServer>(config);
    server->Start();

    EXPECT_THROW({
        server->Start();
    }, ServerError);
}

TEST_F(HttpServerTest, HealthEndpoint) {
    server = std::make_unique<HttpServer>(config);
    server->Start();

    auto client = Client();
    auto health = client.Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(health->body.find("{\"status\":\"up\""), 0u);
    EXPECT_NE(health->body.find("\"total_requests\":"), std::string::npos);
}

TEST_F(HttpServerTest, RegisteredHandlerWithContentType) {
    server = std::make_unique<HttpServer>(config);
    server->RegisterHandler("/metrics", []() {
        return std::string("up 1\n");
    }, "text/plain; version=0.0.4; charset=utf-8");
    server->Start();

    auto client = Client();
    auto res = client.Get("/metrics");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "up 1\n");
    EXPECT_EQ(res->get_header_value("Content-Type"), "text/plain; version=0.0.4; charset=utf-8");

    auto missing = client.Get("/nothing");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    EXPECT_GE(server->request_count(), 2u);
}

TEST_F(HttpServerTest, HandlerError) {
    server = std::make_unique<HttpServer>(config);
    server->RegisterHandler("/broken", []() -> std::string {
        throw std::runtime_error("render failed");
    });
    server->Start();

    auto client = Client();
    auto res = client.Get("/broken");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_EQ(res->body, "{\"error\":\"render failed\"}");
}

} // namespace
} // namespace server
} // namespace querygen
