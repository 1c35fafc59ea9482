#pragma once

#include <string>
#include <memory>
#include <functional>
#include <atomic>
#include <stdexcept>

namespace querygen {
namespace server {

/**
 * @brief Configuration for the metrics HTTP server
 */
struct ServerConfig {
    std::string listen_address = "0.0.0.0";  // Listen address
    uint16_t port = 2112;                    // Listen port, 0 picks a free one
    int timeout_seconds = 30;                // Read/write timeout
};

/**
 * @brief Produces a response body for a GET endpoint
 */
using ContentProvider = std::function<std::string()>;

/**
 * @brief Small HTTP server exposing /health and caller-registered endpoints
 */
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind the listen socket and start serving in the background
     * @throws ServerError if the address cannot be bound or the server is
     *         already running
     */
    void Start();

    /**
     * @brief Stop the HTTP server
     */
    void Stop();

    /**
     * @brief Check if server is running
     */
    bool IsRunning() const;

    /**
     * @brief Port actually bound, valid after Start()
     */
    int port() const;

    /**
     * @brief Register a GET handler for a specific endpoint
     * @param path The endpoint path (e.g., "/metrics")
     * @param provider Returns the response body; exceptions become a 500
     * @param content_type Content-Type of the response
     */
    void RegisterHandler(const std::string& path, ContentProvider provider,
                         const std::string& content_type = "application/json");

    /**
     * @brief Requests served so far
     */
    uint64_t request_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

// Exception classes
class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace server
} // namespace querygen
