#include "querygen/server/http_server.h"
#include "querygen/common/logger.h"
#include <httplib.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <thread>

namespace querygen {
namespace server {

class HttpServer::Impl {
public:
    explicit Impl(const ServerConfig& config)
        : config_(config), server_(std::make_unique<httplib::Server>()),
          request_count_(0), bound_port_(-1) {

        server_->set_read_timeout(config.timeout_seconds, 0);
        server_->set_write_timeout(config.timeout_seconds, 0);

        server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(CreateHealthJson(), "application/json");
        });

        server_->set_post_routing_handler([this](const httplib::Request& /*req*/, httplib::Response& /*res*/) {
            request_count_++;
        });
    }

    void Start() {
        if (server_thread_.joinable()) {
            throw ServerError("Server is already running");
        }

        // Bind on the caller's thread so a busy port is reported to it
        if (config_.port == 0) {
            bound_port_ = server_->bind_to_any_port(config_.listen_address);
        } else if (server_->bind_to_port(config_.listen_address, config_.port)) {
            bound_port_ = config_.port;
        } else {
            bound_port_ = -1;
        }
        if (bound_port_ < 0) {
            throw ServerError("Failed to bind " + config_.listen_address + ":" +
                              std::to_string(config_.port));
        }

        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                QUERYGEN_ERROR("HTTP server on port {} stopped unexpectedly", bound_port_);
            }
        });
        server_->wait_until_ready();
    }

    void Stop() {
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
        }
    }

    void RegisterHandler(const std::string& path, ContentProvider provider,
                         const std::string& content_type) {
        server_->Get(path, [this, provider, content_type](const httplib::Request&,
                                                          httplib::Response& res) {
            try {
                res.set_content(provider(), content_type);
            } catch (const std::exception& e) {
                res.status = 500;
                res.set_content(CreateErrorJson(e.what()), "application/json");
            }
        });
    }

    int port() const { return bound_port_; }
    uint64_t request_count() const { return request_count_.load(); }

private:
    ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<uint64_t> request_count_;
    int bound_port_;

    std::string CreateHealthJson() const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("status", "up", allocator);
        doc.AddMember("total_requests",
                     static_cast<uint64_t>(request_count_.load()),
                     allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }

    std::string CreateErrorJson(const std::string& message) const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("error",
                     rapidjson::Value(message.c_str(), allocator).Move(),
                     allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }
};

HttpServer::HttpServer(const ServerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_) {
        throw ServerError("Server is already running");
    }
    impl_->Start();
    running_ = true;
}

void HttpServer::Stop() {
    if (running_) {
        impl_->Stop();
        running_ = false;
    }
}

bool HttpServer::IsRunning() const {
    return running_;
}

int HttpServer::port() const {
    return impl_->port();
}

void HttpServer::RegisterHandler(const std::string& path, ContentProvider provider,
                                 const std::string& content_type) {
    impl_->RegisterHandler(path, std::move(provider), content_type);
}

uint64_t HttpServer::request_count() const {
    return impl_->request_count();
}

} // namespace server
} // namespace querygen
