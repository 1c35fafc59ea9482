#include <memory>
#include <string>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <atomic>
#include <chrono>
#include "querygen/common/logger.h"
#include "querygen/core/config.h"
#include "querygen/client/tempo_client.h"
#include "querygen/executor/scheduler.h"
#include "querygen/metrics/prometheus_sink.h"
#include "querygen/server/http_server.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);
std::atomic<int> g_signal(0);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_signal.store(signal);
        g_running.store(false);
    }
}

namespace querygen {

constexpr const char* kDefaultConfigPath = "/config/config.json";

/**
 * @brief Wires configuration, exporter and scheduler together
 */
class QueryGenerator {
public:
    explicit QueryGenerator(const core::GeneratorConfig& config)
        : config_(config),
          sink_(std::make_shared<metrics::PrometheusSink>(config.namespace_name)) {
        auto token = client::LoadBearerToken(config_.backend.token_path);
        auto options = client::TempoClientOptions::FromConfig(config_.backend, std::move(token));
        QUERYGEN_INFO("Tempo search endpoint: {}{}", options.scheme_host_port, options.search_path);
        if (options.insecure_skip_verify) {
            QUERYGEN_WARN("TLS certificate verification is disabled");
        }

        scheduler_ = std::make_unique<executor::Scheduler>(
            config_, client::TempoClient::Factory(std::move(options)), sink_);
    }

    ~QueryGenerator() {
        Stop();
    }

    void Start() {
        server::ServerConfig server_config;
        server_config.listen_address = config_.metrics.listen_address;
        server_config.port = config_.metrics.port;

        http_server_ = std::make_unique<server::HttpServer>(server_config);
        auto registry = sink_->shared_registry();
        http_server_->RegisterHandler("/metrics", [registry]() { return registry->Render(); },
                                      metrics::Registry::kContentType);
        http_server_->Start();
        QUERYGEN_INFO("Serving metrics on {}:{}/metrics", server_config.listen_address,
                      http_server_->port());

        scheduler_->Start();
    }

    void Stop() {
        if (scheduler_) {
            scheduler_->Stop();
        }
        if (http_server_) {
            http_server_->Stop();
            http_server_.reset();
        }
    }

    void Wait() {
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        QUERYGEN_INFO("Received signal {}, shutting down...", g_signal.load());
    }

private:
    core::GeneratorConfig config_;
    std::shared_ptr<metrics::PrometheusSink> sink_;
    std::unique_ptr<executor::Scheduler> scheduler_;
    std::unique_ptr<server::HttpServer> http_server_;
};

} // namespace querygen

int main(int argc, char* argv[]) {
    // Set up signal handling
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    querygen::common::Logger::Init();

    // Parse command-line arguments
    std::string config_path;
    std::string log_level;
    bool validate_only = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--validate") {
            validate_only = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]" << std::endl;
            std::cout << "Options:" << std::endl;
            std::cout << "  --config PATH        Configuration file (default: $CONFIG_FILE or "
                      << querygen::kDefaultConfigPath << ")" << std::endl;
            std::cout << "  --log-level LEVEL    Log level (trace, debug, info, warn, error, off)" << std::endl;
            std::cout << "  --validate           Check the configuration and exit" << std::endl;
            std::cout << "  --help, -h           Show this help message" << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    if (config_path.empty()) {
        const char* env_path = std::getenv("CONFIG_FILE");
        config_path = env_path && *env_path ? env_path : querygen::kDefaultConfigPath;
    }

    try {
        auto loaded = querygen::core::LoadConfig(config_path);
        if (!loaded.ok()) {
            QUERYGEN_CRITICAL("Failed to load config: {}", loaded.error());
            return 1;
        }
        querygen::core::GeneratorConfig config = loaded.take_value();

        // The command line wins over the file
        const std::string& level = log_level.empty() ? config.log_level : log_level;
        if (!level.empty() && !querygen::common::Logger::SetLevel(level)) {
            QUERYGEN_WARN("Unknown log level: {}. Using default (info).", level);
        }
        QUERYGEN_INFO("Loaded configuration from {} ({} queries, {} time buckets, target {:.3f} QPS)",
                      config_path, config.queries.size(), config.time_buckets.size(),
                      config.query.target_qps);

        querygen::QueryGenerator generator(config);
        if (validate_only) {
            QUERYGEN_INFO("Configuration is valid");
            return 0;
        }

        generator.Start();
        QUERYGEN_INFO("Query load generator running. Press Ctrl+C to stop.");
        generator.Wait();
        generator.Stop();
        return 0;
    } catch (const std::exception& e) {
        QUERYGEN_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
