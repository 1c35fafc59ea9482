#pragma once

#include <memory>
#include <optional>
#include <string>

#include "querygen/client/backend_client.h"
#include "querygen/core/config.h"

namespace httplib {
class Client;
}

namespace querygen {
namespace client {

/**
 * @brief Resolved connection settings shared by every worker's client
 */
struct TempoClientOptions {
    std::string scheme_host_port;   // e.g. "https://gateway:8080"
    std::string search_path;        // base path prefix + search path, tenant substituted
    std::string tenant_id;
    std::optional<std::string> bearer_token;
    bool insecure_skip_verify = true;
    core::Duration connect_timeout = std::chrono::seconds(10);
    core::Duration read_timeout = std::chrono::minutes(15);

    /**
     * @brief Derive options from the backend configuration
     * @throws core::InvalidArgumentError for a malformed or unsupported endpoint
     */
    static TempoClientOptions FromConfig(const core::BackendConfig& config,
                                         std::optional<std::string> bearer_token);
};

/**
 * @brief Read a service-account token; a missing file is not an error
 */
std::optional<std::string> LoadBearerToken(const std::string& path);

/**
 * @brief Tempo search API client over cpp-httplib
 *
 * Issues GET {search_path}?q=...&start=...&end=...&limit=... with the
 * bearer token and X-Scope-OrgID headers. Not shared between threads
 * except for Cancel().
 */
class TempoClient : public BackendClient {
public:
    explicit TempoClient(TempoClientOptions options);
    ~TempoClient() override;

    TempoClient(const TempoClient&) = delete;
    TempoClient& operator=(const TempoClient&) = delete;

    core::Result<SearchResponse> Search(const SearchRequest& request) override;
    void Cancel() override;
    std::string Describe(const SearchRequest& request) const override;

    /**
     * @brief Request target (path and encoded query string) for a request
     */
    std::string Target(const SearchRequest& request) const;

    static ClientFactory Factory(TempoClientOptions options);

private:
    TempoClientOptions options_;
    std::unique_ptr<httplib::Client> client_;
};

} // namespace client
} // namespace querygen
