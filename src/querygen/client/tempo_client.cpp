#include "querygen/client/tempo_client.h"
#include "querygen/common/logger.h"
#include "querygen/core/error.h"

#include <httplib.h>

#include <fstream>
#include <sstream>

namespace querygen {
namespace client {

namespace {

constexpr const char* kTenantPlaceholder = "{tenant}";
constexpr size_t kMaskedTokenChars = 20;

std::string TrimWhitespace(const std::string& text) {
    const char* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

httplib::Headers BuildHeaders(const TempoClientOptions& options) {
    httplib::Headers headers;
    if (options.bearer_token) {
        headers.emplace("Authorization", "Bearer " + *options.bearer_token);
    }
    if (!options.tenant_id.empty()) {
        headers.emplace("X-Scope-OrgID", options.tenant_id);
    }
    return headers;
}

httplib::Params BuildParams(const SearchRequest& request) {
    httplib::Params params;
    params.emplace("q", request.expression);
    if (request.range) {
        params.emplace("start", std::to_string(request.range->start_seconds()));
        params.emplace("end", std::to_string(request.range->end_seconds()));
    }
    params.emplace("limit", std::to_string(request.limit));
    return params;
}

} // namespace

TempoClientOptions TempoClientOptions::FromConfig(const core::BackendConfig& config,
                                                  std::optional<std::string> bearer_token) {
    const std::string& endpoint = config.query_endpoint;
    auto scheme_end = endpoint.find("://");
    if (scheme_end == std::string::npos) {
        throw core::InvalidArgumentError(
            "tempo.queryEndpoint must include a scheme (http:// or https://): " + endpoint);
    }
    std::string scheme = endpoint.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw core::InvalidArgumentError("Unsupported scheme in tempo.queryEndpoint: " + scheme);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme == "https") {
        throw core::InvalidArgumentError(
            "tempo.queryEndpoint uses https but this build has no TLS support");
    }
#endif

    TempoClientOptions options;
    auto path_start = endpoint.find('/', scheme_end + 3);
    std::string base_path;
    if (path_start == std::string::npos) {
        options.scheme_host_port = endpoint;
    } else {
        options.scheme_host_port = endpoint.substr(0, path_start);
        base_path = endpoint.substr(path_start);
        while (!base_path.empty() && base_path.back() == '/') {
            base_path.pop_back();
        }
    }
    if (options.scheme_host_port.size() == scheme_end + 3) {
        throw core::InvalidArgumentError("tempo.queryEndpoint has no host: " + endpoint);
    }

    std::string search_path = config.search_path;
    if (search_path.empty() || search_path[0] != '/') {
        search_path = "/" + search_path;
    }
    auto placeholder = search_path.find(kTenantPlaceholder);
    if (placeholder != std::string::npos) {
        if (config.tenant_id.empty()) {
            throw core::InvalidArgumentError(
                "tempo.searchPath contains {tenant} but tenantId is not set");
        }
        search_path.replace(placeholder, std::string(kTenantPlaceholder).size(), config.tenant_id);
    }

    options.search_path = base_path + search_path;
    options.tenant_id = config.tenant_id;
    options.bearer_token = std::move(bearer_token);
    options.insecure_skip_verify = config.insecure_skip_verify;
    options.connect_timeout = config.connect_timeout;
    options.read_timeout = config.timeout;
    return options;
}

std::optional<std::string> LoadBearerToken(const std::string& path) {
    if (path.empty()) {
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file) {
        QUERYGEN_WARN("Failed to read token from {}, requests will be unauthenticated", path);
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    std::string token = TrimWhitespace(contents.str());
    if (token.empty()) {
        QUERYGEN_WARN("Token file {} is empty, requests will be unauthenticated", path);
        return std::nullopt;
    }
    QUERYGEN_INFO("ServiceAccount token loaded from {}", path);
    return token;
}

TempoClient::TempoClient(TempoClientOptions options)
    : options_(std::move(options)),
      client_(std::make_unique<httplib::Client>(options_.scheme_host_port)) {
    auto connect_s = std::chrono::duration_cast<std::chrono::seconds>(options_.connect_timeout);
    auto read_s = std::chrono::duration_cast<std::chrono::seconds>(options_.read_timeout);
    client_->set_connection_timeout(static_cast<time_t>(connect_s.count()), 0);
    client_->set_read_timeout(static_cast<time_t>(read_s.count()), 0);
    client_->set_keep_alive(true);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client_->enable_server_certificate_verification(!options_.insecure_skip_verify);
#endif
}

TempoClient::~TempoClient() = default;

std::string TempoClient::Target(const SearchRequest& request) const {
    return httplib::append_query_params(options_.search_path, BuildParams(request));
}

core::Result<SearchResponse> TempoClient::Search(const SearchRequest& request) {
    auto result = client_->Get(Target(request), BuildHeaders(options_));
    if (!result) {
        return core::Result<SearchResponse>::error(
            "error making http request: " + httplib::to_string(result.error()));
    }

    SearchResponse response;
    response.status = result->status;
    response.body = std::move(result->body);
    return core::Result<SearchResponse>(std::move(response));
}

void TempoClient::Cancel() {
    client_->stop();
}

std::string TempoClient::Describe(const SearchRequest& request) const {
    std::ostringstream oss;
    oss << "Method: GET\n";
    oss << "URL: " << options_.scheme_host_port << Target(request) << "\n";
    oss << "Headers:\n";
    for (const auto& [key, value] : BuildHeaders(options_)) {
        if (key == "Authorization" && value.size() > kMaskedTokenChars) {
            oss << "  " << key << ": " << value.substr(0, kMaskedTokenChars) << "...\n";
        } else {
            oss << "  " << key << ": " << value << "\n";
        }
    }
    return oss.str();
}

ClientFactory TempoClient::Factory(TempoClientOptions options) {
    return [options = std::move(options)]() -> std::unique_ptr<BackendClient> {
        return std::make_unique<TempoClient>(options);
    };
}

} // namespace client
} // namespace querygen
