#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "querygen/core/types.h"
#include "querygen/core/result.h"

namespace querygen {
namespace core {

/**
 * @brief What a worker does when its plan entry names a bucket that
 *        cannot contain data yet
 */
enum class IneligiblePolicy {
    FALLBACK_IMMEDIATE,   // query without a time range
    SKIP                  // consume the permit, issue nothing
};

const char* ToString(IneligiblePolicy policy);

/**
 * @brief Connection settings for the Tempo search API
 */
struct BackendConfig {
    std::string query_endpoint;                     // scheme://host[:port][/prefix]
    std::string search_path = "/api/traces/v1/{tenant}/tempo/api/search";
    std::string tenant_id;
    std::string token_path = "/var/run/secrets/kubernetes.io/serviceaccount/token";
    bool insecure_skip_verify = true;
    Duration timeout = std::chrono::minutes(15);
    Duration connect_timeout = std::chrono::seconds(10);
};

/**
 * @brief Global query pacing defaults
 */
struct QueryConfig {
    Duration delay{1000};                 // legacy, validated but unused
    int concurrent_queries = 1;           // workers per query template
    double target_qps = 1.0;              // total across all templates
    size_t limit = 1000;                  // result-size cap per request
    Duration startup_stagger = std::chrono::seconds(1);
    double window_jitter = 0.5;           // fraction of bucket width
    IneligiblePolicy ineligible_policy = IneligiblePolicy::FALLBACK_IMMEDIATE;
};

/**
 * @brief Prometheus scrape endpoint
 */
struct MetricsConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t port = 2112;
};

/**
 * @brief Complete, immutable run configuration
 */
struct GeneratorConfig {
    std::string log_level = "info";
    std::string namespace_name;
    BackendConfig backend;
    QueryConfig query;
    MetricsConfig metrics;
    std::vector<TimeBucket> time_buckets;
    std::vector<QueryTemplate> queries;
    std::vector<PlanEntry> execution_plan;

    /**
     * @brief Per-template rate: the query's override, else an even share of
     *        query.target_qps
     */
    double EffectiveTargetQps(const QueryTemplate& query) const;

    /**
     * @brief Per-template worker count: the query's override, else
     *        query.concurrent_queries
     */
    int EffectiveConcurrency(const QueryTemplate& query) const;
};

/**
 * @brief Parse and validate a JSON configuration document
 */
Result<GeneratorConfig> ParseConfig(const std::string& json_text);

/**
 * @brief Read and parse a configuration file
 */
Result<GeneratorConfig> LoadConfig(const std::string& path);

} // namespace core
} // namespace querygen
