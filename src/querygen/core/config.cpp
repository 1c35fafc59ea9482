#include "querygen/core/config.h"
#include "querygen/core/duration.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace querygen {
namespace core {

const char* ToString(IneligiblePolicy policy) {
    switch (policy) {
        case IneligiblePolicy::FALLBACK_IMMEDIATE: return "immediate";
        case IneligiblePolicy::SKIP: return "skip";
    }
    return "unknown";
}

double GeneratorConfig::EffectiveTargetQps(const QueryTemplate& query) const {
    if (query.target_qps) {
        return *query.target_qps;
    }
    if (queries.empty()) {
        return this->query.target_qps;
    }
    return this->query.target_qps / static_cast<double>(queries.size());
}

int GeneratorConfig::EffectiveConcurrency(const QueryTemplate& query) const {
    return query.concurrency ? *query.concurrency : this->query.concurrent_queries;
}

namespace {

using rapidjson::Value;

constexpr int64_t kMaxInt = std::numeric_limits<int>::max();

// Each helper returns an empty string on success, the error text otherwise.

std::string ReadString(const Value& obj, const char* key, const std::string& path,
                       std::string& out, bool required) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return required ? path + "." + key + " is required" : "";
    }
    if (!it->value.IsString()) {
        return path + "." + key + " must be a string";
    }
    out.assign(it->value.GetString(), it->value.GetStringLength());
    return "";
}

std::string ReadDuration(const Value& obj, const char* key, const std::string& path,
                         Duration& out, bool required) {
    std::string text;
    std::string err = ReadString(obj, key, path, text, required);
    if (!err.empty() || obj.FindMember(key) == obj.MemberEnd()) {
        return err;
    }
    auto parsed = ParseDuration(text);
    if (!parsed.ok()) {
        return path + "." + key + ": " + parsed.error();
    }
    out = parsed.value();
    return "";
}

std::string ReadDouble(const Value& obj, const char* key, const std::string& path,
                       double& out, bool required) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return required ? path + "." + key + " is required" : "";
    }
    if (!it->value.IsNumber()) {
        return path + "." + key + " must be a number";
    }
    out = it->value.GetDouble();
    return "";
}

std::string ReadInt(const Value& obj, const char* key, const std::string& path,
                    int64_t& out, bool required) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return required ? path + "." + key + " is required" : "";
    }
    if (!it->value.IsInt64()) {
        return path + "." + key + " must be an integer";
    }
    out = it->value.GetInt64();
    return "";
}

std::string ReadBool(const Value& obj, const char* key, const std::string& path, bool& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return "";
    }
    if (!it->value.IsBool()) {
        return path + "." + key + " must be a boolean";
    }
    out = it->value.GetBool();
    return "";
}

const Value* FindObject(const Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsObject()) {
        return nullptr;
    }
    return &it->value;
}

std::string ParseBackend(const Value& root, GeneratorConfig& config) {
    const Value* tempo = FindObject(root, "tempo");
    if (!tempo) {
        return "tempo section is required";
    }
    auto& backend = config.backend;
    std::string err;
    if (!(err = ReadString(*tempo, "queryEndpoint", "tempo", backend.query_endpoint, true)).empty()) return err;
    if (backend.query_endpoint.empty()) return "tempo.queryEndpoint must not be empty";
    if (!(err = ReadString(*tempo, "searchPath", "tempo", backend.search_path, false)).empty()) return err;
    if (!(err = ReadString(*tempo, "tokenPath", "tempo", backend.token_path, false)).empty()) return err;
    if (!(err = ReadBool(*tempo, "insecureSkipVerify", "tempo", backend.insecure_skip_verify)).empty()) return err;
    if (!(err = ReadDuration(*tempo, "timeout", "tempo", backend.timeout, false)).empty()) return err;
    if (backend.timeout <= Duration(0)) return "tempo.timeout must be positive";
    return ReadString(root, "tenantId", "", backend.tenant_id, false);
}

std::string ParseQuerySection(const Value& root, GeneratorConfig& config) {
    const Value* section = FindObject(root, "query");
    if (!section) {
        return "query section is required";
    }
    auto& query = config.query;
    std::string err;
    if (!(err = ReadDuration(*section, "delay", "query", query.delay, false)).empty()) return err;

    int64_t concurrency = 0;
    if (!(err = ReadInt(*section, "concurrentQueries", "query", concurrency, true)).empty()) return err;
    if (concurrency < 1) {
        return "query.concurrentQueries must be >= 1, got: " + std::to_string(concurrency);
    }
    if (concurrency > kMaxInt) {
        return "query.concurrentQueries must be <= " + std::to_string(kMaxInt) +
               ", got: " + std::to_string(concurrency);
    }
    query.concurrent_queries = static_cast<int>(concurrency);

    if (!(err = ReadDouble(*section, "targetQPS", "query", query.target_qps, true)).empty()) return err;
    if (!(query.target_qps > 0.0)) {
        return "query.targetQPS must be > 0, got: " + std::to_string(query.target_qps);
    }

    int64_t limit = static_cast<int64_t>(query.limit);
    if (!(err = ReadInt(*section, "limit", "query", limit, false)).empty()) return err;
    if (limit < 1) return "query.limit must be >= 1";
    query.limit = static_cast<size_t>(limit);

    if (!(err = ReadDuration(*section, "startupStagger", "query", query.startup_stagger, false)).empty()) return err;
    if (query.startup_stagger < Duration(0)) return "query.startupStagger must not be negative";

    if (!(err = ReadDouble(*section, "windowJitter", "query", query.window_jitter, false)).empty()) return err;
    if (query.window_jitter < 0.0 || query.window_jitter > 1.0) {
        return "query.windowJitter must be within [0, 1]";
    }

    std::string policy;
    if (!(err = ReadString(*section, "ineligibleBucketPolicy", "query", policy, false)).empty()) return err;
    if (policy.empty() || policy == "immediate") {
        query.ineligible_policy = IneligiblePolicy::FALLBACK_IMMEDIATE;
    } else if (policy == "skip") {
        query.ineligible_policy = IneligiblePolicy::SKIP;
    } else {
        return "query.ineligibleBucketPolicy must be \"immediate\" or \"skip\", got: " + policy;
    }
    return "";
}

std::string ParseMetricsSection(const Value& root, GeneratorConfig& config) {
    const Value* section = FindObject(root, "metrics");
    if (!section) {
        return "";
    }
    std::string err;
    if (!(err = ReadString(*section, "listenAddress", "metrics", config.metrics.listen_address, false)).empty()) return err;
    int64_t port = config.metrics.port;
    if (!(err = ReadInt(*section, "port", "metrics", port, false)).empty()) return err;
    if (port < 1 || port > 65535) return "metrics.port must be within 1..65535";
    config.metrics.port = static_cast<uint16_t>(port);
    return "";
}

std::string ParseTimeBuckets(const Value& root, GeneratorConfig& config) {
    auto it = root.FindMember("timeBuckets");
    if (it == root.MemberEnd()) {
        return "";
    }
    if (!it->value.IsArray()) {
        return "timeBuckets must be an array";
    }
    for (rapidjson::SizeType i = 0; i < it->value.Size(); ++i) {
        const Value& entry = it->value[i];
        std::string path = "timeBuckets[" + std::to_string(i) + "]";
        if (!entry.IsObject()) return path + " must be an object";

        TimeBucket bucket;
        std::string err;
        if (!(err = ReadString(entry, "name", path, bucket.name, true)).empty()) return err;
        // Error text names the bucket, matching how operators read the config
        path = "bucket " + bucket.name;
        if (!(err = ReadDuration(entry, "ageStart", path, bucket.age_min, true)).empty()) return err;
        if (!(err = ReadDuration(entry, "ageEnd", path, bucket.age_max, true)).empty()) return err;
        int64_t weight = 1;
        if (!(err = ReadInt(entry, "weight", path, weight, false)).empty()) return err;
        if (weight < 0) return path + ": weight must not be negative";
        if (weight > kMaxInt) return path + ": weight must be <= " + std::to_string(kMaxInt);
        bucket.weight = static_cast<int>(weight);
        config.time_buckets.push_back(std::move(bucket));
    }
    return "";
}

std::string ParseQueries(const Value& root, GeneratorConfig& config) {
    auto it = root.FindMember("queries");
    if (it == root.MemberEnd() || !it->value.IsArray() || it->value.Empty()) {
        return "No queries defined in configuration";
    }
    for (rapidjson::SizeType i = 0; i < it->value.Size(); ++i) {
        const Value& entry = it->value[i];
        std::string path = "queries[" + std::to_string(i) + "]";
        if (!entry.IsObject()) return path + " must be an object";

        QueryTemplate query;
        std::string err;
        if (!(err = ReadString(entry, "name", path, query.name, true)).empty()) return err;
        if (query.name.empty()) return path + ".name must not be empty";
        if (!(err = ReadString(entry, "traceql", path, query.expression, true)).empty()) return err;

        if (entry.HasMember("concurrency")) {
            int64_t concurrency = 0;
            if (!(err = ReadInt(entry, "concurrency", path, concurrency, true)).empty()) return err;
            if (concurrency < 1) return "query " + query.name + ": concurrency must be >= 1";
            if (concurrency > kMaxInt) {
                return "query " + query.name + ": concurrency must be <= " + std::to_string(kMaxInt);
            }
            query.concurrency = static_cast<int>(concurrency);
        }
        if (entry.HasMember("targetQPS")) {
            double qps = 0.0;
            if (!(err = ReadDouble(entry, "targetQPS", path, qps, true)).empty()) return err;
            if (!(qps > 0.0)) return "query " + query.name + ": targetQPS must be > 0";
            query.target_qps = qps;
        }
        config.queries.push_back(std::move(query));
    }
    return "";
}

std::string ParseExecutionPlan(const Value& root, GeneratorConfig& config) {
    auto it = root.FindMember("executionPlan");
    if (it == root.MemberEnd() || !it->value.IsArray() || it->value.Empty()) {
        return "No executionPlan defined in configuration";
    }
    for (rapidjson::SizeType i = 0; i < it->value.Size(); ++i) {
        const Value& entry = it->value[i];
        std::string path = "executionPlan[" + std::to_string(i) + "]";
        if (!entry.IsObject()) return path + " must be an object";

        PlanEntry plan_entry;
        std::string err;
        if (!(err = ReadString(entry, "queryName", path, plan_entry.query_name, true)).empty()) return err;
        if (!(err = ReadString(entry, "bucketName", path, plan_entry.bucket_name, true)).empty()) return err;
        config.execution_plan.push_back(std::move(plan_entry));
    }
    return "";
}

} // namespace

Result<GeneratorConfig> ParseConfig(const std::string& json_text) {
    rapidjson::Document doc;
    doc.Parse(json_text.c_str(), json_text.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "failed to parse config: " << rapidjson::GetParseError_En(doc.GetParseError())
            << " (offset " << doc.GetErrorOffset() << ")";
        return Result<GeneratorConfig>::error(oss.str());
    }
    if (!doc.IsObject()) {
        return Result<GeneratorConfig>::error("failed to parse config: top level must be an object");
    }

    GeneratorConfig config;
    std::string err;
    if (!(err = ReadString(doc, "logLevel", "", config.log_level, false)).empty() ||
        !(err = ReadString(doc, "namespace", "", config.namespace_name, true)).empty() ||
        !(err = ParseBackend(doc, config)).empty() ||
        !(err = ParseQuerySection(doc, config)).empty() ||
        !(err = ParseMetricsSection(doc, config)).empty() ||
        !(err = ParseTimeBuckets(doc, config)).empty() ||
        !(err = ParseQueries(doc, config)).empty() ||
        !(err = ParseExecutionPlan(doc, config)).empty()) {
        if (!err.empty() && err[0] == '.') {
            err.erase(0, 1);
        }
        return Result<GeneratorConfig>::error(err);
    }
    if (config.namespace_name.empty()) {
        return Result<GeneratorConfig>::error("namespace must not be empty");
    }
    return Result<GeneratorConfig>(std::move(config));
}

Result<GeneratorConfig> LoadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<GeneratorConfig>::error("failed to read config file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return ParseConfig(contents.str());
}

} // namespace core
} // namespace querygen
