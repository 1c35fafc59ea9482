#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "querygen/core/result.h"
#include "querygen/core/types.h"

namespace querygen {
namespace client {

/**
 * @brief One read request against the backend
 */
struct SearchRequest {
    std::string expression;
    std::optional<core::TimeRange> range;   // absent for "immediate"
    size_t limit = 1000;
};

/**
 * @brief Raw backend answer; interpretation is left to the caller
 */
struct SearchResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status > 0 && status < 300; }
};

/**
 * @brief Backend query interface
 *
 * One instance per worker. Search() may block for the request timeout;
 * Cancel() may be called from another thread and aborts an in-flight
 * request. Transport failures are reported through the Result.
 */
class BackendClient {
public:
    virtual ~BackendClient() = default;

    virtual core::Result<SearchResponse> Search(const SearchRequest& request) = 0;

    virtual void Cancel() = 0;

    /**
     * @brief Human-readable request description for logs, secrets masked
     */
    virtual std::string Describe(const SearchRequest& request) const = 0;
};

using ClientFactory = std::function<std::unique_ptr<BackendClient>()>;

} // namespace client
} // namespace querygen
