#pragma once

#include <cstdint>
#include <string>

#include "querygen/core/result.h"

namespace querygen {
namespace client {

/**
 * @brief Count the spans in a Tempo /api/search response body
 *
 * Structural queries report spans under traces[].spanSets[].spans, plain
 * queries under traces[].spanSet.spans; both are summed. A missing
 * "traces" member counts as zero. Malformed JSON is an error.
 */
core::Result<int64_t> CountSpans(const std::string& body);

} // namespace client
} // namespace querygen
