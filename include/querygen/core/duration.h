#pragma once

#include <string>
#include "querygen/core/types.h"
#include "querygen/core/result.h"

namespace querygen {
namespace core {

/**
 * @brief Parse a Go-style duration string ("300ms", "1m30s", "1.5h", "-2s")
 *
 * Accepted units: ns, us, µs, ms, s, m, h. A bare "0" is accepted.
 * Sub-millisecond remainders are truncated.
 */
Result<Duration> ParseDuration(const std::string& text);

/**
 * @brief Render a duration in the same syntax, e.g. "1h5m" or "250ms"
 */
std::string FormatDuration(Duration duration);

} // namespace core
} // namespace querygen
