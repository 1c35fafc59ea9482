#include "querygen/core/types.h"
#include "querygen/core/duration.h"
#include <algorithm>
#include <sstream>

namespace querygen {
namespace core {

std::string TimeBucket::to_string() const {
    std::ostringstream oss;
    oss << name << "[" << FormatDuration(age_min) << ".." << FormatDuration(age_max)
        << " weight=" << weight << "]";
    return oss.str();
}

// Whole seconds are rounded inwards so the window never grows past its bounds
int64_t TimeRange::start_seconds() const {
    const int64_t rounded =
        std::chrono::ceil<std::chrono::seconds>(start.time_since_epoch()).count();
    return std::min(rounded, end_seconds());
}

int64_t TimeRange::end_seconds() const {
    return std::chrono::floor<std::chrono::seconds>(end.time_since_epoch()).count();
}

} // namespace core
} // namespace querygen
