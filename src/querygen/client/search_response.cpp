#include "querygen/client/search_response.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace querygen {
namespace client {

namespace {

int64_t SpansIn(const rapidjson::Value& span_set) {
    if (!span_set.IsObject()) {
        return 0;
    }
    auto spans = span_set.FindMember("spans");
    if (spans == span_set.MemberEnd() || !spans->value.IsArray()) {
        return 0;
    }
    return static_cast<int64_t>(spans->value.Size());
}

} // namespace

core::Result<int64_t> CountSpans(const std::string& body) {
    rapidjson::Document doc;
    doc.Parse(body.c_str(), body.size());
    if (doc.HasParseError()) {
        return core::Result<int64_t>::error(
            std::string("error parsing response JSON: ") +
            rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        return core::Result<int64_t>::error("error parsing response JSON: not an object");
    }

    auto traces = doc.FindMember("traces");
    if (traces == doc.MemberEnd() || traces->value.IsNull()) {
        return core::Result<int64_t>(0);
    }
    if (!traces->value.IsArray()) {
        return core::Result<int64_t>::error("error parsing response JSON: traces is not an array");
    }

    int64_t count = 0;
    for (const auto& trace : traces->value.GetArray()) {
        if (!trace.IsObject()) {
            continue;
        }
        auto span_sets = trace.FindMember("spanSets");
        if (span_sets != trace.MemberEnd() && span_sets->value.IsArray()) {
            for (const auto& span_set : span_sets->value.GetArray()) {
                count += SpansIn(span_set);
            }
        }
        auto span_set = trace.FindMember("spanSet");
        if (span_set != trace.MemberEnd()) {
            count += SpansIn(span_set->value);
        }
    }
    return core::Result<int64_t>(count);
}

} // namespace client
} // namespace querygen
