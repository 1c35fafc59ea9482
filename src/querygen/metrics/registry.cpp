#include "querygen/metrics/registry.h"
#include "querygen/core/error.h"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <ostream>
#include <sstream>

namespace querygen {
namespace metrics {

namespace {

std::string FormatValue(core::Value value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    return fmt::format("{}", value);
}

bool IsNameChar(char c, bool first) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':') {
        return true;
    }
    return !first && c >= '0' && c <= '9';
}

} // namespace

std::string EscapeLabelValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default:   escaped += c;
        }
    }
    return escaped;
}

std::string SanitizeMetricName(const std::string& name) {
    std::string sanitized = name;
    for (size_t i = 0; i < sanitized.size(); ++i) {
        if (!IsNameChar(sanitized[i], i == 0)) {
            sanitized[i] = '_';
        }
    }
    return sanitized;
}

Family::Family(std::string name, std::string help, std::vector<std::string> label_names)
    : name_(std::move(name)), help_(std::move(help)), label_names_(std::move(label_names)) {
    if (name_.empty() || SanitizeMetricName(name_) != name_) {
        throw core::InvalidArgumentError("Invalid metric name: '" + name_ + "'");
    }
}

void Family::CheckLabels(const LabelValues& labels) const {
    if (labels.size() != label_names_.size()) {
        throw core::InvalidArgumentError(
            "Metric " + name_ + " expects " + std::to_string(label_names_.size()) +
            " label values, got " + std::to_string(labels.size()));
    }
}

void Family::RenderHeader(std::ostream& out, const char* type) const {
    out << "# HELP " << name_ << " " << help_ << "\n";
    out << "# TYPE " << name_ << " " << type << "\n";
}

std::string Family::FormatLabels(const LabelValues& labels,
                                 const std::string& extra_name,
                                 const std::string& extra_value) const {
    if (labels.empty() && extra_name.empty()) {
        return "";
    }
    std::string out = "{";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) out += ",";
        out += label_names_[i] + "=\"" + EscapeLabelValue(labels[i]) + "\"";
    }
    if (!extra_name.empty()) {
        if (!labels.empty()) out += ",";
        out += extra_name + "=\"" + extra_value + "\"";
    }
    out += "}";
    return out;
}

void CounterFamily::Inc(const LabelValues& labels, core::Value amount) {
    CheckLabels(labels);
    if (amount < 0) {
        throw core::InvalidArgumentError("Counter " + name_ + " cannot decrease");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    values_[labels] += amount;
}

core::Value CounterFamily::Get(const LabelValues& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(labels);
    return it == values_.end() ? 0.0 : it->second;
}

void CounterFamily::Render(std::ostream& out) const {
    RenderHeader(out, "counter");
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [labels, value] : values_) {
        out << name_ << FormatLabels(labels) << " " << FormatValue(value) << "\n";
    }
}

HistogramFamily::HistogramFamily(std::string name, std::string help,
                                 std::vector<std::string> label_names,
                                 std::vector<core::Value> bounds)
    : Family(std::move(name), std::move(help), std::move(label_names)),
      bounds_(std::move(bounds)) {
    // Fail at registration rather than on first observation
    histogram::FixedBucketHistogram::create(bounds_);
}

void HistogramFamily::Observe(const LabelValues& labels, core::Value value) {
    CheckLabels(labels);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& child = children_[labels];
    if (!child) {
        child = histogram::FixedBucketHistogram::create(bounds_);
    }
    child->add(value);
}

const histogram::Histogram* HistogramFamily::Get(const LabelValues& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(labels);
    return it == children_.end() ? nullptr : it->second.get();
}

void HistogramFamily::Render(std::ostream& out) const {
    RenderHeader(out, "histogram");
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [labels, child] : children_) {
        uint64_t cumulative = 0;
        for (const auto& bucket : child->buckets()) {
            cumulative += bucket.count;
            out << name_ << "_bucket"
                << FormatLabels(labels, "le", FormatValue(bucket.upper_bound))
                << " " << cumulative << "\n";
        }
        out << name_ << "_sum" << FormatLabels(labels) << " " << FormatValue(child->sum()) << "\n";
        out << name_ << "_count" << FormatLabels(labels) << " " << cumulative << "\n";
    }
}

CounterFamily& Registry::AddCounter(const std::string& name, const std::string& help,
                                    std::vector<std::string> label_names) {
    return static_cast<CounterFamily&>(
        Add(std::make_unique<CounterFamily>(name, help, std::move(label_names))));
}

HistogramFamily& Registry::AddHistogram(const std::string& name, const std::string& help,
                                        std::vector<std::string> label_names,
                                        std::vector<core::Value> bounds) {
    return static_cast<HistogramFamily&>(
        Add(std::make_unique<HistogramFamily>(name, help, std::move(label_names),
                                              std::move(bounds))));
}

Family& Registry::Add(std::unique_ptr<Family> family) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : families_) {
        if (existing->name() == family->name()) {
            throw core::InvalidArgumentError("Metric already registered: " + family->name());
        }
    }
    families_.push_back(std::move(family));
    return *families_.back();
}

std::string Registry::Render() const {
    std::ostringstream oss;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& family : families_) {
        family->Render(oss);
    }
    return oss.str();
}

} // namespace metrics
} // namespace querygen
