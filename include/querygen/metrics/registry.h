#ifndef QUERYGEN_METRICS_REGISTRY_H_
#define QUERYGEN_METRICS_REGISTRY_H_

#include <map>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "querygen/core/types.h"
#include "querygen/histogram/histogram.h"

namespace querygen {
namespace metrics {

using LabelValues = std::vector<std::string>;

/**
 * @brief Escape a label value for the text exposition format
 */
std::string EscapeLabelValue(const std::string& value);

/**
 * @brief Replace characters that are not valid in a metric name with '_'
 */
std::string SanitizeMetricName(const std::string& name);

/**
 * @brief A named metric with a fixed set of label names
 */
class Family {
public:
    Family(std::string name, std::string help, std::vector<std::string> label_names);
    virtual ~Family() = default;

    virtual void Render(std::ostream& out) const = 0;

    const std::string& name() const { return name_; }
    const std::vector<std::string>& label_names() const { return label_names_; }

protected:
    /**
     * @throws core::InvalidArgumentError on a label count mismatch
     */
    void CheckLabels(const LabelValues& labels) const;

    void RenderHeader(std::ostream& out, const char* type) const;

    /**
     * @brief Render {a="x",b="y"}, with an optional trailing extra pair
     */
    std::string FormatLabels(const LabelValues& labels,
                             const std::string& extra_name = "",
                             const std::string& extra_value = "") const;

    const std::string name_;
    const std::string help_;
    const std::vector<std::string> label_names_;
};

/**
 * @brief Monotonic counter
 */
class CounterFamily : public Family {
public:
    using Family::Family;

    /**
     * @throws core::InvalidArgumentError if the label value count does not
     *         match the family's label names
     */
    void Inc(const LabelValues& labels, core::Value amount = 1.0);

    /**
     * @brief Current value, 0 for a label set never incremented
     */
    core::Value Get(const LabelValues& labels) const;

    void Render(std::ostream& out) const override;

private:
    mutable std::mutex mutex_;
    std::map<LabelValues, core::Value> values_;
};

/**
 * @brief Histogram metric; one FixedBucketHistogram per label set
 */
class HistogramFamily : public Family {
public:
    /**
     * @throws core::InvalidArgumentError on empty or unsorted bounds
     */
    HistogramFamily(std::string name, std::string help,
                    std::vector<std::string> label_names,
                    std::vector<core::Value> bounds);

    void Observe(const LabelValues& labels, core::Value value);

    /**
     * @brief Histogram for a label set, nullptr if nothing was observed
     */
    const histogram::Histogram* Get(const LabelValues& labels) const;

    void Render(std::ostream& out) const override;

private:
    const std::vector<core::Value> bounds_;

    mutable std::mutex mutex_;
    std::map<LabelValues, std::unique_ptr<histogram::FixedBucketHistogram>> children_;
};

/**
 * @brief Owns metric families and renders them in the Prometheus text
 *        format (version 0.0.4)
 */
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @throws core::InvalidArgumentError if the name is already registered
     */
    CounterFamily& AddCounter(const std::string& name, const std::string& help,
                              std::vector<std::string> label_names);

    HistogramFamily& AddHistogram(const std::string& name, const std::string& help,
                                  std::vector<std::string> label_names,
                                  std::vector<core::Value> bounds);

    std::string Render() const;

    static constexpr const char* kContentType = "text/plain; version=0.0.4; charset=utf-8";

private:
    Family& Add(std::unique_ptr<Family> family);

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Family>> families_;   // registration order
};

} // namespace metrics
} // namespace querygen

#endif // QUERYGEN_METRICS_REGISTRY_H_
