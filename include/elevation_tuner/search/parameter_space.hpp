#pragma once

#include "elevation_tuner/config/configuration.hpp"

#include <string>
#include <vector>

namespace elevation_tuner::search {

struct Dimension {
    std::string name;
    std::vector<double> values;
};

// Ordered list of dimensions. The last dimension varies fastest.
class ParameterSpace {
public:
    ParameterSpace() = default;
    explicit ParameterSpace(std::vector<Dimension> dims);

    // Throws ConfigError for unknown knobs or empty value lists.
    void add(const std::string& name, std::vector<double> values);

    const std::vector<Dimension>& dimensions() const { return dims_; }
    size_t size() const;

    // Applies the index-th combination on top of base.
    config::PipelineParams apply(const config::PipelineParams& base, size_t index) const;

private:
    std::vector<Dimension> dims_;
};

// Lazy, finite, restartable source of configurations.
class ConfigSequence {
public:
    virtual ~ConfigSequence() = default;

    // Writes the next configuration into out; false once exhausted.
    virtual bool next(config::Configuration& out) = 0;
    virtual void reset() = 0;
    virtual size_t size() const = 0;
};

class GridSequence : public ConfigSequence {
public:
    GridSequence(config::PipelineParams base, ParameterSpace space, size_t first_index = 0);

    bool next(config::Configuration& out) override;
    void reset() override { cursor_ = 0; }
    size_t size() const override { return space_.size(); }

    config::Configuration at(size_t index) const;

private:
    config::PipelineParams base_;
    ParameterSpace space_;
    size_t first_index_;
    size_t cursor_ = 0;
};

// start + i * step for i = 0 .. floor((stop - start) / step), stop inclusive.
class ScanSequence : public ConfigSequence {
public:
    ScanSequence(config::PipelineParams base, std::string parameter, double start,
                 double stop, double step, size_t first_index = 0);

    bool next(config::Configuration& out) override;
    void reset() override { cursor_ = 0; }
    size_t size() const override { return count_; }

    double value_at(size_t index) const { return start_ + static_cast<double>(index) * step_; }
    config::Configuration at(size_t index) const;

private:
    config::PipelineParams base_;
    std::string parameter_;
    double start_;
    double step_;
    size_t count_ = 0;
    size_t first_index_;
    size_t cursor_ = 0;
};

// count evenly spaced values in [start, stop]; count == 1 gives {start}.
std::vector<double> linspace(double start, double stop, size_t count);

// Drains a sequence from its beginning; leaves it reset.
std::vector<config::Configuration> collect(ConfigSequence& seq);

} // namespace elevation_tuner::search
