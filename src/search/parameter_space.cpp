#include "elevation_tuner/search/parameter_space.hpp"
#include "elevation_tuner/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace elevation_tuner::search {

ParameterSpace::ParameterSpace(std::vector<Dimension> dims) {
    for (auto& d : dims) {
        add(d.name, std::move(d.values));
    }
}

void ParameterSpace::add(const std::string& name, std::vector<double> values) {
    if (!config::PipelineParams::is_known(name)) {
        throw ConfigError("unknown search dimension '" + name + "'");
    }
    if (values.empty()) {
        throw ConfigError("search dimension '" + name + "' has no values");
    }
    for (const auto& d : dims_) {
        if (d.name == name) {
            throw ConfigError("search dimension '" + name + "' given twice");
        }
    }
    dims_.push_back({name, std::move(values)});
}

size_t ParameterSpace::size() const {
    if (dims_.empty()) return 1;
    size_t total = 1;
    for (const auto& d : dims_) {
        if (total > std::numeric_limits<size_t>::max() / d.values.size()) {
            throw ConfigError("search space too large");
        }
        total *= d.values.size();
    }
    return total;
}

config::PipelineParams ParameterSpace::apply(const config::PipelineParams& base,
                                             size_t index) const {
    config::PipelineParams p = base;
    // Mixed-radix decode, last dimension fastest.
    for (size_t k = dims_.size(); k-- > 0;) {
        const auto& d = dims_[k];
        const size_t radix = d.values.size();
        p.set(d.name, d.values[index % radix]);
        index /= radix;
    }
    return p;
}

static std::string label_for(const ParameterSpace& space, const config::PipelineParams& p) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& d : space.dimensions()) {
        if (!first) oss << ' ';
        oss << d.name << '=' << config::PipelineParams::decode_option(d.name, p.get(d.name));
        first = false;
    }
    return oss.str();
}

GridSequence::GridSequence(config::PipelineParams base, ParameterSpace space, size_t first_index)
    : base_(std::move(base)), space_(std::move(space)), first_index_(first_index) {}

config::Configuration GridSequence::at(size_t index) const {
    config::PipelineParams p = space_.apply(base_, index);
    std::string label = label_for(space_, p);
    return config::Configuration(first_index_ + index, std::move(p), std::move(label));
}

bool GridSequence::next(config::Configuration& out) {
    if (cursor_ >= size()) return false;
    out = at(cursor_++);
    return true;
}

ScanSequence::ScanSequence(config::PipelineParams base, std::string parameter, double start,
                           double stop, double step, size_t first_index)
    : base_(std::move(base)),
      parameter_(std::move(parameter)),
      start_(start),
      step_(step),
      first_index_(first_index) {
    const auto* spec = config::PipelineParams::find_spec(parameter_);
    if (!spec) {
        throw ConfigError("scan parameter '" + parameter_ + "' is not numeric");
    }
    if (!(step_ > 0.0) || !std::isfinite(start_) || !std::isfinite(stop)) {
        throw ConfigError("scan requires finite bounds and step > 0");
    }
    // Keep to grid points inside the knob's bounds so none clamp to a duplicate.
    if (start_ < spec->min_value) {
        start_ += std::ceil((spec->min_value - start_) / step_ - 1e-9) * step_;
    }
    stop = std::min(stop, spec->max_value);
    if (stop >= start_) {
        count_ = static_cast<size_t>(std::floor((stop - start_) / step_ + 1e-9)) + 1;
    }
}

config::Configuration ScanSequence::at(size_t index) const {
    config::PipelineParams p = base_;
    p.set(parameter_, value_at(index));
    std::ostringstream label;
    label << parameter_ << '=' << p.get(parameter_);
    return config::Configuration(first_index_ + index, std::move(p), label.str());
}

bool ScanSequence::next(config::Configuration& out) {
    if (cursor_ >= count_) return false;
    out = at(cursor_++);
    return true;
}

std::vector<double> linspace(double start, double stop, size_t count) {
    std::vector<double> out;
    if (count == 0) return out;
    if (count == 1) {
        out.push_back(start);
        return out;
    }
    out.reserve(count);
    const double step = (stop - start) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(i + 1 == count ? stop : start + static_cast<double>(i) * step);
    }
    return out;
}

std::vector<config::Configuration> collect(ConfigSequence& seq) {
    std::vector<config::Configuration> out;
    seq.reset();
    out.reserve(seq.size());
    config::Configuration cfg;
    while (seq.next(cfg)) {
        out.push_back(cfg);
    }
    seq.reset();
    return out;
}

} // namespace elevation_tuner::search
