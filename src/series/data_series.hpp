// Immutable, validated time series of grids for one variable.
#pragma once
#include <map>
#include <utility>
#include <vector>

#include "grid_2d.hpp"
#include "utils/timefmt.hpp"

struct Sample {
    Timestamp time;
    Field2D field;
};

struct ValueRange {
    double min, max;
};

class DataSeries {
public:
    using const_iterator = std::vector<Sample>::const_iterator;

    // Samples must already be in timestamp order; nothing is reordered.
    DataSeries(GridSpec spec, std::vector<Sample> samples);
    DataSeries(GridSpec spec, const std::map<Timestamp, Field2D>& grids);

    const GridSpec& spec() const { return spec_; }
    size_t size() const { return samples_.size(); }
    const Sample& operator[](size_t k) const { return samples_[k]; }
    const_iterator begin() const { return samples_.begin(); }
    const_iterator end() const { return samples_.end(); }

    Timestamp first_time() const { return samples_.front().time; }
    Timestamp last_time() const { return samples_.back().time; }
    Timestamp span_seconds() const { return last_time() - first_time(); }

    // Min/max over finite, non-sentinel values of all grids. Cached at
    // construction.
    ValueRange global_range() const { return range_; }

private:
    void validate();

    GridSpec spec_;
    std::vector<Sample> samples_;
    ValueRange range_{0.0, 0.0};
};
