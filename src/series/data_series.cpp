#include "data_series.hpp"

#include <algorithm>
#include <limits>

namespace {

std::string stamp(Timestamp t) { return format_timestamp(t, "%Y-%m-%dT%H:%M:%SZ"); }

}  // namespace

DataSeries::DataSeries(GridSpec spec, std::vector<Sample> samples)
    : spec_(std::move(spec)), samples_(std::move(samples)) {
    validate();
}

DataSeries::DataSeries(GridSpec spec, const std::map<Timestamp, Field2D>& grids) : spec_(std::move(spec)) {
    samples_.reserve(grids.size());
    for (const auto& [t, field] : grids) samples_.push_back({t, field});
    validate();
}

void DataSeries::validate() {
    if (samples_.size() < 2) {
        std::string msg = "DataSeries needs at least 2 timestamps, got " + std::to_string(samples_.size());
        if (!samples_.empty()) msg += " (only " + stamp(samples_.front().time) + ")";
        throw InsufficientFramesError(msg);
    }
    if (spec_.nx == 0 && spec_.ny == 0) {
        spec_.nx = samples_.front().field.nx;
        spec_.ny = samples_.front().field.ny;
    }
    spec_.validate();

    const bool vector = samples_.front().field.is_vector();
    for (size_t k = 0; k < samples_.size(); ++k) {
        const auto& s = samples_[k];
        ensure<ValidationError>(s.field.consistent() && s.field.nx == spec_.nx && s.field.ny == spec_.ny
                                    && s.field.is_vector() == vector,
                                "Grid shape mismatch at " + stamp(s.time) + ": got " + std::to_string(s.field.nx)
                                    + "x" + std::to_string(s.field.ny) + ", expected " + std::to_string(spec_.nx)
                                    + "x" + std::to_string(spec_.ny));
        if (k > 0)
            ensure<ValidationError>(s.time > samples_[k - 1].time,
                                    "Timestamps not strictly increasing at " + stamp(s.time));
    }

    double lo = std::numeric_limits<double>::infinity();
    double hi = -lo;
    for (const auto& s : samples_) {
        size_t valid = 0;
        for (size_t k = 0; k < s.field.size(); ++k) {
            if (missing_at(s.field, k, spec_.missing_value)) continue;
            const double x = s.field.value(k);
            lo = std::min(lo, x);
            hi = std::max(hi, x);
            ++valid;
        }
        ensure<ValidationError>(valid > 0, "Grid at " + stamp(s.time) + " contains only missing values");
    }
    range_ = {lo, hi};
}
