#include "stats.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

#include "utils/log.hpp"

FieldSummary summarize(const Field2D& U, const GridSpec& spec) {
    FieldSummary s{std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity(), 0.0, 0, 0};
    double sum = 0.0;
    for (size_t k = 0; k < U.size(); ++k) {
        if (missing_at(U, k, spec.missing_value)) {
            ++s.missing;
            continue;
        }
        double x = U.value(k);
        s.min = std::min(s.min, x);
        s.max = std::max(s.max, x);
        sum += x;
        ++s.valid;
    }
    s.avg = s.valid > 0 ? sum / s.valid : 0.0;
    return s;
}

void report_summary(const std::string& label, const DataSeries& series) {
    if (log_quiet()) return;
    double sum = 0.0;
    size_t valid = 0, missing = 0;
    for (const auto& sample : series) {
        auto s = summarize(sample.field, series.spec());
        sum += s.avg * s.valid;
        valid += s.valid;
        missing += s.missing;
    }
    auto range = series.global_range();
    std::cout << label << " -> frames: " << series.size() << ", grid: " << series.spec().nx << "x"
              << series.spec().ny << ", min: " << range.min << ", max: " << range.max
              << ", avg: " << (valid > 0 ? sum / valid : 0.0) << ", missing cells: " << missing << "\n";
}
