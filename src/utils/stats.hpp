#pragma once
#include <string>

#include "series/data_series.hpp"

struct FieldSummary {
    double min, max, avg;
    size_t valid, missing;
};

FieldSummary summarize(const Field2D& U, const GridSpec& spec);

void report_summary(const std::string& label, const DataSeries& series);
