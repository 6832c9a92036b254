#pragma once
#include <string>

#include "encode/encoder.hpp"
#include "series/data_series.hpp"

// Rows of time,i,j,value[,v]. NA, NaN or an empty value is missing, as is
// any cell a timestamp leaves out. The grid shape comes from spec or, when
// nx and ny are zero, from the largest indices seen. Throws ValidationError.
DataSeries load_series_csv(const std::string& path, GridSpec spec);

// Writes <dir>/<source>_<aspect>.<ext>, creating dir. Returns the path.
std::string write_artifact(const std::string& dir, const OutputArtifact& artifact);
