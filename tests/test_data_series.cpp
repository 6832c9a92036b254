#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <map>

#include "series/data_series.hpp"
#include "test_helpers.hpp"
#include "utils/stats.hpp"

using namespace testutil;

class DataSeriesTest : public ::testing::Test {
protected:
    GridSpec spec{3, 2, -10.0, 40.0, 5.0, 50.0, "C"};
};

TEST_F(DataSeriesTest, KeepsSamplesInOrder) {
    DataSeries s(spec, Samples{{T0, ramp_field(3, 2, 0)},
                               {T0 + HOUR, ramp_field(3, 2, 1)},
                               {T0 + 3 * HOUR, ramp_field(3, 2, 2)}});
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s.first_time(), T0);
    EXPECT_EQ(s.last_time(), T0 + 3 * HOUR);
    EXPECT_EQ(s.span_seconds(), 3 * HOUR);
    EXPECT_EQ(s[1].time, T0 + HOUR);
}

TEST_F(DataSeriesTest, MapConstructorOrdersByTime) {
    std::map<Timestamp, Field2D> grids;
    grids[T0 + 2 * HOUR] = ramp_field(3, 2, 2);
    grids[T0] = ramp_field(3, 2, 0);
    DataSeries s(spec, grids);
    EXPECT_EQ(s[0].time, T0);
    EXPECT_EQ(s[1].time, T0 + 2 * HOUR);
}

TEST_F(DataSeriesTest, SingleTimestampIsInsufficient) {
    std::vector<Sample> one{{T0, ramp_field(3, 2, 0)}};
    EXPECT_THROW(DataSeries s(spec, one), InsufficientFramesError);
    // Also reported as a validation failure.
    EXPECT_THROW(DataSeries s(spec, one), ValidationError);
    EXPECT_THROW(DataSeries s(spec, std::vector<Sample>{}), InsufficientFramesError);
}

TEST_F(DataSeriesTest, ShapeMismatchNamesTimestamp) {
    try {
        DataSeries s(spec, Samples{{T0, ramp_field(3, 2, 0)}, {T0 + HOUR, ramp_field(4, 2, 0)}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("2024-01-01T01:00:00Z"), std::string::npos) << e.what();
    }
}

TEST_F(DataSeriesTest, MixedScalarAndVectorRejected) {
    Field2D vec = Field2D::vector_field(3, 2);
    Samples mixed{{T0, ramp_field(3, 2, 0)}, {T0 + HOUR, vec}};
    EXPECT_THROW(DataSeries s(spec, mixed), ValidationError);
}

TEST_F(DataSeriesTest, NonIncreasingTimestampsRejected) {
    Samples backwards{{T0 + HOUR, ramp_field(3, 2, 0)}, {T0, ramp_field(3, 2, 1)}};
    Samples repeated{{T0, ramp_field(3, 2, 0)}, {T0, ramp_field(3, 2, 1)}};
    EXPECT_THROW(DataSeries s(spec, backwards), ValidationError);
    EXPECT_THROW(DataSeries s(spec, repeated), ValidationError);
}

TEST_F(DataSeriesTest, AllMissingGridRejected) {
    Field2D empty(3, 2, std::numeric_limits<double>::quiet_NaN());
    Samples samples{{T0, ramp_field(3, 2, 0)}, {T0 + HOUR, empty}};
    EXPECT_THROW(DataSeries s(spec, samples), ValidationError);
}

TEST_F(DataSeriesTest, BadExtentRejected) {
    GridSpec flat{3, 2, 0.0, 0.0, 0.0, 1.0};
    Samples samples{{T0, ramp_field(3, 2, 0)}, {T0 + HOUR, ramp_field(3, 2, 1)}};
    EXPECT_THROW(DataSeries s(flat, samples), ValidationError);
}

TEST_F(DataSeriesTest, GlobalRangeSkipsMissingAndSentinel) {
    spec.missing_value = -999.0;
    Field2D a = ramp_field(3, 2, 0);  // 0..5
    Field2D b = ramp_field(3, 2, 10);  // 10..15
    a.u[0] = std::numeric_limits<double>::quiet_NaN();
    b.u[5] = -999.0;
    DataSeries s(spec, Samples{{T0, a}, {T0 + HOUR, b}});
    EXPECT_DOUBLE_EQ(s.global_range().min, 1.0);
    EXPECT_DOUBLE_EQ(s.global_range().max, 14.0);
}

TEST_F(DataSeriesTest, VectorFieldsRangeOverMagnitude) {
    Field2D a = Field2D::vector_field(1, 1), b = Field2D::vector_field(1, 1);
    a.u[0] = 3.0;
    a.v[0] = 4.0;
    b.u[0] = 0.0;
    b.v[0] = 1.0;
    DataSeries s(GridSpec(1, 1, 0, 0, 1, 1, "m/s"), Samples{{T0, a}, {T0 + HOUR, b}});
    EXPECT_DOUBLE_EQ(s.global_range().min, 1.0);
    EXPECT_DOUBLE_EQ(s.global_range().max, 5.0);
}

TEST_F(DataSeriesTest, ShapeInferredFromFirstGrid) {
    GridSpec bare;
    DataSeries s(bare, Samples{{T0, ramp_field(4, 3, 0)}, {T0 + HOUR, ramp_field(4, 3, 1)}});
    EXPECT_EQ(s.spec().nx, 4);
    EXPECT_EQ(s.spec().ny, 3);
}

TEST_F(DataSeriesTest, SummaryCountsMissingCells) {
    Field2D a = ramp_field(3, 2, 0);
    a.u[2] = std::numeric_limits<double>::quiet_NaN();
    auto sum = summarize(a, spec);
    EXPECT_EQ(sum.valid, 5u);
    EXPECT_EQ(sum.missing, 1u);
    EXPECT_DOUBLE_EQ(sum.min, 0.0);
    EXPECT_DOUBLE_EQ(sum.max, 5.0);
    EXPECT_DOUBLE_EQ(sum.avg, (0 + 1 + 3 + 4 + 5) / 5.0);
}
