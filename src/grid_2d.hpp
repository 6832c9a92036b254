// 2D geographic grid description and scalar/vector field values.
#pragma once
#include <cmath>
#include <optional>
#include <string>
#include <vector>
#include "common.hpp"

struct GridSpec {
    int nx = 0, ny = 0;
    double x_min = 0.0, y_min = 0.0;  // south-west corner
    double x_max = 1.0, y_max = 1.0;  // north-east corner
    std::string units;
    std::optional<double> missing_value;

    GridSpec() = default;
    GridSpec(int nx_, int ny_, double x0, double y0, double x1, double y1, std::string units_ = "")
        : nx(nx_), ny(ny_), x_min(x0), y_min(y0), x_max(x1), y_max(y1), units(std::move(units_)) {}

    double width() const { return x_max - x_min; }
    double height() const { return y_max - y_min; }
    size_t cells() const { return static_cast<size_t>(nx) * static_cast<size_t>(ny); }

    // Physical width/height ratio of the whole grid.
    double aspect() const { return width() / height(); }

    void validate() const {
        ensure<ValidationError>(nx >= 1 && ny >= 1, "GridSpec nx,ny>=1");
        ensure<ValidationError>(std::isfinite(width()) && std::isfinite(height()) && width() > 0.0 && height() > 0.0,
                                "GridSpec extent must be finite with max > min");
    }
};

// Row j = 0 is the southern row. Vector fields carry a second component v
// and are colored by magnitude.
struct Field2D {
    int nx = 0, ny = 0;
    std::vector<double> u;
    std::vector<double> v;

    Field2D() = default;
    Field2D(int nx_, int ny_, double fill = 0.0)
        : nx(nx_), ny(ny_), u(static_cast<size_t>(nx_) * ny_, fill) {}

    static Field2D vector_field(int nx_, int ny_) {
        Field2D F(nx_, ny_);
        F.v.assign(F.u.size(), 0.0);
        return F;
    }

    inline size_t id(int i, int j) const { return static_cast<size_t>(j) * nx + i; }
    bool is_vector() const { return !v.empty(); }
    size_t size() const { return u.size(); }

    inline double value(size_t k) const {
        if (v.empty()) return u[k];
        return std::hypot(u[k], v[k]);
    }

    // Shape agrees with the stored buffers.
    bool consistent() const {
        const size_t n = static_cast<size_t>(nx) * ny;
        return nx >= 1 && ny >= 1 && u.size() == n && (v.empty() || v.size() == n);
    }
};

inline bool is_missing(double x, const std::optional<double>& sentinel) {
    if (!std::isfinite(x)) return true;
    return sentinel && x == *sentinel;
}

inline bool missing_at(const Field2D& F, size_t k, const std::optional<double>& sentinel) {
    if (is_missing(F.u[k], sentinel)) return true;
    return F.is_vector() && is_missing(F.v[k], sentinel);
}
