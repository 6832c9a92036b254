#include "io.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Cell {
    int i, j;
    double u, v;
};

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

double parse_value(const std::string& s, const std::string& where) {
    if (s.empty() || s == "NA" || s == "NaN" || s == "nan") return std::numeric_limits<double>::quiet_NaN();
    try {
        size_t used = 0;
        double x = std::stod(s, &used);
        if (used == s.size()) return x;
    } catch (const std::exception&) {
    }
    throw ValidationError(where + ": bad value '" + s + "'");
}

int parse_index(const std::string& s, const std::string& where) {
    try {
        size_t used = 0;
        int x = std::stoi(s, &used);
        if (used == s.size() && x >= 0) return x;
    } catch (const std::exception&) {
    }
    throw ValidationError(where + ": bad cell index '" + s + "'");
}

}  // namespace

DataSeries load_series_csv(const std::string& path, GridSpec spec) {
    std::ifstream f(path);
    ensure<ValidationError>(f.good(), "Cannot open " + path);

    std::string line;
    ensure<ValidationError>(static_cast<bool>(std::getline(f, line)), path + " is empty");
    std::vector<std::string> header;
    {
        std::stringstream ss(line);
        std::string col;
        while (std::getline(ss, col, ',')) header.push_back(trim(col));
    }
    const bool vector = header.size() == 5;
    ensure<ValidationError>((header.size() == 4 || vector) && header[0] == "time" && header[1] == "i"
                                && header[2] == "j" && header[3] == "value" && (!vector || header[4] == "v"),
                            path + ":1: expected header time,i,j,value[,v]");

    std::map<Timestamp, std::vector<Cell>> rows;
    std::set<std::tuple<Timestamp, int, int>> seen;
    int max_i = -1, max_j = -1;
    int lineno = 1;
    while (std::getline(f, line)) {
        ++lineno;
        if (trim(line).empty()) continue;
        const std::string where = path + ":" + std::to_string(lineno);
        std::vector<std::string> cols;
        std::stringstream ss(line);
        std::string col;
        while (std::getline(ss, col, ',')) cols.push_back(trim(col));
        if (!line.empty() && line.back() == ',') cols.push_back("");
        ensure<ValidationError>(cols.size() == header.size(), where + ": expected " + std::to_string(header.size())
                                                                  + " columns, got " + std::to_string(cols.size()));
        Timestamp t;
        try {
            t = parse_timestamp(cols[0]);
        } catch (const ValidationError& e) {
            throw ValidationError(where + ": " + e.what());
        }
        Cell c{parse_index(cols[1], where), parse_index(cols[2], where), parse_value(cols[3], where),
               vector ? parse_value(cols[4], where) : 0.0};
        ensure<ValidationError>(seen.emplace(t, c.i, c.j).second,
                                where + ": duplicate cell (" + std::to_string(c.i) + "," + std::to_string(c.j)
                                    + ") at " + cols[0]);
        max_i = std::max(max_i, c.i);
        max_j = std::max(max_j, c.j);
        rows[t].push_back(c);
    }

    if (spec.nx == 0 && spec.ny == 0) {
        spec.nx = max_i + 1;
        spec.ny = max_j + 1;
    }
    ensure<ValidationError>(spec.nx >= 1 && spec.ny >= 1, path + ": no data rows");
    ensure<ValidationError>(max_i < spec.nx && max_j < spec.ny,
                            path + ": cell index outside the " + std::to_string(spec.nx) + "x"
                                + std::to_string(spec.ny) + " grid");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<Sample> samples;
    samples.reserve(rows.size());
    for (const auto& [t, cells] : rows) {
        Field2D F = vector ? Field2D::vector_field(spec.nx, spec.ny) : Field2D(spec.nx, spec.ny);
        std::fill(F.u.begin(), F.u.end(), nan);
        std::fill(F.v.begin(), F.v.end(), nan);
        for (const auto& c : cells) {
            F.u[F.id(c.i, c.j)] = c.u;
            if (vector) F.v[F.id(c.i, c.j)] = c.v;
        }
        samples.push_back({t, std::move(F)});
    }
    return DataSeries(std::move(spec), std::move(samples));
}

std::string write_artifact(const std::string& dir, const OutputArtifact& artifact) {
    fs::create_directories(dir);
    const fs::path path = fs::path(dir) / artifact_file_name(artifact.source_id, artifact.aspect, artifact.format);
    std::ofstream f(path, std::ios::binary);
    ensure(f.good(), "Cannot write " + path.string());
    f.write(reinterpret_cast<const char*>(artifact.bytes.data()), static_cast<std::streamsize>(artifact.bytes.size()));
    ensure(f.good(), "Short write to " + path.string());
    return path.string();
}
