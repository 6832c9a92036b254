#include "cli.hpp"
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <vector>

namespace {

const char* USAGE =
    "Usage: ./wxanim --input <series.csv> [--source id] [--out dir]\n"
    "                [--aspect square,vertical] [--format mp4,gif,png]\n"
    "                [--duration s] [--hold s] [--fps n] [--loop n]\n"
    "                [--range lo:hi] [--ramp temperature|precipitation|wind] [--units u]\n"
    "                [--extent x0,y0,x1,y1] [--location text] [--width px]\n"
    "                [--missing x] [--fit pad|crop] [--no-legend] [--no-still]\n"
    "                [--ffmpeg path]\n";

[[noreturn]] void usage_exit(const std::string& why) {
    std::cout << why << "\n" << USAGE;
    std::exit(1);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) parts.push_back(item);
    return parts;
}

double to_double(const std::string& flag, const std::string& s) {
    try {
        size_t used = 0;
        double x = std::stod(s, &used);
        if (used == s.size()) return x;
    } catch (const std::exception&) {
    }
    usage_exit("Invalid number for " + flag + ": " + s);
}

int to_int(const std::string& flag, const std::string& s) {
    try {
        size_t used = 0;
        int x = std::stoi(s, &used);
        if (used == s.size()) return x;
    } catch (const std::exception&) {
    }
    usage_exit("Invalid integer for " + flag + ": " + s);
}

}  // namespace

CLIOptions parse_cli(int argc, char** argv) {
    CLIOptions opts;
    PipelineConfig& cfg = opts.config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-legend") {
            cfg.render.legend = false;
            continue;
        }
        if (arg == "--no-still") {
            cfg.final_still = false;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) usage_exit("Unknown or incomplete argument: " + arg);
        std::string val = argv[++i];
        try {
            if (arg == "--input") {
                opts.input = val;
            } else if (arg == "--source") {
                cfg.source_id = val;
            } else if (arg == "--out") {
                opts.out_dir = val;
            } else if (arg == "--aspect") {
                cfg.aspect_ratios.clear();
                for (const auto& a : split(val, ',')) cfg.aspect_ratios.push_back(parse_aspect(a));
            } else if (arg == "--format") {
                cfg.formats.clear();
                for (const auto& f : split(val, ',')) cfg.formats.push_back(parse_format(f));
            } else if (arg == "--duration") {
                cfg.timing.target_duration_seconds = to_double(arg, val);
            } else if (arg == "--hold") {
                cfg.timing.hold_last_seconds = to_double(arg, val);
            } else if (arg == "--fps") {
                cfg.timing.frame_rate = to_int(arg, val);
            } else if (arg == "--loop") {
                cfg.encoder.loop_count = to_int(arg, val);
            } else if (arg == "--range") {
                auto p = split(val, ':');
                if (p.size() != 2) usage_exit("--range expects lo:hi");
                cfg.color_range = ValueRange{to_double(arg, p[0]), to_double(arg, p[1])};
            } else if (arg == "--ramp") {
                cfg.ramp = ramp_by_name(val);
            } else if (arg == "--units") {
                opts.spec.units = val;
            } else if (arg == "--extent") {
                auto p = split(val, ',');
                if (p.size() != 4) usage_exit("--extent expects x0,y0,x1,y1");
                opts.spec.x_min = to_double(arg, p[0]);
                opts.spec.y_min = to_double(arg, p[1]);
                opts.spec.x_max = to_double(arg, p[2]);
                opts.spec.y_max = to_double(arg, p[3]);
            } else if (arg == "--missing") {
                opts.spec.missing_value = to_double(arg, val);
            } else if (arg == "--location") {
                cfg.render.location_label = val;
            } else if (arg == "--width") {
                cfg.render.canvas_width = to_int(arg, val);
            } else if (arg == "--fit") {
                cfg.render.fit = parse_fit(val);
            } else if (arg == "--ffmpeg") {
                cfg.encoder.ffmpeg_path = val;
            } else {
                usage_exit("Unknown or incomplete argument: " + arg);
            }
        } catch (const ValidationError& e) {
            usage_exit(e.what());
        }
    }
    if (opts.input.empty()) usage_exit("Missing --input");
    return opts;
}
