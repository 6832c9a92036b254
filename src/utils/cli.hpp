#pragma once
#include <string>

#include "pipeline/pipeline.hpp"

struct CLIOptions {
    std::string input;
    std::string out_dir = "Results";
    GridSpec spec;  // extent and units; shape comes from the data
    PipelineConfig config;
};

// Prints usage and exits with status 1 on unknown or incomplete arguments.
CLIOptions parse_cli(int argc, char** argv);
