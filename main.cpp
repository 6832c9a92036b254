// wxanim driver: renders a gridded weather series into square and vertical
// MP4/GIF animations.
#include <chrono>
#include <iostream>
#include <string>

#include "pipeline/pipeline.hpp"
#include "utils/cli.hpp"
#include "utils/io.hpp"
#include "utils/log.hpp"

int main(int argc, char** argv) {
    CLIOptions opts = parse_cli(argc, argv);

    auto wall_start = std::chrono::high_resolution_clock::now();
    PipelineResult result;
    try {
        DataSeries series = load_series_csv(opts.input, opts.spec);
        result = Pipeline{}.run(series, opts.config);
        for (const auto& art : result.artifacts) {
            std::string path = write_artifact(opts.out_dir, art);
            std::cout << "wrote " << path << " (" << art.width << "x" << art.height << ", " << art.frame_count
                      << " frames, " << art.duration_seconds << " s)\n";
        }
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }
    for (const auto& f : result.failures)
        log_error(to_string(f.aspect) + " " + to_string(f.format) + " failed at " + f.stage + ": " + f.reason);

    auto wall_end = std::chrono::high_resolution_clock::now();
    std::cout << "Elapsed wall time: " << std::chrono::duration<double>(wall_end - wall_start).count() << " s\n";
    return result.complete() ? 0 : 2;
}
