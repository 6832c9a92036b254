#pragma once
#include <iostream>
#include <sstream>
#include <string>

// Console reporting for the driver and the pipeline stages.
inline bool& log_quiet() {
    static bool quiet = false;
    return quiet;
}

inline void log_info(const std::string& msg) {
    if (!log_quiet()) std::cout << "[wxanim] " << msg << "\n";
}

inline void log_warn(const std::string& msg) {
    if (!log_quiet()) std::cerr << "[wxanim] warning: " << msg << "\n";
}

inline void log_error(const std::string& msg) {
    std::cerr << "[wxanim] error: " << msg << "\n";
}
