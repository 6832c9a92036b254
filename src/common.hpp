// Shared error types and checks for the animation pipeline.
#pragma once

#include <stdexcept>
#include <string>

// Malformed or inconsistent input data or configuration. Fatal for a run.
struct ValidationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Fewer than two usable timestamps: nothing to animate.
struct InsufficientFramesError : ValidationError {
    using ValidationError::ValidationError;
};

// A grid cannot be placed on a canvas without unacceptable distortion.
struct CompositionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Container-specific failure; aborts one format variant only.
struct EncodingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CancelledError : EncodingError {
    using EncodingError::EncodingError;
};

template <class E = std::runtime_error>
inline void ensure(bool cond, const std::string& msg) {
    if (!cond) throw E(msg);
}
