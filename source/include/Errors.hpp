#pragma once

#include <stdexcept>

// bad or missing server config, raised before the first round
struct ConfigError: std::runtime_error {
    using std::runtime_error::runtime_error;
};

// bad command line
struct UsageError: std::runtime_error {
    using std::runtime_error::runtime_error;
};

// a renderer could not produce its output; the scheduler logs and moves on
struct RenderError: std::runtime_error {
    using std::runtime_error::runtime_error;
};
