#pragma once
#include <stdexcept>
#include <string>

/** Bad homography or reference points. Aborts pipeline construction. */
struct CalibrationError : std::runtime_error
{
    explicit CalibrationError(const std::string& m) : std::runtime_error(m) {}
};

/** Out-of-order or duplicate frame in a detection stream. Fatal for that stream. */
struct SequenceError : std::runtime_error
{
    explicit SequenceError(const std::string& m) : std::runtime_error(m) {}
};

/** Missing or unparsable configuration value. */
struct ConfigError : std::runtime_error
{
    explicit ConfigError(const std::string& m) : std::runtime_error(m) {}
};
