#pragma once

#include <stdexcept>
#include <string>

namespace elevation_tuner {

class ElevationTunerError : public std::runtime_error {
public:
    explicit ElevationTunerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ElevationTunerError {
public:
    explicit ConfigError(const std::string& message)
        : ElevationTunerError("Config error: " + message) {}
};

class ValidationError : public ElevationTunerError {
public:
    explicit ValidationError(const std::string& message)
        : ElevationTunerError("Validation error: " + message) {}
};

class IOError : public ElevationTunerError {
public:
    explicit IOError(const std::string& message)
        : ElevationTunerError("I/O error: " + message) {}
};

class SearchError : public ElevationTunerError {
public:
    explicit SearchError(const std::string& message)
        : ElevationTunerError("Search error: " + message) {}
};

} // namespace elevation_tuner
