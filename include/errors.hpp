#pragma once

#include <stdexcept>
#include <string>

/// Rejected option bundle; raised before any pixel is touched
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("Invalid configuration: " + what) {}
};

/// The lattice produced no sample points (image smaller than one cell)
class EmptySampleSet : public std::runtime_error {
public:
    explicit EmptySampleSet(const std::string& what)
        : std::runtime_error(what) {}
};

class ImageLoadError : public std::runtime_error {
public:
    explicit ImageLoadError(const std::string& what)
        : std::runtime_error(what) {}
};
