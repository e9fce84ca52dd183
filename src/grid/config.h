#pragma once

/// Grid configuration: dimensions and edge topology.

#include <cstddef>

namespace crossgen {

struct Config {
    std::size_t width  = 0;
    std::size_t height = 0;

    /// When set, horizontal neighbour queries wrap modulo `width`
    /// (cylindrical grid).  Vertical queries never wrap.
    bool wrap = false;

    std::size_t num_cells() const noexcept { return width * height; }
};

/// Reject configurations no trial can run on.
/// Throws std::invalid_argument naming the offending field.
void validate(const Config& config);

} // namespace crossgen
