#include "grid/config.h"

#include <limits>
#include <stdexcept>

namespace crossgen {

void validate(const Config& config) {
    if (config.width == 0) {
        throw std::invalid_argument("Config width must be positive");
    }
    if (config.height == 0) {
        throw std::invalid_argument("Config height must be positive");
    }
    // Coordinates are handled as signed offsets during placement.
    constexpr auto max_extent =
        static_cast<std::size_t>(std::numeric_limits<int>::max());
    if (config.width > max_extent / config.height) {
        throw std::invalid_argument("Config width*height is too large");
    }
}

} // namespace crossgen
