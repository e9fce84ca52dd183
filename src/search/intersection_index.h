#pragma once

/// Intersection index: where a new word may cross the existing ones.
///
/// Built from scratch for one Grid value by scanning every filled cell
/// once.  A cell qualifies as a crossing anchor in a direction when
/// both of its neighbours along that direction are open (empty or off
/// the grid) and, on at least one in-grid side, that neighbour has an
/// open diagonal corner.
///
/// Each anchor carries exactly one direction.  A cell that qualifies
/// both ways is recorded as horizontal only; vertical is recorded only
/// when horizontal fails.

#include "grid/grid.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace crossgen {

enum class Direction : unsigned char { HORIZONTAL, VERTICAL };

inline bool is_vertical(Direction d) noexcept {
    return d == Direction::VERTICAL;
}

/// A filled cell a new word may pass through, and the orientation that
/// word would have.
struct IntersectionPoint {
    char ch = EMPTY_CELL;
    int x = 0;
    int y = 0;
    Direction direction = Direction::HORIZONTAL;
};

/// Whether a word running along `direction` may pass through (x, y).
bool is_crossable(const Grid& grid, int x, int y, Direction direction);

class IntersectionIndex {
public:
    explicit IntersectionIndex(const Grid& grid);

    /// Anchors bearing `ch`, in row-major scan order.
    const std::vector<IntersectionPoint>& points_for(char ch) const;

    /// Total anchors over all characters.
    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

private:
    std::unordered_map<char, std::vector<IntersectionPoint>> points_;
    std::size_t size_ = 0;
};

} // namespace crossgen
