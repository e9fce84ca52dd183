#include "search/intersection_index.h"

namespace crossgen {

bool is_crossable(const Grid& grid, int x, int y, Direction direction) {
    const int ax = is_vertical(direction) ? 0 : 1;  // along the word
    const int ay = is_vertical(direction) ? 1 : 0;
    const int px = ay;                              // perpendicular
    const int py = ax;

    if (!grid.is_open(x - ax, y - ay) || !grid.is_open(x + ax, y + ay))
        return false;

    for (int side : {-1, 1}) {
        const int nx = x + side * ax;
        const int ny = y + side * ay;
        if (!grid.in_bounds(nx, ny)) continue;
        if (grid.is_open(nx + px, ny + py) || grid.is_open(nx - px, ny - py))
            return true;
    }
    return false;
}

IntersectionIndex::IntersectionIndex(const Grid& grid) {
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            const char ch = grid.char_at(x, y);
            if (ch == EMPTY_CELL) continue;

            Direction dir;
            if (is_crossable(grid, x, y, Direction::HORIZONTAL)) {
                dir = Direction::HORIZONTAL;
            } else if (is_crossable(grid, x, y, Direction::VERTICAL)) {
                dir = Direction::VERTICAL;
            } else {
                continue;
            }
            points_[ch].push_back(IntersectionPoint{ch, x, y, dir});
            ++size_;
        }
    }
}

const std::vector<IntersectionPoint>&
IntersectionIndex::points_for(char ch) const {
    static const std::vector<IntersectionPoint> none;
    auto it = points_.find(ch);
    return it == points_.end() ? none : it->second;
}

} // namespace crossgen
