#include "search/placer.h"

namespace crossgen {

bool span_in_bounds(const Grid& grid, std::size_t length,
                    bool vertical, int x, int y) {
    if (length == 0) return false;
    const int last = static_cast<int>(length) - 1;

    if (vertical) {
        return grid.in_bounds(x, y) && grid.in_bounds(x, y + last);
    }
    if (grid.wraps()) {
        return static_cast<int>(length) < grid.width()
            && grid.in_bounds(x, y);
    }
    return grid.in_bounds(x, y) && grid.in_bounds(x + last, y);
}

bool fits(const Grid& grid, const std::string& word,
          bool vertical, int x, int y) {
    if (word.size() < MIN_WORD_LENGTH) return false;
    if (!span_in_bounds(grid, word.size(), vertical, x, y)) return false;

    const int ax = vertical ? 0 : 1;
    const int ay = vertical ? 1 : 0;
    const int px = ay;
    const int py = ax;
    const int len = static_cast<int>(word.size());

    // End caps: nothing may touch the word along its own line.
    if (!grid.is_open(x - ax, y - ay)) return false;
    if (!grid.is_open(x + len * ax, y + len * ay)) return false;

    bool crossed = false;
    for (int i = 0; i < len; ++i) {
        const int cx = x + i * ax;
        const int cy = y + i * ay;
        const char existing = grid.char_at(cx, cy);

        if (existing == word[static_cast<std::size_t>(i)]) {
            // Running through a parallel word is overlap, not a crossing.
            if (grid.covered_along(cx, cy, vertical)) return false;
            crossed = true;
        } else if (existing == EMPTY_CELL) {
            if (!grid.is_open(cx + px, cy + py) ||
                !grid.is_open(cx - px, cy - py))
                return false;
        } else {
            return false;
        }
    }
    return crossed;
}

std::vector<Placement> find_placements(const Grid& grid,
                                       const IntersectionIndex& index,
                                       const std::string& word) {
    std::vector<Placement> out;
    if (word.size() < MIN_WORD_LENGTH) return out;
    if (grid.word_letters() + word.size() > grid.cells().size()) return out;

    std::string seen;

    for (char c : word) {
        if (seen.find(c) != std::string::npos) continue;
        seen.push_back(c);

        for (const auto& p : index.points_for(c)) {
            const bool vertical = is_vertical(p.direction);
            for (std::size_t i = 0; i < word.size(); ++i) {
                if (word[i] != c) continue;
                const int offset = static_cast<int>(i);
                const int sx = vertical ? p.x : p.x - offset;
                const int sy = vertical ? p.y - offset : p.y;
                if (!span_in_bounds(grid, word.size(), vertical, sx, sy))
                    continue;
                if (fits(grid, word, vertical, sx, sy))
                    out.push_back(Placement{sx, sy, vertical});
            }
        }
    }
    return out;
}

std::vector<Grid> place(const Grid& grid, const IntersectionIndex& index,
                        const std::string& word) {
    std::vector<Grid> grids;
    for (const auto& pl : find_placements(grid, index, word)) {
        grids.push_back(grid.with_word_placed(pl.x, pl.y, pl.vertical, word));
    }
    return grids;
}

std::vector<Grid> place(const Grid& grid, const std::string& word) {
    IntersectionIndex index(grid);
    return place(grid, index, word);
}

} // namespace crossgen
