#include "grid/grid.h"

#include <algorithm>
#include <cassert>

namespace crossgen {

// ── Construction ────────────────────────────────────────────────────

Grid::Grid(const Config& config)
    : config_{config}
{
    validate(config_);
    cells_.assign(config_.num_cells(), EMPTY_CELL);
}

Grid Grid::with_word_placed(int x, int y, bool vertical,
                            const std::string& word) const {
    Grid next = *this;
    const int dx = vertical ? 0 : 1;
    const int dy = vertical ? 1 : 0;
    for (std::size_t i = 0; i < word.size(); ++i) {
        const int cx = x + dx * static_cast<int>(i);
        const int cy = y + dy * static_cast<int>(i);
        assert(in_bounds(cx, cy));
        next.cells_[index_of(cx, cy)] = word[i];
    }
    next.placed_.push_back(PlacedWord{word, wrap_x(x), y, vertical});
    return next;
}

// ── Geometry ────────────────────────────────────────────────────────

int Grid::wrap_x(int x) const noexcept {
    if (!config_.wrap) return x;
    const int w = width();
    return ((x % w) + w) % w;
}

bool Grid::in_bounds(int x, int y) const noexcept {
    const int wx = wrap_x(x);
    return wx >= 0 && wx < width() && y >= 0 && y < height();
}

std::size_t Grid::index_of(int x, int y) const {
    assert(in_bounds(x, y));
    return static_cast<std::size_t>(y) * config_.width
         + static_cast<std::size_t>(wrap_x(x));
}

Cell Grid::coords_of(std::size_t index) const {
    assert(index < cells_.size());
    return Cell{static_cast<int>(index % config_.width),
                static_cast<int>(index / config_.width)};
}

// ── Occupancy ───────────────────────────────────────────────────────

char Grid::char_at(int x, int y) const noexcept {
    if (!in_bounds(x, y)) return BLOCKED_CELL;
    return cells_[index_of(x, y)];
}

std::size_t Grid::letter_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(cells_.begin(), cells_.end(),
                      [](char c) { return c != EMPTY_CELL; }));
}

// ── Words ───────────────────────────────────────────────────────────

bool Grid::contains_word(std::string_view word) const noexcept {
    return std::any_of(placed_.begin(), placed_.end(),
                       [&](const PlacedWord& p) { return p.word == word; });
}

std::size_t Grid::word_letters() const noexcept {
    std::size_t letters = 0;
    for (const auto& p : placed_) letters += p.word.size();
    return letters;
}

double Grid::density() const noexcept {
    return static_cast<double>(word_letters())
         / static_cast<double>(cells_.size());
}

bool Grid::covered_along(int x, int y, bool vertical) const noexcept {
    if (!in_bounds(x, y)) return false;
    const int cx = wrap_x(x);
    const int w = width();
    for (const auto& p : placed_) {
        if (p.vertical != vertical) continue;
        const int len = static_cast<int>(p.word.size());
        if (vertical) {
            if (p.x == cx && y >= p.y && y < p.y + len) return true;
        } else if (p.y == y) {
            // Starts are stored normalised, so under wrap the offset is
            // taken modulo the width.
            const int off = config_.wrap ? ((cx - p.x) % w + w) % w
                                         : cx - p.x;
            if (off >= 0 && off < len) return true;
        }
    }
    return false;
}

bool Grid::starts_word(int x, int y, bool vertical) const noexcept {
    const int dx = vertical ? 0 : 1;
    const int dy = vertical ? 1 : 0;
    return !is_open(x, y)
        && is_open(x - dx, y - dy)
        && !is_open(x + dx, y + dy);
}

std::string Grid::read_run(int x, int y, bool vertical) const {
    const int dx = vertical ? 0 : 1;
    const int dy = vertical ? 1 : 0;
    const int limit = vertical ? height() : width();
    std::string run;
    for (int i = 0; i < limit; ++i) {
        const int cx = x + dx * i;
        const int cy = y + dy * i;
        if (is_open(cx, cy)) break;
        run.push_back(char_at(cx, cy));
    }
    return run;
}

} // namespace crossgen
