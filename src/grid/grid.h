#pragma once

/// Grid: the cell array a crossword trial writes words into.
///
/// A grid is a value: placing a word returns a new Grid and leaves the
/// receiver untouched, so sibling candidates produced from one parent
/// state can be explored (or discarded) independently.
///
/// Coordinates are signed so that callers may look one cell past any
/// edge.  Such reads never fault: a coordinate outside the grid reads
/// as BLOCKED_CELL.  When `wrap` is set the x axis is taken modulo the
/// width before the bounds test; y never wraps.
///
/// Cell (x, y) lives at linear index y·width + x.

#include "grid/config.h"
#include "common.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace crossgen {

struct Cell {
    int x = 0;
    int y = 0;
};

/// A word committed to the grid and where it starts.
struct PlacedWord {
    std::string word;
    int x = 0;              ///< Start column (normalised into [0, width)).
    int y = 0;              ///< Start row.
    bool vertical = false;  ///< Down if set, across otherwise.
};

class Grid {
public:
    /// All-empty grid.  Throws std::invalid_argument if `config` is
    /// invalid (see validate()).
    explicit Grid(const Config& config);

    /// Copy of this grid with `word` written from (x, y) along the
    /// given axis.  No legality checks: the caller (the placer) has
    /// already validated the span.
    Grid with_word_placed(int x, int y, bool vertical,
                          const std::string& word) const;

    // ── Geometry ────────────────────────────────────────────────

    const Config& config() const noexcept { return config_; }
    int width()  const noexcept { return static_cast<int>(config_.width); }
    int height() const noexcept { return static_cast<int>(config_.height); }
    bool wraps() const noexcept { return config_.wrap; }

    /// True if (x, y) names a cell, after horizontal wrap if enabled.
    bool in_bounds(int x, int y) const noexcept;

    /// Linear index of an in-bounds cell (x is wrapped first).
    std::size_t index_of(int x, int y) const;

    /// Inverse of index_of for canonical coordinates.
    Cell coords_of(std::size_t index) const;

    // ── Occupancy ───────────────────────────────────────────────

    /// Letter at (x, y), EMPTY_CELL, or BLOCKED_CELL when off the grid.
    char char_at(int x, int y) const noexcept;

    /// Off-grid cells are not empty.
    bool is_empty_at(int x, int y) const noexcept {
        return char_at(x, y) == EMPTY_CELL;
    }

    /// Empty or off the grid: a cell that may border a word.
    bool is_open(int x, int y) const noexcept {
        return !in_bounds(x, y) || is_empty_at(x, y);
    }

    /// Number of cells holding a letter.  Crossing cells count once.
    std::size_t letter_count() const noexcept;

    // ── Words ───────────────────────────────────────────────────

    const std::vector<PlacedWord>& placements() const noexcept {
        return placed_;
    }
    std::size_t num_words() const noexcept { return placed_.size(); }
    bool contains_word(std::string_view word) const noexcept;

    /// Sum of placed word lengths.  Crossing cells count once per word.
    std::size_t word_letters() const noexcept;

    /// word_letters() over the cell count.
    double density() const noexcept;

    /// True if a placed word running along the given axis covers (x, y).
    bool covered_along(int x, int y, bool vertical) const noexcept;

    /// True if a run of two or more letters starts at (x, y) in the
    /// given direction: the cell and the next one are filled and the
    /// previous one is open.
    bool starts_word(int x, int y, bool vertical) const noexcept;

    /// Filled cells from (x, y) along the axis until the first open
    /// cell (at most `width` cells under wrap).
    std::string read_run(int x, int y, bool vertical) const;

    const std::vector<char>& cells() const noexcept { return cells_; }

private:
    int wrap_x(int x) const noexcept;

    Config config_;
    std::vector<char> cells_;
    std::vector<PlacedWord> placed_;
};

} // namespace crossgen
