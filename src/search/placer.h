#pragma once

/// Placer: every legal way to add one word to a grid.
///
/// A placement is anchored on an IntersectionIndex point: for each
/// index i with word[i] == point.ch the word is shifted so that word[i]
/// lands on the point, oriented the way the point allows.  Spans that
/// leave the grid are dropped, the rest go through fits().
///
/// Different anchors may produce the same grid.  They are not merged;
/// each is a separate candidate.

#include "grid/grid.h"
#include "search/intersection_index.h"

#include <string>
#include <vector>

namespace crossgen {

/// Where a word would start, and along which axis.
struct Placement {
    int x = 0;
    int y = 0;
    bool vertical = false;
};

/// True if every cell of the span names a grid cell.  Vertical spans
/// never wrap; horizontal spans wrap when the grid does, provided the
/// word is shorter than the width so the span cannot meet itself.
bool span_in_bounds(const Grid& grid, std::size_t length,
                    bool vertical, int x, int y);

/// Compatibility check for a non-initial word.
///
/// Passes only if
///   - the word has at least MIN_WORD_LENGTH letters,
///   - the span lies on the grid,
///   - each cell is empty or already holds the same letter,
///   - no shared cell already belongs to a word along the same axis,
///   - each empty cell has open neighbours across the axis,
///   - the cells just before and just after the span are open,
///   - at least one cell is a true crossing (same letter present).
bool fits(const Grid& grid, const std::string& word,
          bool vertical, int x, int y);

/// Legal placements of `word` anchored on `index`, which must have been
/// built from `grid`.  Empty if the word's letters would bring the sum of
/// placed word lengths past the cell count, which keeps density in [0, 1].
std::vector<Placement> find_placements(const Grid& grid,
                                       const IntersectionIndex& index,
                                       const std::string& word);

/// All grids obtainable by adding `word` at one crossing.  Empty if
/// there is none.
std::vector<Grid> place(const Grid& grid, const IntersectionIndex& index,
                        const std::string& word);

/// As above, building the index from `grid`.
std::vector<Grid> place(const Grid& grid, const std::string& word);

} // namespace crossgen
