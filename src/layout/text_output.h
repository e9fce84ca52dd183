#pragma once

/// Plain-text dumps of a grid and its numbered entries, for the CLI and
/// for test diagnostics.

#include "grid/grid.h"
#include "layout/numbering.h"

#include <iosfwd>

namespace crossgen {

/// One line per row; empty cells print as '.'.
void write_grid(std::ostream& os, const Grid& grid);

/// "Across" and "Down" sections, one "<number>. <ANSWER> (x,y)" per line.
void write_entries(std::ostream& os, const NumberedLayout& layout);

} // namespace crossgen
