#pragma once

/// Common constants and sentinel values used throughout the codebase.

#include <cstddef>
#include <limits>

namespace crossgen {

/// Sentinel value meaning "no valid index."
inline constexpr std::size_t NONE = std::numeric_limits<std::size_t>::max();

/// Marker stored in a grid cell that holds no letter.
inline constexpr char EMPTY_CELL = ' ';

/// Returned by Grid::char_at for coordinates outside the grid.
/// Never stored in a cell.
inline constexpr char BLOCKED_CELL = '#';

/// Shortest word the engine places.  A one-letter word would land on a
/// letter already on the grid and add nothing to it.
inline constexpr std::size_t MIN_WORD_LENGTH = 2;

/// Trials run by one worker when the caller does not say otherwise.
inline constexpr std::size_t DEFAULT_TRIALS_PER_WORKER = 1000;

/// Concurrent workers used by select_best by default.
inline constexpr std::size_t DEFAULT_WORKERS = 4;

/// Upper bound on concurrent workers accepted by validate(TrialOptions).
inline constexpr std::size_t MAX_WORKERS = 256;

} // namespace crossgen
