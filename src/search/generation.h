#pragma once

/// Generation loop: one randomized trial.
///
/// State: (grid, pending, deferred).  The head of `pending` is taken
/// each step:
///   - already on the grid, or shorter than MIN_WORD_LENGTH → dropped;
///   - no legal placement       → appended to `deferred`;
///   - otherwise one placement is chosen uniformly at random, the grid
///     advances to it, and pending becomes deferred ++ tail (every word
///     that failed so far gets another chance on the larger grid).
/// The trial ends when pending runs dry; whatever is still deferred is
/// left unplaced.
///
/// Every step either consumes a pending word or moves it to deferred,
/// and deferred words only come back after a successful placement, so a
/// list of n words finishes within n·(n+1) steps.

#include "grid/grid.h"

#include <cstddef>
#include <deque>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace crossgen {

struct GenerationStats {
    std::size_t iterations = 0;   ///< Pending words examined.
    std::size_t placements = 0;   ///< Words added after the seed.
    std::size_t deferrals  = 0;   ///< Times a word found no placement.
};

/// A finished trial.
struct TrialResult {
    Grid grid;
    GenerationStats stats;

    double density() const noexcept { return grid.density(); }
};

/// Grid holding only `word`, centred along the chosen axis and placed
/// on the middle line of the other one.  std::nullopt if the word does
/// not fit along that axis or is shorter than MIN_WORD_LENGTH.
std::optional<Grid> seed_grid(const Config& config, const std::string& word,
                              bool vertical);

/// Run the loop from `grid` until `pending` is exhausted.
TrialResult run_generation(Grid grid, std::deque<std::string> pending,
                           std::mt19937_64& rng);

/// One trial over `ranked_words`: the first word that fits is used as
/// the seed, once across and once down, and each seeded grid is run
/// through the loop with the remaining words.  Returns both results,
/// across first.  Words too long for either axis are simply left out.
std::vector<TrialResult> run_trial(const Config& config,
                                   const std::vector<std::string>& ranked_words,
                                   std::mt19937_64& rng);

} // namespace crossgen
