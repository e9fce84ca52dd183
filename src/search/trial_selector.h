#pragma once

/// Trial selection: Monte-Carlo multi-start over independent trials.
///
/// A batch runs trials back to back and keeps the densest grid.  Batches
/// share nothing but the read-only word list and configuration, so
/// select_best runs one per worker concurrently and folds their bests
/// with the same comparator.  Every trial draws from its own generator,
/// seeded from (seed, batch, trial), which makes a run reproducible for
/// a fixed seed regardless of thread timing.

#include "grid/config.h"
#include "search/generation.h"
#include "common.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace crossgen {

struct TrialOptions {
    std::size_t trials_per_worker = DEFAULT_TRIALS_PER_WORKER;
    std::size_t workers = DEFAULT_WORKERS;
    std::uint64_t seed = 0;

    /// Per-batch and final summaries on stderr.
    bool verbose = false;
};

/// Throws std::invalid_argument for zero trials, or for a worker count
/// of zero or above MAX_WORKERS.
void validate(const TrialOptions& options);

/// Generator for one trial, independent of every other (batch, trial).
std::mt19937_64 make_trial_rng(std::uint64_t seed, std::size_t batch,
                               std::size_t trial);

/// Strictly denser.  Equal densities keep the incumbent, so the first
/// result found wins ties.
bool is_better(const TrialResult& candidate, const TrialResult& incumbent);

struct BatchResult {
    std::optional<TrialResult> best;  ///< Empty if no trial ran.
    std::size_t trials_run = 0;
};

/// Run `trials` trials over `ranked_words`.  If `stop` becomes true the
/// batch ends at the next trial boundary and reports its best so far.
BatchResult run_batch(const Config& config,
                      const std::vector<std::string>& ranked_words,
                      std::size_t trials,
                      std::uint64_t seed,
                      std::size_t batch,
                      const std::atomic<bool>* stop = nullptr);

/// Run `options.workers` batches concurrently and return the densest
/// grid.  Ties go to the lower batch index.  An all-empty grid is
/// returned if every batch was cancelled before its first trial.
TrialResult select_best(const Config& config,
                        const std::vector<std::string>& ranked_words,
                        const TrialOptions& options,
                        const std::atomic<bool>* stop = nullptr);

/// Validate, rank `words`, and select the best grid.  Configuration
/// errors throw std::invalid_argument before any trial starts.
TrialResult generate(const Config& config,
                     const std::vector<std::string>& words,
                     const TrialOptions& options,
                     const std::atomic<bool>* stop = nullptr);

} // namespace crossgen
