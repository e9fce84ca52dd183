#include "search/trial_selector.h"
#include "rank/word_ranker.h"

#include <cstdio>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>

namespace crossgen {

void validate(const TrialOptions& options) {
    if (options.trials_per_worker == 0) {
        throw std::invalid_argument("TrialOptions trials_per_worker must be positive");
    }
    if (options.workers == 0) {
        throw std::invalid_argument("TrialOptions workers must be positive");
    }
    if (options.workers > MAX_WORKERS) {
        throw std::invalid_argument("TrialOptions workers exceeds "
                                    + std::to_string(MAX_WORKERS));
    }
}

std::mt19937_64 make_trial_rng(std::uint64_t seed, std::size_t batch,
                               std::size_t trial) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(seed),
        static_cast<std::uint32_t>(seed >> 32),
        static_cast<std::uint32_t>(batch),
        static_cast<std::uint32_t>(trial),
        static_cast<std::uint32_t>(static_cast<std::uint64_t>(trial) >> 32),
    };
    return std::mt19937_64(seq);
}

bool is_better(const TrialResult& candidate, const TrialResult& incumbent) {
    return candidate.density() > incumbent.density();
}

BatchResult run_batch(const Config& config,
                      const std::vector<std::string>& ranked_words,
                      std::size_t trials,
                      std::uint64_t seed,
                      std::size_t batch,
                      const std::atomic<bool>* stop) {
    BatchResult out;
    for (std::size_t t = 0; t < trials; ++t) {
        if (stop && stop->load(std::memory_order_relaxed)) break;

        auto rng = make_trial_rng(seed, batch, t);
        for (auto& result : run_trial(config, ranked_words, rng)) {
            if (!out.best || is_better(result, *out.best)) {
                out.best = std::move(result);
            }
        }
        ++out.trials_run;
    }
    return out;
}

TrialResult select_best(const Config& config,
                        const std::vector<std::string>& ranked_words,
                        const TrialOptions& options,
                        const std::atomic<bool>* stop) {
    validate(config);
    validate(options);

    std::vector<std::future<BatchResult>> futures;
    futures.reserve(options.workers);
    for (std::size_t w = 0; w < options.workers; ++w) {
        futures.push_back(std::async(
            std::launch::async, run_batch,
            std::cref(config), std::cref(ranked_words),
            options.trials_per_worker, options.seed, w, stop));
    }

    // Reduce in batch order so ties resolve the same way every run.
    std::optional<TrialResult> best;
    std::size_t best_batch = NONE;
    for (std::size_t w = 0; w < futures.size(); ++w) {
        BatchResult batch = futures[w].get();
        if (options.verbose) {
            std::fprintf(stderr, "  batch %zu: %zu trials, best density %.4f\n",
                         w, batch.trials_run,
                         batch.best ? batch.best->density() : 0.0);
        }
        if (!batch.best) continue;
        if (!best || is_better(*batch.best, *best)) {
            best = std::move(batch.best);
            best_batch = w;
        }
    }

    if (!best) return TrialResult{Grid(config), {}};

    if (options.verbose) {
        std::fprintf(stderr, "select_best: batch %zu wins, %zu words, density %.4f\n",
                     best_batch, best->grid.num_words(), best->density());
    }
    return std::move(*best);
}

TrialResult generate(const Config& config,
                     const std::vector<std::string>& words,
                     const TrialOptions& options,
                     const std::atomic<bool>* stop) {
    validate(config);
    validate(options);
    const auto ranked = rank_words(words);
    return select_best(config, ranked, options, stop);
}

} // namespace crossgen
