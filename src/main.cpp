#include "grid/config.h"
#include "grid/grid.h"
#include "layout/numbering.h"
#include "layout/text_output.h"
#include "search/trial_selector.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

static void usage() {
    std::cerr << "usage: crossgen [--trials N] [--workers N] [--seed S]"
                 " [--verbose] < input\n"
                 "input: \"width height [wrap]\" on the first line,"
                 " then words separated by whitespace\n";
}

/// Parse a non-negative integer argument; false on garbage.
static bool parse_count(const char* text, std::uint64_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-') return false;
    char* end = nullptr;
    out = std::strtoull(text, &end, 10);
    return *end == '\0';
}

int main(int argc, char** argv) {
    // ── Options ─────────────────────────────────────────────────
    crossgen::TrialOptions options;
    options.seed = static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::uint64_t value = 0;
        if (std::strcmp(arg, "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(arg, "--trials") == 0 && i + 1 < argc
                   && parse_count(argv[i + 1], value)) {
            options.trials_per_worker = static_cast<std::size_t>(value);
            ++i;
        } else if (std::strcmp(arg, "--workers") == 0 && i + 1 < argc
                   && parse_count(argv[i + 1], value)) {
            options.workers = static_cast<std::size_t>(value);
            ++i;
        } else if (std::strcmp(arg, "--seed") == 0 && i + 1 < argc
                   && parse_count(argv[i + 1], value)) {
            options.seed = value;
            ++i;
        } else {
            std::cerr << "error: bad argument '" << arg << "'\n";
            usage();
            return EXIT_FAILURE;
        }
    }

    // ── Read configuration and words from stdin ─────────────────
    // First line: width height [wrap], wrap given as 0/1.
    std::string header;
    if (!std::getline(std::cin, header)) {
        std::cerr << "error: missing \"width height\" line\n";
        usage();
        return EXIT_FAILURE;
    }

    crossgen::Config config;
    {
        std::istringstream hs(header);
        long long w = 0, h = 0;
        if (!(hs >> w >> h) || w <= 0 || h <= 0) {
            std::cerr << "error: width and height must be positive integers\n";
            return EXIT_FAILURE;
        }
        config.width  = static_cast<std::size_t>(w);
        config.height = static_cast<std::size_t>(h);
        int wrap = 0;
        if (hs >> wrap) config.wrap = wrap != 0;
    }

    std::vector<std::string> words;
    for (std::string word; std::cin >> word;) {
        words.push_back(std::move(word));
    }

    // ── Generate ────────────────────────────────────────────────
    auto t0 = std::chrono::steady_clock::now();

    std::optional<crossgen::TrialResult> best;
    try {
        best = crossgen::generate(config, words, options);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << '\n';
        return EXIT_FAILURE;
    } catch (const std::system_error& e) {
        // std::async could not start a worker thread.
        std::cerr << "error: cannot start workers: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    auto t1 = std::chrono::steady_clock::now();

    // ── Output ──────────────────────────────────────────────────
    const auto layout = crossgen::number_grid(best->grid);

    std::cout << config.width << 'x' << config.height
              << (config.wrap ? " (wrap)" : "") << ", "
              << best->grid.num_words() << '/' << words.size()
              << " words placed, density " << best->density() << '\n';
    crossgen::write_grid(std::cout, best->grid);
    crossgen::write_entries(std::cout, layout);

    if (options.verbose) {
        std::cerr << "generate: "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
                  << " ms for " << options.workers << " x "
                  << options.trials_per_worker << " trials\n";
    }
    return EXIT_SUCCESS;
}
