#include "seatplan/annealer.hpp"
#include "seatplan/thread_pool.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace seatplan {

namespace {
// MurmurHash3 64-bit finalizer
inline uint64_t fmix64(uint64_t k) {
    k ^= k >> 33;
    k *= 0xff51afd7ed558ccdULL;
    k ^= k >> 33;
    k *= 0xc4ceb9fe1a85ec53ULL;
    k ^= k >> 33;
    return k;
}

bool positive_finite(double v) {
    return std::isfinite(v) && v > 0.0;
}
}  // namespace

void validate_config(const AnnealerConfig& config) {
    if (!(config.cooling_rate > 0.0 && config.cooling_rate < 1.0)) {
        throw std::runtime_error("Cooling rate must be greater than 0 and less than 1, got " +
                                 std::to_string(config.cooling_rate));
    }
    if (!positive_finite(config.base_temperature)) {
        throw std::runtime_error("Base temperature must be a positive finite number, got " +
                                 std::to_string(config.base_temperature));
    }
    if (!positive_finite(config.final_temperature)) {
        throw std::runtime_error("Final temperature must be a positive finite number, got " +
                                 std::to_string(config.final_temperature));
    }
    if (config.ladder_size < 1) {
        throw std::runtime_error("Ladder size must be at least 1");
    }
    if (config.internal_iterations < 1) {
        throw std::runtime_error("Iterations per round must be at least 1");
    }
    if (config.swap_count < 1) {
        throw std::runtime_error("Swap count must be at least 1");
    }
}

size_t exchange_pass(std::vector<ChainState>& ladder) {
    size_t swaps = 0;
    for (size_t i = ladder.size(); i-- > 1;) {
        if (ladder[i].score > ladder[i - 1].score) {
            std::swap(ladder[i], ladder[i - 1]);
            swaps++;
        }
    }
    return swaps;
}

uint64_t derive_seed(uint64_t seed, size_t level) {
    return fmix64(seed + fmix64(static_cast<uint64_t>(level) + 1));
}

Annealer::Annealer(AnnealerConfig config)
    : config_(std::move(config)) {}

size_t Annealer::worker_count() const {
    // レベル数を超えるワーカーにはタスクが回らない
    if (config_.num_threads > 0) return std::min(config_.num_threads, config_.ladder_size);
    size_t hw = std::max<size_t>(1, std::thread::hardware_concurrency());
    return std::min(config_.ladder_size, hw);
}

Assignment Annealer::run(const Problem& problem) {
    validate_problem(problem);
    validate_config(config_);

    stats_ = AnnealerStats{};
    ladder_scores_.clear();

    const size_t k = config_.ladder_size;
    const ChainParams params{config_.objective, config_.internal_iterations, config_.swap_count};
    const CompanionMap& companions = problem.companions;

    // 共通の初期割当を各レベルに複製
    Rng init_rng(derive_seed(config_.seed, SIZE_MAX));
    Assignment initial = Assignment::random_initialize(problem.people, problem.table_capacities,
                                                       init_rng);
    double initial_score = evaluate(config_.objective, initial, companions);
    stats_.initial_score = initial_score;

    std::vector<ChainState> ladder(k, ChainState{initial, initial_score});
    std::vector<Rng> rngs;
    rngs.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        rngs.emplace_back(derive_seed(config_.seed, i));
    }

    // 実行中のタスクが rngs を参照するので、pool は rngs より先に破棄されるよう最後に宣言する
    ThreadPool pool(worker_count());

    if (verbose_) {
        std::cerr << "% [verbose] anneal start: " << problem.people.size() << " people, "
                  << problem.table_capacities.size() << " tables, ladder " << k
                  << ", objective " << to_string(config_.objective)
                  << ", threads " << pool.thread_count()
                  << ", initial score " << initial_score << "\n";
    }

    double temperature = config_.base_temperature;
    while (temperature > config_.final_temperature) {
        std::vector<std::future<ChainResult>> futures;
        futures.reserve(k);
        for (size_t i = 0; i < k; ++i) {
            double level_temperature = std::ldexp(temperature, static_cast<int>(i));
            futures.push_back(pool.enqueue(
                [state = std::move(ladder[i]), level_temperature, &params, &companions,
                 &rng = rngs[i]]() mutable {
                    return run_chain(std::move(state), level_temperature, params, companions, rng);
                }));
        }

        // 全レベルの完了を待つ（同期バリア）
        for (size_t i = 0; i < k; ++i) {
            ChainResult result = futures[i].get();
            stats_.proposed_moves += result.proposed;
            stats_.accepted_moves += result.accepted;
            stats_.improving_moves += result.improving;
            ladder[i] = std::move(result.state);
        }

        size_t swaps = exchange_pass(ladder);
        stats_.exchanges += swaps;
        stats_.rounds++;

        if (verbose_) {
            std::cerr << "% [verbose] round " << stats_.rounds << ": T=" << temperature
                      << " best=" << ladder[0].score << " hottest=" << ladder[k - 1].score
                      << " exchanges=" << swaps << "\n";
        }

        temperature *= config_.cooling_rate;
    }

    for (const auto& level : ladder) {
        ladder_scores_.push_back(level.score);
    }
    stats_.final_score = ladder[0].score;

    if (verbose_) {
        std::cerr << "% [verbose] anneal done: " << stats_.rounds << " rounds, final score "
                  << stats_.final_score << "\n";
    }

    return std::move(ladder[0].assignment);
}

} // namespace seatplan
