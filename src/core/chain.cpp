#include "seatplan/chain.hpp"
#include <cmath>
#include <utility>

namespace seatplan {

bool metropolis_accept(double current, double candidate, double temperature, Rng& rng) {
    if (candidate > current) return true;

    // candidate <= current なので指数は 0 以下、確率は (0, 1]
    double probability = std::exp((candidate - current) / temperature);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng) < probability;
}

ChainResult run_chain(ChainState state, double temperature, const ChainParams& params,
                      const CompanionMap& companions, Rng& rng) {
    ChainResult result;
    result.state = std::move(state);
    auto& current = result.state;

    for (size_t i = 0; i < params.internal_iterations; ++i) {
        Assignment candidate = current.assignment.neighbor(params.swap_count, rng);
        double candidate_score = evaluate(params.objective, candidate, companions);
        result.proposed++;

        bool improving = candidate_score > current.score;
        if (metropolis_accept(current.score, candidate_score, temperature, rng)) {
            current.assignment = std::move(candidate);
            current.score = candidate_score;
            result.accepted++;
            if (improving) result.improving++;
        }
    }
    return result;
}

} // namespace seatplan
