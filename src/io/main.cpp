#include "seatplan/annealer.hpp"
#include "seatplan/objective.hpp"
#include "seatplan/io/loader.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <random>
#include <string>

bool g_print_stats = false;
bool g_verbose = false;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-m MODE] [-f FILE] [-b T] [-e T] [-c RATE] [-i N] [-s N] [-a N]"
              << " [-r SEED] [-j N] [-v] [-S]\n";
    std::cerr << "  -m MODE  Objective: sum | count | hybrid (default hybrid)\n";
    std::cerr << "  -f FILE  Problem file (default input.json)\n";
    std::cerr << "  -b T     Base temperature of the coldest annealer (default 1.0)\n";
    std::cerr << "  -e T     Final temperature (default 0.00001)\n";
    std::cerr << "  -c RATE  Cooling rate, 0 < RATE < 1 (default 0.9)\n";
    std::cerr << "  -i N     Iterations per annealing step (default 1000)\n";
    std::cerr << "  -s N     Swaps per neighbour (default 1)\n";
    std::cerr << "  -a N     Number of concurrent annealers (default 6)\n";
    std::cerr << "  -r SEED  Random seed (default: random)\n";
    std::cerr << "  -j N     Worker threads, at most one per annealer (default: capped by hardware)\n";
    std::cerr << "  -v       Verbose mode (print annealing progress)\n";
    std::cerr << "  -S       Print annealer statistics to stderr\n";
}

std::optional<double> parse_double(const char* text) {
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE) return std::nullopt;
    return value;
}

std::optional<unsigned long long> parse_unsigned(const char* text) {
    if (text[0] == '-') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) return std::nullopt;
    return value;
}

void print_stats(const seatplan::Annealer& annealer) {
    if (!g_print_stats) return;
    const auto& s = annealer.stats();
    std::cerr << "% Stats: rounds=" << s.rounds
              << " exchanges=" << s.exchanges
              << " proposed=" << s.proposed_moves
              << " accepted=" << s.accepted_moves
              << " improving=" << s.improving_moves
              << " initial_score=" << s.initial_score
              << " final_score=" << s.final_score
              << "\n";
}

void print_solution(const seatplan::Assignment& solution,
                    const seatplan::CompanionMap& companions) {
    auto summary = seatplan::summarize(solution, companions);
    std::cout << "Found a solution where " << summary.satisfied_people
              << " people are given a preference (i.e. " << summary.unsatisfied_people
              << " people have not been allocated at least one of their preferences). "
              << summary.satisfied_preferences << " preferences are given in total\n";
    if (summary.companion_violations > 0) {
        std::cout << "Warning: " << summary.companion_violations
                  << " plus-one pairs are not seated together\n";
    }
    std::cout << "\n";

    const auto& tables = solution.tables();
    for (size_t i = 0; i < tables.size(); ++i) {
        std::cout << "Table " << i << " (capacity " << tables[i].capacity() << ")\n";
        for (const auto* person : tables[i].occupants()) {
            std::cout << "- " << person->name << "\n";
        }
        if (i + 1 < tables.size()) {
            std::cout << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    std::string filename = "input.json";
    std::string mode = "hybrid";
    std::optional<uint64_t> seed;
    seatplan::AnnealerConfig config;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(arg, "-S") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(arg, "-m") == 0 && has_value) {
            mode = argv[++i];
        } else if (std::strcmp(arg, "-f") == 0 && has_value) {
            filename = argv[++i];
        } else if ((std::strcmp(arg, "-b") == 0 || std::strcmp(arg, "-e") == 0 ||
                    std::strcmp(arg, "-c") == 0) && has_value) {
            auto value = parse_double(argv[++i]);
            if (!value) {
                std::cerr << "Invalid number for " << arg << ": " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
            if (arg[1] == 'b') config.base_temperature = *value;
            else if (arg[1] == 'e') config.final_temperature = *value;
            else config.cooling_rate = *value;
        } else if ((std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "-s") == 0 ||
                    std::strcmp(arg, "-a") == 0 || std::strcmp(arg, "-j") == 0 ||
                    std::strcmp(arg, "-r") == 0) && has_value) {
            auto value = parse_unsigned(argv[++i]);
            if (!value) {
                std::cerr << "Invalid integer for " << arg << ": " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
            switch (arg[1]) {
                case 'i': config.internal_iterations = static_cast<size_t>(*value); break;
                case 's': config.swap_count = static_cast<size_t>(*value); break;
                case 'a': config.ladder_size = static_cast<size_t>(*value); break;
                case 'j': config.num_threads = static_cast<size_t>(*value); break;
                default: seed = static_cast<uint64_t>(*value); break;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!seed) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    config.seed = *seed;

    try {
        config.objective = seatplan::parse_objective_kind(mode);
        seatplan::validate_config(config);

        auto problem = seatplan::io::parse_file(filename);
        seatplan::validate_problem(problem);

        if (g_verbose) {
            std::cerr << "% [verbose] seed " << config.seed << "\n";
        }

        seatplan::Annealer annealer(config);
        annealer.set_verbose(g_verbose);
        auto solution = annealer.run(problem);

        print_stats(annealer);
        print_solution(solution, problem.companions);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
