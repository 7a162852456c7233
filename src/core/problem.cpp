#include "seatplan/problem.hpp"
#include <numeric>
#include <set>
#include <stdexcept>
#include <string>

namespace seatplan {

namespace {

std::string unknown_companion_message(const std::string& name) {
    return "Companion pair refers to unknown person: " + name +
           " (plus-ones must name listed people; an unknown plus-one is rejected"
           " rather than scored as a permanent violation)";
}

}  // namespace

void validate_problem(const Problem& problem) {
    if (problem.table_capacities.empty()) {
        throw std::runtime_error("Problem has no tables");
    }

    const size_t headcount = problem.people.size();
    size_t total_capacity = 0;
    for (size_t i = 0; i < problem.table_capacities.size(); ++i) {
        const size_t cap = problem.table_capacities[i];
        if (cap == 0) {
            throw std::runtime_error("Table " + std::to_string(i) + " has capacity 0");
        }
        // 合計が人数を超えた時点で打ち切る（size_t の桁あふれ防止）
        if (cap > headcount - total_capacity) {
            throw std::runtime_error("Total table capacity exceeds number of people (" +
                                     std::to_string(headcount) + ") at table " +
                                     std::to_string(i) + " (capacity " +
                                     std::to_string(cap) + ")");
        }
        total_capacity += cap;
    }

    if (total_capacity != headcount) {
        throw std::runtime_error("Total table capacity (" + std::to_string(total_capacity) +
                                 ") does not match number of people (" +
                                 std::to_string(headcount) + ")");
    }

    std::set<std::string> names;
    for (const auto& person : problem.people) {
        if (person.name.empty()) {
            throw std::runtime_error("Person with empty name");
        }
        if (!names.insert(person.name).second) {
            throw std::runtime_error("Duplicate person name: " + person.name);
        }
    }

    // 存在しない人物との同伴ペアは決して満たせない
    for (const auto& [one, two] : problem.companions) {
        if (names.count(one) == 0) {
            throw std::runtime_error(unknown_companion_message(one));
        }
        if (names.count(two) == 0) {
            throw std::runtime_error(unknown_companion_message(two));
        }
    }
}

size_t total_preference_count(const std::vector<Person>& people) {
    return std::accumulate(people.begin(), people.end(), size_t{0},
                           [](size_t acc, const Person& p) { return acc + p.preferences.size(); });
}

} // namespace seatplan
