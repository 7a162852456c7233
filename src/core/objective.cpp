#include "seatplan/objective.hpp"
#include <algorithm>
#include <stdexcept>

namespace seatplan {

namespace {

/**
 * @brief 1回の走査で得られる生の集計値
 */
struct Tally {
    size_t sum = 0;         // 満たされた希望数
    size_t count = 0;       // 希望が1つ以上満たされた人数
    size_t violations = 0;  // 同伴ペア違反数
    size_t preferences = 0; // 希望の総数
};

Tally tally(const Assignment& assignment, const CompanionMap& companions) {
    Tally t;
    for (const auto& table : assignment.tables()) {
        for (const auto* person : table.occupants()) {
            auto it = companions.find(person->name);
            if (it != companions.end() && !table.contains(it->second)) {
                t.violations++;
            }
            t.preferences += person->preferences.size();
            bool satisfied = false;
            for (const auto& pref : person->preferences) {
                if (table.contains(pref)) {
                    t.sum++;
                    satisfied = true;
                }
            }
            if (satisfied) t.count++;
        }
    }
    return t;
}

double penalty(size_t violations) {
    return -static_cast<double>(violations);
}

}  // namespace

ObjectiveKind parse_objective_kind(const std::string& name) {
    if (name == "sum") return ObjectiveKind::Sum;
    if (name == "count") return ObjectiveKind::Count;
    if (name == "hybrid") return ObjectiveKind::Hybrid;
    throw std::runtime_error("Unknown objective function: " + name +
                             " (expected sum, count or hybrid)");
}

const char* to_string(ObjectiveKind kind) {
    switch (kind) {
        case ObjectiveKind::Sum: return "sum";
        case ObjectiveKind::Count: return "count";
        case ObjectiveKind::Hybrid: return "hybrid";
    }
    return "unknown";
}

size_t companion_violations(const Assignment& assignment, const CompanionMap& companions) {
    return tally(assignment, companions).violations;
}

double sum_score(const Assignment& assignment, const CompanionMap& companions) {
    auto t = tally(assignment, companions);
    if (t.violations > 0) return penalty(t.violations);
    return static_cast<double>(t.sum);
}

double count_score(const Assignment& assignment, const CompanionMap& companions) {
    auto t = tally(assignment, companions);
    if (t.violations > 0) return penalty(t.violations);
    return static_cast<double>(t.count);
}

double hybrid_score(const Assignment& assignment, const CompanionMap& companions) {
    auto t = tally(assignment, companions);
    if (t.violations > 0) return penalty(t.violations);

    double m = static_cast<double>(std::max(assignment.people_count(), t.preferences));
    return static_cast<double>(t.count) * m + static_cast<double>(t.sum);
}

double evaluate(ObjectiveKind kind, const Assignment& assignment, const CompanionMap& companions) {
    switch (kind) {
        case ObjectiveKind::Sum: return sum_score(assignment, companions);
        case ObjectiveKind::Count: return count_score(assignment, companions);
        case ObjectiveKind::Hybrid: return hybrid_score(assignment, companions);
    }
    throw std::runtime_error("Unknown objective kind");
}

ScoreSummary summarize(const Assignment& assignment, const CompanionMap& companions) {
    auto t = tally(assignment, companions);
    ScoreSummary summary;
    summary.satisfied_people = t.count;
    summary.unsatisfied_people = assignment.people_count() - t.count;
    summary.satisfied_preferences = t.sum;
    summary.companion_violations = t.violations;
    return summary;
}

} // namespace seatplan
