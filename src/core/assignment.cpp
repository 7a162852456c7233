#include "seatplan/assignment.hpp"
#include <stdexcept>
#include <utility>

namespace seatplan {

// ============================================================================
// Table
// ============================================================================

Table::Table(std::vector<const Person*> occupants)
    : occupants_(std::move(occupants)) {
    members_.reserve(occupants_.size());
    for (const auto* p : occupants_) {
        members_.insert(p->name);
    }
}

const Person* Table::replace_occupant(size_t seat, const Person* person) {
    const Person* old = occupants_[seat];
    members_.erase(old->name);
    occupants_[seat] = person;
    members_.insert(person->name);
    return old;
}

bool Table::is_consistent() const {
    if (members_.size() != occupants_.size()) return false;
    for (const auto* p : occupants_) {
        if (members_.count(p->name) == 0) return false;
    }
    return true;
}

// ============================================================================
// Assignment
// ============================================================================

Assignment::Assignment(std::vector<Table> tables)
    : tables_(std::move(tables)) {}

Assignment Assignment::random_initialize(const std::vector<Person>& people,
                                         const std::vector<size_t>& capacities,
                                         Rng& rng) {
    size_t total_capacity = 0;
    for (auto cap : capacities) {
        if (cap == 0) {
            throw std::runtime_error("Table capacity must be positive");
        }
        if (cap > people.size() - total_capacity) {
            throw std::runtime_error("Total table capacity exceeds number of people (" +
                                     std::to_string(people.size()) + ")");
        }
        total_capacity += cap;
    }
    if (total_capacity != people.size()) {
        throw std::runtime_error("Total table capacity (" + std::to_string(total_capacity) +
                                 ") does not match number of people (" +
                                 std::to_string(people.size()) + ")");
    }

    // Fisher-Yates
    std::vector<const Person*> order;
    order.reserve(people.size());
    for (const auto& p : people) order.push_back(&p);
    for (size_t i = 1; i < order.size(); ++i) {
        std::uniform_int_distribution<size_t> dist(0, i);
        std::swap(order[i], order[dist(rng)]);
    }

    // 前から順に詰める
    std::vector<Table> tables;
    tables.reserve(capacities.size());
    auto it = order.begin();
    for (auto cap : capacities) {
        tables.emplace_back(std::vector<const Person*>(it, it + cap));
        it += cap;
    }
    return Assignment(std::move(tables));
}

Assignment Assignment::neighbor(size_t swap_count, Rng& rng) const {
    Assignment result(*this);
    const size_t n = result.tables_.size();
    if (n < 2) return result;

    std::uniform_int_distribution<size_t> first_dist(0, n - 1);
    std::uniform_int_distribution<size_t> second_dist(0, n - 2);

    for (size_t k = 0; k < swap_count; ++k) {
        // 異なる2テーブルを選ぶ
        size_t t1 = first_dist(rng);
        size_t t2 = second_dist(rng);
        if (t2 >= t1) ++t2;

        auto& table1 = result.tables_[t1];
        auto& table2 = result.tables_[t2];

        std::uniform_int_distribution<size_t> seat1_dist(0, table1.capacity() - 1);
        std::uniform_int_distribution<size_t> seat2_dist(0, table2.capacity() - 1);
        size_t seat1 = seat1_dist(rng);
        size_t seat2 = seat2_dist(rng);

        const Person* p2 = &table2.occupant(seat2);
        const Person* p1 = table1.replace_occupant(seat1, p2);
        table2.replace_occupant(seat2, p1);
    }
    return result;
}

size_t Assignment::people_count() const {
    size_t count = 0;
    for (const auto& t : tables_) count += t.capacity();
    return count;
}

size_t Assignment::table_of(std::string_view name) const {
    for (size_t i = 0; i < tables_.size(); ++i) {
        if (tables_[i].contains(name)) return i;
    }
    return SIZE_MAX;
}

bool Assignment::is_consistent() const {
    std::unordered_set<std::string_view> seen;
    for (const auto& t : tables_) {
        if (t.capacity() == 0 || !t.is_consistent()) return false;
        for (const auto* p : t.occupants()) {
            if (!seen.insert(p->name).second) return false;
        }
    }
    return true;
}

} // namespace seatplan
