#include <catch2/catch_test_macros.hpp>
#include "seatplan/assignment.hpp"
#include <map>
#include <set>
#include <stdexcept>

using namespace seatplan;

namespace {

std::vector<Person> make_people(size_t n) {
    std::vector<Person> people;
    for (size_t i = 0; i < n; ++i) {
        people.push_back(Person{"p" + std::to_string(i), {}});
    }
    return people;
}

// Every person exactly once, every table full and internally consistent
void require_partition(const Assignment& a, const std::vector<Person>& people,
                       const std::vector<size_t>& capacities) {
    REQUIRE(a.is_consistent());
    REQUIRE(a.table_count() == capacities.size());
    for (size_t t = 0; t < capacities.size(); ++t) {
        REQUIRE(a.tables()[t].capacity() == capacities[t]);
    }
    std::multiset<std::string> seated;
    for (const auto& table : a.tables()) {
        for (const auto* p : table.occupants()) seated.insert(p->name);
    }
    REQUIRE(seated.size() == people.size());
    for (const auto& p : people) {
        REQUIRE(seated.count(p.name) == 1);
    }
}

}  // namespace

// ============================================================================
// Table
// ============================================================================

TEST_CASE("Table membership follows occupants", "[table]") {
    auto people = make_people(3);
    Table table({&people[0], &people[1]});

    REQUIRE(table.capacity() == 2);
    REQUIRE(table.contains("p0"));
    REQUIRE(table.contains("p1"));
    REQUIRE(!table.contains("p2"));

    SECTION("replace occupant") {
        const Person* old = table.replace_occupant(1, &people[2]);
        REQUIRE(old == &people[1]);
        REQUIRE(table.capacity() == 2);
        REQUIRE(table.contains("p2"));
        REQUIRE(!table.contains("p1"));
        REQUIRE(table.is_consistent());
    }

    SECTION("unknown names are never members") {
        REQUIRE(!table.contains(""));
        REQUIRE(!table.contains("nobody"));
    }
}

// ============================================================================
// RandomInitialize
// ============================================================================

TEST_CASE("random_initialize produces a complete partition", "[assignment]") {
    auto people = make_people(10);
    std::vector<size_t> capacities{3, 3, 4};
    Rng rng(42);

    for (int trial = 0; trial < 20; ++trial) {
        auto a = Assignment::random_initialize(people, capacities, rng);
        require_partition(a, people, capacities);
    }
}

TEST_CASE("random_initialize fills tables in order from a shuffle", "[assignment]") {
    auto people = make_people(6);
    std::vector<size_t> capacities{1, 2, 3};
    Rng rng(7);

    auto a = Assignment::random_initialize(people, capacities, rng);
    REQUIRE(a.tables()[0].capacity() == 1);
    REQUIRE(a.tables()[1].capacity() == 2);
    REQUIRE(a.tables()[2].capacity() == 3);
    REQUIRE(a.people_count() == 6);
}

TEST_CASE("random_initialize shuffles", "[assignment]") {
    // Over many draws, p0 must land at more than one table
    auto people = make_people(4);
    std::vector<size_t> capacities{2, 2};
    Rng rng(1);

    std::set<size_t> tables_seen;
    for (int trial = 0; trial < 50; ++trial) {
        auto a = Assignment::random_initialize(people, capacities, rng);
        tables_seen.insert(a.table_of("p0"));
    }
    REQUIRE(tables_seen.size() == 2);
}

TEST_CASE("random_initialize rejects inconsistent input", "[assignment][error]") {
    auto people = make_people(5);
    Rng rng(1);

    SECTION("capacity sum too small") {
        REQUIRE_THROWS_AS(Assignment::random_initialize(people, {2, 2}, rng), std::runtime_error);
    }

    SECTION("capacity sum too large") {
        REQUIRE_THROWS_AS(Assignment::random_initialize(people, {3, 3}, rng), std::runtime_error);
    }

    SECTION("zero capacity") {
        REQUIRE_THROWS_AS(Assignment::random_initialize(people, {5, 0}, rng), std::runtime_error);
    }

    SECTION("capacities whose sum wraps around size_t") {
        // 3 + 2 * (2^63 - 1) == 1 (mod 2^64)
        auto one = make_people(1);
        const std::vector<size_t> caps{3, 9223372036854775807ULL, 9223372036854775807ULL};
        REQUIRE_THROWS_AS(Assignment::random_initialize(one, caps, rng), std::runtime_error);

        const std::vector<size_t> huge_first{9223372036854775807ULL, 9223372036854775807ULL, 3};
        REQUIRE_THROWS_AS(Assignment::random_initialize(one, huge_first, rng), std::runtime_error);
    }
}

// ============================================================================
// Clone
// ============================================================================

TEST_CASE("Copying an assignment is a deep clone", "[assignment]") {
    auto people = make_people(4);
    Rng rng(3);
    auto original = Assignment::random_initialize(people, {2, 2}, rng);
    auto original_table0 = original.tables()[0].occupants();

    Assignment clone = original;
    require_partition(clone, people, {2, 2});

    // Mutating the clone through neighbor() must not touch the original
    for (int i = 0; i < 10; ++i) {
        clone = clone.neighbor(1, rng);
    }
    REQUIRE(original.tables()[0].occupants() == original_table0);
    REQUIRE(original.is_consistent());
    for (const auto* p : original_table0) {
        REQUIRE(original.tables()[0].contains(p->name));
    }
}

// ============================================================================
// Neighbor
// ============================================================================

TEST_CASE("neighbor preserves the partition invariant", "[assignment][neighbor]") {
    auto people = make_people(12);
    std::vector<size_t> capacities{4, 3, 5};
    Rng rng(99);
    auto a = Assignment::random_initialize(people, capacities, rng);

    for (size_t swaps : {size_t{1}, size_t{2}, size_t{5}}) {
        for (int i = 0; i < 50; ++i) {
            a = a.neighbor(swaps, rng);
            require_partition(a, people, capacities);
        }
    }
}

TEST_CASE("neighbor changes at most 2k slots", "[assignment][neighbor]") {
    auto people = make_people(20);
    std::vector<size_t> capacities{5, 5, 5, 5};
    Rng rng(2024);
    auto a = Assignment::random_initialize(people, capacities, rng);

    for (size_t k : {size_t{1}, size_t{3}}) {
        for (int trial = 0; trial < 100; ++trial) {
            auto b = a.neighbor(k, rng);
            size_t changed = 0;
            for (size_t t = 0; t < a.table_count(); ++t) {
                const auto& before = a.tables()[t].occupants();
                const auto& after = b.tables()[t].occupants();
                REQUIRE(before.size() == after.size());
                for (size_t s = 0; s < before.size(); ++s) {
                    if (before[s] != after[s]) changed++;
                }
            }
            REQUIRE(changed <= 2 * k);
        }
    }
}

TEST_CASE("neighbor with one swap moves two people between tables", "[assignment][neighbor]") {
    auto people = make_people(6);
    Rng rng(5);
    auto a = Assignment::random_initialize(people, {3, 3}, rng);

    for (int trial = 0; trial < 50; ++trial) {
        auto b = a.neighbor(1, rng);
        size_t moved = 0;
        for (const auto& p : people) {
            if (a.table_of(p.name) != b.table_of(p.name)) moved++;
        }
        // Two distinct tables are always chosen, so a swap always moves exactly two people
        REQUIRE(moved == 2);
    }
}

TEST_CASE("neighbor leaves the input unmodified", "[assignment][neighbor]") {
    auto people = make_people(8);
    Rng rng(11);
    auto a = Assignment::random_initialize(people, {4, 4}, rng);
    auto snapshot0 = a.tables()[0].occupants();
    auto snapshot1 = a.tables()[1].occupants();

    auto b = a.neighbor(3, rng);
    (void)b;
    REQUIRE(a.tables()[0].occupants() == snapshot0);
    REQUIRE(a.tables()[1].occupants() == snapshot1);
    REQUIRE(a.is_consistent());
}

TEST_CASE("neighbor with a single table returns an unchanged copy", "[assignment][neighbor]") {
    auto people = make_people(3);
    Rng rng(1);
    auto a = Assignment::random_initialize(people, {3}, rng);
    auto b = a.neighbor(4, rng);
    REQUIRE(b.tables()[0].occupants() == a.tables()[0].occupants());
}
