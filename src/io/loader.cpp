#include "seatplan/io/loader.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace seatplan {
namespace io {

namespace {

using json = nlohmann::json;

const json& require_array(const json& parent, const char* key) {
    const json& value = parent.at(key);
    if (!value.is_array()) {
        throw std::runtime_error(std::string("Parse error: \"") + key + "\" must be an array");
    }
    return value;
}

Person parse_person(const json& j) {
    Person p;
    p.name = j.at("name").get<std::string>();
    if (j.contains("preferences") && !j.at("preferences").is_null()) {
        p.preferences = j.at("preferences").get<std::vector<std::string>>();
    }
    return p;
}

Problem parse_json(const json& root) {
    if (!root.is_object()) {
        throw std::runtime_error("Parse error: top-level value must be an object");
    }

    Problem problem;
    for (const auto& entry : require_array(root, "people")) {
        problem.people.push_back(parse_person(entry));
    }

    for (const auto& cap : require_array(root, "tables")) {
        if (!cap.is_number_integer()) {
            throw std::runtime_error("Parse error: table capacity must be an integer, got " + cap.dump());
        }
        if (cap.is_number_unsigned()) {
            auto value = cap.get<std::uint64_t>();
            if (value > std::numeric_limits<size_t>::max()) {
                throw std::runtime_error("Parse error: table capacity too large " + cap.dump());
            }
            problem.table_capacities.push_back(static_cast<size_t>(value));
            continue;
        }
        auto value = cap.get<long long>();
        if (value < 0) {
            throw std::runtime_error("Parse error: negative table capacity " + std::to_string(value));
        }
        problem.table_capacities.push_back(static_cast<size_t>(value));
    }

    if (root.contains("plusOnes") && !root.at("plusOnes").is_null()) {
        for (const auto& pair : require_array(root, "plusOnes")) {
            // 同じ personOne は後の宣言で上書き
            problem.companions[pair.at("personOne").get<std::string>()] =
                pair.at("personTwo").get<std::string>();
        }
    }
    return problem;
}

}  // namespace

Problem parse_file(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    try {
        return parse_json(json::parse(in));
    } catch (const json::exception& e) {
        throw std::runtime_error("Parse error in " + filename + ": " + e.what());
    }
}

Problem parse_string(const std::string& input) {
    try {
        return parse_json(json::parse(input));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Parse error: ") + e.what());
    }
}

} // namespace io
} // namespace seatplan
