/**
 * @file problem.hpp
 * @brief 座席割当問題の入力データ（人物・テーブル容量・同伴ペア）
 */
#ifndef SEATPLAN_PROBLEM_HPP
#define SEATPLAN_PROBLEM_HPP

#include <map>
#include <string>
#include <vector>
#include <cstddef>

namespace seatplan {

/**
 * @brief 人物（名前と同席希望リスト）
 *
 * preferences は存在しない名前や重複を含んでもよい。
 */
struct Person {
    std::string name;                      // 一意
    std::vector<std::string> preferences;  // 希望順
};

/**
 * @brief 同伴ペア（personOne -> personTwo）
 *
 * personOne は personTwo と同じテーブルに座らなければならない。
 * 同じ personOne を複数回宣言した場合は後の宣言が優先される。
 */
using CompanionMap = std::map<std::string, std::string>;

/**
 * @brief 問題定義
 */
struct Problem {
    std::vector<Person> people;
    std::vector<size_t> table_capacities;
    CompanionMap companions;
};

/**
 * @brief 問題定義の整合性を検証
 *
 * 以下の場合 std::runtime_error を送出する：
 * - テーブルがない / 容量 0 のテーブルがある
 * - 容量の合計と人数が一致しない
 * - 名前が空、または重複している
 * - 同伴ペアが問題に存在しない人物を参照している
 */
void validate_problem(const Problem& problem);

/**
 * @brief 全員の希望数の合計
 */
size_t total_preference_count(const std::vector<Person>& people);

} // namespace seatplan

#endif // SEATPLAN_PROBLEM_HPP
