/**
 * @file objective.hpp
 * @brief 目的関数（大きいほど良い）
 */
#ifndef SEATPLAN_OBJECTIVE_HPP
#define SEATPLAN_OBJECTIVE_HPP

#include "seatplan/assignment.hpp"
#include <string>

namespace seatplan {

/**
 * @brief 目的関数の種類
 *
 * 実行開始時に1回だけ選択し、探索中は変更しない。
 */
enum class ObjectiveKind {
    Sum,     // 満たされた希望の総数
    Count,   // 希望が1つ以上満たされた人数
    Hybrid   // Count を優先し、同点なら Sum
};

/**
 * @brief 文字列から目的関数の種類を解決
 * @param name "sum" / "count" / "hybrid"
 * @throws std::runtime_error 未知の名前
 */
ObjectiveKind parse_objective_kind(const std::string& name);

/**
 * @brief 目的関数の種類を文字列化
 */
const char* to_string(ObjectiveKind kind);

/**
 * @brief 同伴ペアの違反数
 *
 * 同伴相手が同じテーブルにいない personOne を1件と数える。
 */
size_t companion_violations(const Assignment& assignment, const CompanionMap& companions);

/**
 * @brief 満たされた希望の総数
 *
 * 相互に希望し合う2人はそれぞれ1点ずつ数える。
 * 同伴ペアの違反があれば -違反数 を返す。
 */
double sum_score(const Assignment& assignment, const CompanionMap& companions);

/**
 * @brief 希望が1つ以上満たされた人数
 *
 * 同伴ペアの違反があれば -違反数 を返す。
 */
double count_score(const Assignment& assignment, const CompanionMap& companions);

/**
 * @brief Count * M + Sum（M = max(人数, 希望総数)）
 *
 * Count が1増えれば Sum の変化によらず必ず大きくなる（辞書式順序）。
 * 同伴ペアの違反があれば -違反数 を返す。
 */
double hybrid_score(const Assignment& assignment, const CompanionMap& companions);

/**
 * @brief 選択された目的関数で評価
 */
double evaluate(ObjectiveKind kind, const Assignment& assignment, const CompanionMap& companions);

/**
 * @brief 最終結果の要約
 */
struct ScoreSummary {
    size_t satisfied_people = 0;       // 希望が1つ以上満たされた人数
    size_t unsatisfied_people = 0;     // 希望が1つも満たされなかった人数
    size_t satisfied_preferences = 0;  // 満たされた希望の総数
    size_t companion_violations = 0;
};

/**
 * @brief 割当を要約する
 *
 * スコアと異なり、違反があってもペナルティで上書きせず実際の充足数を数える。
 * 違反数は companion_violations に別途設定する。
 */
ScoreSummary summarize(const Assignment& assignment, const CompanionMap& companions);

} // namespace seatplan

#endif // SEATPLAN_OBJECTIVE_HPP
