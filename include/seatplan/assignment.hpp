/**
 * @file assignment.hpp
 * @brief テーブルと割当（人物のテーブルへの分割）
 */
#ifndef SEATPLAN_ASSIGNMENT_HPP
#define SEATPLAN_ASSIGNMENT_HPP

#include "seatplan/problem.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace seatplan {

/**
 * @brief 乱数生成器
 *
 * チェーンごとに独立したインスタンスを持つ（共有しない）。
 */
using Rng = std::mt19937_64;

/**
 * @brief テーブル
 *
 * 座席は常に capacity 個すべて埋まっている。
 * occupants_ と members_ は常に一致する。
 * members_ のキーは Person::name を参照するので、Person は Table より長く生存すること。
 */
class Table {
public:
    /**
     * @brief テーブルを作成
     * @param occupants 着席者（サイズが容量になる）
     */
    explicit Table(std::vector<const Person*> occupants);

    /**
     * @brief 容量を取得
     */
    size_t capacity() const { return occupants_.size(); }

    /**
     * @brief 着席者リストを取得
     */
    const std::vector<const Person*>& occupants() const { return occupants_; }

    /**
     * @brief 座席 seat の着席者を取得
     */
    const Person& occupant(size_t seat) const { return *occupants_[seat]; }

    /**
     * @brief 指定した名前の人物が着席しているか（O(1)）
     */
    bool contains(std::string_view name) const { return members_.count(name) > 0; }

    /**
     * @brief 座席 seat の着席者を person に入れ替える
     * @return 元の着席者
     */
    const Person* replace_occupant(size_t seat, const Person* person);

    /**
     * @brief occupants_ と members_ が一致しているか
     */
    bool is_consistent() const;

private:
    std::vector<const Person*> occupants_;
    std::unordered_set<std::string_view> members_;
};

/**
 * @brief 割当（テーブルの順序付きリスト）
 *
 * 全員がちょうど1つのテーブルに属する。
 * 値型であり、コピーは完全に独立した深いコピーになる（Clone 操作）。
 * 並行するチェーン間で可変状態を共有しないため、変更操作は常に新しい割当を返す。
 */
class Assignment {
public:
    Assignment() = default;

    /**
     * @brief ランダムな初期割当を作成
     *
     * 人物を一様にシャッフル（Fisher-Yates）し、テーブル順に容量分ずつ詰める。
     *
     * @param people 人物リスト（割当より長く生存すること）
     * @param capacities テーブル容量リスト
     * @param rng 乱数生成器
     * @throws std::runtime_error 容量の合計と人数が一致しない、または容量 0 のテーブルがある場合
     */
    static Assignment random_initialize(const std::vector<Person>& people,
                                        const std::vector<size_t>& capacities,
                                        Rng& rng);

    /**
     * @brief 着席者を指定して割当を作成（テーブルの順序は引数の順）
     */
    explicit Assignment(std::vector<Table> tables);

    /**
     * @brief 近傍解を生成
     *
     * 異なる2テーブルを選び、それぞれ1人ずつ入れ替える操作を swap_count 回行う。
     * 自身は変更しない。テーブルが2つ未満の場合は変更のないコピーを返す。
     */
    Assignment neighbor(size_t swap_count, Rng& rng) const;

    /**
     * @brief テーブルリストを取得
     */
    const std::vector<Table>& tables() const { return tables_; }

    /**
     * @brief テーブル数
     */
    size_t table_count() const { return tables_.size(); }

    /**
     * @brief 総人数
     */
    size_t people_count() const;

    /**
     * @brief 名前から着席テーブルのインデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t table_of(std::string_view name) const;

    /**
     * @brief 分割の不変条件（重複なし、各テーブルが整合）を検査
     */
    bool is_consistent() const;

private:
    std::vector<Table> tables_;
};

} // namespace seatplan

#endif // SEATPLAN_ASSIGNMENT_HPP
