/**
 * @file chain.hpp
 * @brief 単一チェーン（固定温度の Metropolis 局所探索）
 */
#ifndef SEATPLAN_CHAIN_HPP
#define SEATPLAN_CHAIN_HPP

#include "seatplan/assignment.hpp"
#include "seatplan/objective.hpp"

namespace seatplan {

/**
 * @brief チェーン状態（割当とそのスコア）
 *
 * 常にちょうど1つのタスク（またはラウンド間のコーディネータ）が所有する。
 */
struct ChainState {
    Assignment assignment;
    double score = 0.0;
};

/**
 * @brief チェーン1回分のパラメータ（探索中は不変）
 */
struct ChainParams {
    ObjectiveKind objective = ObjectiveKind::Hybrid;
    size_t internal_iterations = 1000;
    size_t swap_count = 1;
};

/**
 * @brief チェーン1回分の結果
 */
struct ChainResult {
    ChainState state;
    size_t proposed = 0;   // 生成した近傍解の数
    size_t accepted = 0;   // 受理した近傍解の数
    size_t improving = 0;  // スコアが真に改善した受理の数
};

/**
 * @brief Metropolis 受理判定
 *
 * candidate > current なら乱数を引かずに受理する。
 * それ以外は exp((candidate - current) / temperature) を受理確率とし、
 * [0,1) の一様乱数がこれより真に小さければ受理する。
 *
 * @pre temperature > 0
 */
bool metropolis_accept(double current, double candidate, double temperature, Rng& rng);

/**
 * @brief 固定温度で internal_iterations 回の局所探索を行う
 *
 * 入力以外の状態には触れないので、チェーンごとに独立して並行実行できる。
 *
 * @param state 開始状態（所有権を受け取る）
 * @param temperature このラウンドの温度
 * @param params 探索パラメータ
 * @param companions 同伴ペア（読み取り専用）
 * @param rng このチェーン専用の乱数生成器
 */
ChainResult run_chain(ChainState state, double temperature, const ChainParams& params,
                      const CompanionMap& companions, Rng& rng);

} // namespace seatplan

#endif // SEATPLAN_CHAIN_HPP
