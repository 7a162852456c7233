/**
 * @file annealer.hpp
 * @brief レプリカ交換（パラレルテンパリング）による焼きなまし
 */
#ifndef SEATPLAN_ANNEALER_HPP
#define SEATPLAN_ANNEALER_HPP

#include "seatplan/chain.hpp"
#include "seatplan/problem.hpp"
#include <cstdint>
#include <vector>

namespace seatplan {

/**
 * @brief 焼きなましの設定
 *
 * 既定値はコマンドラインの既定値と同じ。
 */
struct AnnealerConfig {
    ObjectiveKind objective = ObjectiveKind::Hybrid;
    double base_temperature = 1.0;       // 最も低温なレベルの開始温度
    double final_temperature = 0.00001;  // 基準温度がこれ以下になったら終了
    double cooling_rate = 0.9;           // ラウンドごとに基準温度に掛ける (0,1)
    size_t internal_iterations = 1000;   // 1ラウンドあたりのチェーン反復数
    size_t swap_count = 1;               // 近傍生成1回あたりの入れ替え数
    size_t ladder_size = 6;              // 並行チェーン数
    uint64_t seed = 12345678;
    size_t num_threads = 0;              // 0 = ハードウェアスレッド数。いずれも ladder_size で頭打ち
};

/**
 * @brief 焼きなまし統計情報
 */
struct AnnealerStats {
    size_t rounds = 0;
    size_t exchanges = 0;
    size_t proposed_moves = 0;
    size_t accepted_moves = 0;
    size_t improving_moves = 0;
    double initial_score = 0.0;
    double final_score = 0.0;
};

/**
 * @brief 設定を検証
 * @throws std::runtime_error 冷却率が (0,1) の外、温度が正の有限値でない、
 *         ladder_size / internal_iterations / swap_count が 0 の場合
 */
void validate_config(const AnnealerConfig& config);

/**
 * @brief 交換パス
 *
 * 最も高温なレベルから低温側へ1回だけ走査し、高温側のスコアが
 * 隣の低温側より真に大きければ (割当, スコア) を入れ替える。
 * 完全なソートではない。
 *
 * @return 入れ替えた回数
 */
size_t exchange_pass(std::vector<ChainState>& ladder);

/**
 * @brief レベル level の乱数シードを導出
 *
 * 同じ seed からレベルごとに異なる系列を得る。
 * level = SIZE_MAX は初期割当用。
 */
uint64_t derive_seed(uint64_t seed, size_t level);

/**
 * @brief レプリカ交換コーディネータ
 *
 * 温度 base * 2^i のチェーンを ladder_size 本並行に走らせ、
 * 各ラウンドの終わりに全チェーンを待ってから交換パスを行う。
 * 基準温度が final_temperature 以下になったらレベル 0 の割当を返す。
 *
 * 乱数生成器はレベルに属し、チェーン状態には属さない。
 * そのため同じ seed なら結果はスレッド数やスケジューリングに依存しない。
 */
class Annealer {
public:
    explicit Annealer(AnnealerConfig config);

    /**
     * @brief 焼きなましを実行
     *
     * 問題と設定を検証してから探索を開始する。
     * 返される割当は problem.people を参照するので、problem は結果より長く生存すること。
     *
     * @throws std::runtime_error 問題定義または設定が不正な場合
     */
    Assignment run(const Problem& problem);

    /**
     * @brief 設定を取得
     */
    const AnnealerConfig& config() const { return config_; }

    /**
     * @brief 統計情報を取得
     */
    const AnnealerStats& stats() const { return stats_; }

    /**
     * @brief 最後の run() 終了時の各レベルのスコア（低温側から）
     */
    const std::vector<double>& ladder_scores() const { return ladder_scores_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief run() が使うワーカースレッド数（常に ladder_size 以下）
     */
    size_t worker_count() const;

private:
    AnnealerConfig config_;
    AnnealerStats stats_;
    std::vector<double> ladder_scores_;
    bool verbose_ = false;
};

} // namespace seatplan

#endif // SEATPLAN_ANNEALER_HPP
