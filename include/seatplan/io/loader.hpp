/**
 * @file loader.hpp
 * @brief 問題ファイル（JSON）の読み込み
 */
#ifndef SEATPLAN_IO_LOADER_HPP
#define SEATPLAN_IO_LOADER_HPP

#include "seatplan/problem.hpp"
#include <string>

namespace seatplan {
namespace io {

/**
 * @brief JSONファイルから問題を読み込む
 *
 * 形式:
 * {"people": [{"name": "A", "preferences": ["B"]}, ...],
 *  "tables": [2, 2],
 *  "plusOnes": [{"personOne": "A", "personTwo": "B"}]}
 *
 * plusOnes と preferences は省略可能。整合性の検証は validate_problem() で行う。
 *
 * @throws std::runtime_error ファイルが開けない、または形式が不正な場合
 */
Problem parse_file(const std::string& filename);

/**
 * @brief JSON文字列から問題を読み込む
 */
Problem parse_string(const std::string& input);

} // namespace io
} // namespace seatplan

#endif // SEATPLAN_IO_LOADER_HPP
