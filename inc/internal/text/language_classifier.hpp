#ifndef MIXVOICE_LANGUAGE_CLASSIFIER_HPP
#define MIXVOICE_LANGUAGE_CLASSIFIER_HPP

/**
 * LanguageClassifier - 语言分类
 *
 * 将文本判定为 zh / en / mixed。纯函数，无副作用。
 */

#include <string>

#include "internal/mixvoice_types.hpp"

namespace mixvoice {
namespace text {

/**
 * @brief 判定文本类型
 * @param text 任意 UTF-8 文本
 * @return TextType::ZH / EN / MIXED
 *
 * 规则:
 * - 空白或空串 -> EN
 * - 仅由数字和 '.' '%' 组成 -> EN (数字默认使用英文音色)
 * - 同时包含中文字符(或中文标点)与英文字母 -> MIXED
 * - 仅含中文 -> ZH, 其余 -> EN
 */
TextType classifyText(const std::string& text);

}  // namespace text
}  // namespace mixvoice

#endif  // MIXVOICE_LANGUAGE_CLASSIFIER_HPP
