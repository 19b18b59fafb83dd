#include "internal/text/language_classifier.hpp"

#include <string>

#include "internal/text/text_utils.hpp"

namespace mixvoice {
namespace text {

TextType classifyText(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return TextType::EN;
    }

    if (isNumericToken(trimmed)) {
        return TextType::EN;
    }

    bool has_chinese = false;
    bool has_english = false;
    for (const auto& ch : splitUtf8(trimmed)) {
        if (isCjkChar(ch)) {
            has_chinese = true;
        } else if (isEnglishLetter(ch)) {
            has_english = true;
        }
        if (has_chinese && has_english) {
            return TextType::MIXED;
        }
    }

    return has_chinese ? TextType::ZH : TextType::EN;
}

}  // namespace text
}  // namespace mixvoice
