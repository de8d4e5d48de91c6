#pragma once

#include "EncodingRepairer.hpp"
#include "ITextNormalizer.hpp"

#include <functional>
#include <string>
#include <vector>

namespace processing
{

// Individual cleanup rules, in the order DialogueTextNormalizer applies them.

[[nodiscard]] std::string trim_whitespace(const std::string& text);
// Runs of three or more '\n' become exactly two
[[nodiscard]] std::string collapse_newlines(const std::string& text);
// Markdown images "![alt](url)" and the newlines following them
[[nodiscard]] std::string remove_image_embeds(const std::string& text);
[[nodiscard]] std::string space_after_ellipsis(const std::string& text);
// Four or more of '.', '-', '*' or '!' in a row become three
[[nodiscard]] std::string collapse_loud_punctuation(const std::string& text);
[[nodiscard]] std::string canonicalize_ellipses(const std::string& text);
[[nodiscard]] std::string tighten_spaced_punctuation(const std::string& text);
// "endOf.Next" style run-together sentences get a space after the terminator
[[nodiscard]] std::string space_run_on_sentences(const std::string& text);
[[nodiscard]] std::string strip_invisible_whitespace(const std::string& text);
[[nodiscard]] std::string collapse_double_spaces(const std::string& text);
// Literal "\n", "\~" and "\-" typed as two characters
[[nodiscard]] std::string unescape_literal_sequences(const std::string& text);
[[nodiscard]] std::string strip_spaces_before_newline(const std::string& text);
[[nodiscard]] std::string expand_horizontal_ellipsis(const std::string& text);
[[nodiscard]] std::string strip_leading_dashes(const std::string& text);
[[nodiscard]] std::string emdash_to_hyphen(const std::string& text);

struct NormalizationRule
{
    std::string name;
    std::function<std::string(const std::string&)> apply;
};

// The dialogue message cleaner: a fixed, ordered list of rules. Punctuation
// and layout rules run before the encoding repair, micro-cleanups after it.
class DialogueTextNormalizer : public ITextNormalizer
{
public:
    explicit DialogueTextNormalizer(EncodingRepairOptions repair_options = EncodingRepairOptions::dialogueDefaults());

    DialogueTextNormalizer(const DialogueTextNormalizer&) = delete;
    DialogueTextNormalizer& operator=(const DialogueTextNormalizer&) = delete;

    [[nodiscard]] std::string normalize(const std::string& text) const override;

    [[nodiscard]] const std::vector<NormalizationRule>& rules() const noexcept { return rules_; }

private:
    EncodingRepairer repairer_;
    std::vector<NormalizationRule> rules_;
};

} // namespace processing
