#pragma once

#include "ITextNormalizer.hpp"
#include "LanguageGate.hpp"
#include "NameSubstitutor.hpp"
#include "../dataset/DialogueRecord.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

struct CleaningOutcome
{
    LanguageGate::Verdict verdict;
    std::optional<std::vector<dataset::Turn>> conversation; // empty when rejected
    std::size_t normalization_failures = 0;                  // turns kept with their original text
    std::size_t substitutions = 0;
};

// Gate, then normalize every turn, then substitute names. Turns are copied,
// the caller's conversation is never modified.
class ConversationCleaner
{
public:
    ConversationCleaner(const LanguageGate& gate, const ITextNormalizer& normalizer,
                        const NameSubstitutor& substitutor);

    [[nodiscard]] CleaningOutcome cleanConversation(const std::vector<dataset::Turn>& conversation,
                                                    const std::string& character_name, double threshold) const;

    // Cleaned turns, or std::nullopt when the language gate rejects the conversation
    [[nodiscard]] std::optional<std::vector<dataset::Turn>> clean(const std::vector<dataset::Turn>& conversation,
                                                                  const std::string& character_name,
                                                                  double threshold) const;

private:
    const LanguageGate& gate_;
    const ITextNormalizer& normalizer_;
    const NameSubstitutor& substitutor_;
};

} // namespace processing
