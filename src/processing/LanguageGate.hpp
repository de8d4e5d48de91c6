#pragma once

#include "LanguageDetector.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace dataset
{
struct Turn;
}

namespace processing
{

// Decides whether a conversation is mostly in the target language. A turn
// the detector cannot classify counts against the conversation.
class LanguageGate
{
public:
    struct Verdict
    {
        std::size_t total_turns = 0;
        std::size_t non_target_turns = 0;
        double ratio = 0.0;
        bool accepted = true;
    };

    explicit LanguageGate(const ILanguageDetector& detector, std::string target_language = "en");

    // Rejected iff non_target / total > threshold. An empty conversation is accepted.
    [[nodiscard]] Verdict evaluate(const std::vector<dataset::Turn>& conversation, double threshold) const;
    [[nodiscard]] bool accepts(const std::vector<dataset::Turn>& conversation, double threshold) const;

    [[nodiscard]] bool isTargetLanguage(const std::string& message) const;

    [[nodiscard]] const std::string& targetLanguage() const noexcept { return target_language_; }

private:
    const ILanguageDetector& detector_;
    std::string target_language_;
};

} // namespace processing
