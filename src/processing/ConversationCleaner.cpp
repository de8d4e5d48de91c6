#include "ConversationCleaner.hpp"
#include "Diagnostics.hpp"
#include "StageRunner.hpp"
#include "../utils/Profile.hpp"

#include <utility>

#include <plog/Log.h>

namespace processing
{

namespace
{

void logGate(const LanguageGate::Verdict& verdict, double threshold)
{
    if (!Diagnostics::IsVerbose())
        return;

    PLOG_INFO_(Diagnostics::kLogInstance)
        << "[ConversationCleaner] stage=language_gate turns=" << verdict.total_turns
        << " non_target=" << verdict.non_target_turns << " ratio=" << verdict.ratio << " threshold=" << threshold
        << " status=" << (verdict.accepted ? "accepted" : "rejected");
}

void logNormalizeFailure(const text_processing::StageResult<std::string>& stage, std::size_t index)
{
    PLOG_WARNING_(Diagnostics::kLogInstance)
        << "[ConversationCleaner] stage=normalize turn=" << index << " status=error reason="
        << (stage.error ? *stage.error : "unknown") << " fallback=original";
}

} // namespace

ConversationCleaner::ConversationCleaner(const LanguageGate& gate, const ITextNormalizer& normalizer,
                                         const NameSubstitutor& substitutor)
    : gate_(gate)
    , normalizer_(normalizer)
    , substitutor_(substitutor)
{
}

CleaningOutcome ConversationCleaner::cleanConversation(const std::vector<dataset::Turn>& conversation,
                                                       const std::string& character_name, double threshold) const
{
    PROFILE_SCOPE_FUNCTION();

    CleaningOutcome outcome;
    outcome.verdict = gate_.evaluate(conversation, threshold);
    logGate(outcome.verdict, threshold);
    if (!outcome.verdict.accepted)
        return outcome;

    std::vector<dataset::Turn> cleaned = conversation;
    for (std::size_t i = 0; i < cleaned.size(); ++i)
    {
        auto& turn = cleaned[i];
        auto stage = run_stage<std::string>("normalize",
                                            [&]()
                                            {
                                                return normalizer_.normalize(turn.message);
                                            });
        if (stage.succeeded)
        {
            turn.message = std::move(stage.result);
        }
        else
        {
            logNormalizeFailure(stage, i);
            ++outcome.normalization_failures;
        }
    }

    outcome.substitutions = substitutor_.substitute(cleaned, character_name);
    outcome.conversation = std::move(cleaned);
    return outcome;
}

std::optional<std::vector<dataset::Turn>> ConversationCleaner::clean(const std::vector<dataset::Turn>& conversation,
                                                                     const std::string& character_name,
                                                                     double threshold) const
{
    return cleanConversation(conversation, character_name, threshold).conversation;
}

} // namespace processing
