#include "LanguageGate.hpp"
#include "Diagnostics.hpp"
#include "../dataset/DialogueRecord.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <exception>
#include <utility>

#include <plog/Log.h>

namespace processing
{

LanguageGate::LanguageGate(const ILanguageDetector& detector, std::string target_language)
    : detector_(detector)
    , target_language_(std::move(target_language))
{
}

bool LanguageGate::isTargetLanguage(const std::string& message) const
{
    try
    {
        return detector_.detect(message) == target_language_;
    }
    catch (const LanguageDetectionError& ex)
    {
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[LanguageGate] undetectable turn counted as non-target: " << ex.what()
                << " text=" << Diagnostics::Preview(message);
        }
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::LanguageDetection,
                                            "Language detector failed, turn counted as non-target",
                                            std::string(detector_.name()) + ": " + ex.what());
    }
    return false;
}

LanguageGate::Verdict LanguageGate::evaluate(const std::vector<dataset::Turn>& conversation, double threshold) const
{
    PROFILE_SCOPE_FUNCTION();

    Verdict verdict;
    verdict.total_turns = conversation.size();
    if (conversation.empty())
        return verdict;

    for (const auto& turn : conversation)
    {
        if (!isTargetLanguage(turn.message))
            ++verdict.non_target_turns;
    }

    verdict.ratio = static_cast<double>(verdict.non_target_turns) / static_cast<double>(verdict.total_turns);
    verdict.accepted = !(verdict.ratio > threshold);
    return verdict;
}

bool LanguageGate::accepts(const std::vector<dataset::Turn>& conversation, double threshold) const
{
    return evaluate(conversation, threshold).accepted;
}

} // namespace processing
