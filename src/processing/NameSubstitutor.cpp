#include "NameSubstitutor.hpp"
#include "TextUtils.hpp"
#include "../dataset/DialogueRecord.hpp"

namespace processing
{

namespace
{

std::size_t substituteInPlace(std::string& message, const std::string& character_name)
{
    // {{char}} first, then the redaction markers
    std::size_t count = replaceAll(message, NameSubstitutor::kCharacterPlaceholder, character_name);
    for (auto token : NameSubstitutor::kRedactionTokens)
        count += replaceAll(message, token, NameSubstitutor::kUserPlaceholder);
    return count;
}

} // namespace

std::string NameSubstitutor::substituteMessage(const std::string& message, const std::string& character_name) const
{
    std::string out = message;
    substituteInPlace(out, character_name);
    return out;
}

std::size_t NameSubstitutor::substitute(std::vector<dataset::Turn>& conversation,
                                        const std::string& character_name) const
{
    std::size_t count = 0;
    for (auto& turn : conversation)
        count += substituteInPlace(turn.message, character_name);
    return count;
}

} // namespace processing
