#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace dataset
{
struct Turn;
}

namespace processing
{

// Rewrites the character placeholder to the character's name and every
// upstream redaction marker to the user placeholder.
class NameSubstitutor
{
public:
    static constexpr std::string_view kCharacterPlaceholder = "{{char}}";
    static constexpr std::string_view kUserPlaceholder = "{{user}}";
    static constexpr std::array<std::string_view, 5> kRedactionTokens = {
        "[NAME_IN_MESSAGE_REDACTED]", "[REDACTED]", "[FIRST_NAME_REDACTED]", "[USERNAME_REDACTED]",
        "[NAME_REDACTED]",
    };

    [[nodiscard]] std::string substituteMessage(const std::string& message, const std::string& character_name) const;

    // Returns the number of replacements across the conversation
    std::size_t substitute(std::vector<dataset::Turn>& conversation, const std::string& character_name) const;
};

} // namespace processing
