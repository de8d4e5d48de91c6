#pragma once

#include <string>

namespace processing
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Cleans a single dialogue message. Never fails; unchanged text is a valid result.
    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;
};

} // namespace processing
