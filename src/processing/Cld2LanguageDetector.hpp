#pragma once

#include "LanguageDetector.hpp"

namespace processing
{

// Compact Language Detector 2. The model is a static table, so results are
// identical across runs and threads.
class Cld2LanguageDetector : public ILanguageDetector
{
public:
    [[nodiscard]] std::string detect(std::string_view text) const override;
    [[nodiscard]] const char* name() const noexcept override { return "cld2"; }
};

} // namespace processing
