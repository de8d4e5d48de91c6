#pragma once

#include "processing/LanguageDetector.hpp"

#include <atomic>
#include <string>
#include <unordered_map>

namespace test_utils {

// Detector with scripted answers. Unknown messages get the default language;
// a scripted empty answer throws LanguageDetectionError.
class FakeLanguageDetector : public processing::ILanguageDetector {
public:
    explicit FakeLanguageDetector(std::string default_language = "en");

    // Answer for an exact message
    void setLanguage(const std::string& message, const std::string& language);

    // Detection fails with LanguageDetectionError
    void failOn(const std::string& message);

    // Detection fails with a plain std::runtime_error
    void crashOn(const std::string& message);

    std::string detect(std::string_view text) const override;
    const char* name() const noexcept override { return "fake"; }

    std::size_t calls() const { return calls_.load(); }

private:
    enum class Behavior { Answer, Fail, Crash };
    struct Script {
        Behavior behavior = Behavior::Answer;
        std::string language;
    };

    std::string default_language_;
    std::unordered_map<std::string, Script> scripts_;
    mutable std::atomic<std::size_t> calls_{0};
};

} // namespace test_utils
