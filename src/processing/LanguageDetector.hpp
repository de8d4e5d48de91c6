#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace processing
{

// Thrown when a detector cannot name a language for the given text
class LanguageDetectionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ILanguageDetector
{
public:
    virtual ~ILanguageDetector() = default;

    // ISO 639-1 style code ("en", "fr", ...). Throws LanguageDetectionError.
    [[nodiscard]] virtual std::string detect(std::string_view text) const = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

enum class DetectorBackend
{
    Cld2
};

struct DetectorSettings
{
    // Logged with the run for reproducibility. CLD2 is a static table with no
    // random state, so it reads no seed; a sampling backend would seed from this.
    unsigned seed = 0;
    DetectorBackend backend = DetectorBackend::Cld2;
};

// Process-wide detector setup. Initialize() runs once before any
// classification; the first call fixes the settings for the whole process.
class DetectorFactory
{
public:
    static void Initialize(const DetectorSettings& settings = DetectorSettings{});
    [[nodiscard]] static bool IsInitialized() noexcept;
    [[nodiscard]] static DetectorSettings Settings();

    // Initializes with defaults if nobody did so yet.
    [[nodiscard]] static std::unique_ptr<ILanguageDetector> Create();
};

} // namespace processing
