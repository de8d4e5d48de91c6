#pragma once

#include "../config/CleaningConfig.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace processing
{
class ILanguageDetector;
}

namespace app
{

struct CleaningStats
{
    std::size_t read = 0;      // decoded records
    std::size_t written = 0;
    std::size_t rejected = 0;  // failed the language gate
    std::size_t malformed = 0; // lines that did not decode as a dialogue record
    std::size_t failed = 0;    // records dropped after an unexpected error
};

// "pippa.jsonl" -> "pippa_cleaned.jsonl"; everything from the first '.' of
// the base name is dropped.
std::string outputFileNameFor(const std::string& input_file);

// Reads every record of the configured input, cleans it and writes the
// survivors in input order.
class CleaningJob
{
public:
    static constexpr std::size_t kChunkSize = 256;

    CleaningJob(const config::AppConfig& config, const processing::ILanguageDetector& detector);
    ~CleaningJob();

    CleaningJob(const CleaningJob&) = delete;
    CleaningJob& operator=(const CleaningJob&) = delete;

    [[nodiscard]] const std::string& inputPath() const noexcept;
    [[nodiscard]] const std::string& outputPath() const noexcept;

    // std::nullopt on a fatal I/O error (already reported through ErrorReporter)
    std::optional<CleaningStats> run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace app
