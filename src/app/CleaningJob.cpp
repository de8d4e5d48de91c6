#include "CleaningJob.hpp"
#include "../dataset/JsonlRecordReader.hpp"
#include "../dataset/JsonlRecordWriter.hpp"
#include "../processing/ConversationCleaner.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/LanguageGate.hpp"
#include "../processing/NameSubstitutor.hpp"
#include "../processing/TextNormalizer.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <thread>
#include <vector>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace app
{

namespace
{

struct RecordResult
{
    enum class Status
    {
        Cleaned,
        Rejected,
        Failed
    };

    Status status = Status::Failed;
    std::optional<dataset::DialogueRecord> record;
    processing::LanguageGate::Verdict verdict;
    std::string error;
};

std::size_t resolveWorkerCount(std::size_t configured)
{
    if (configured > 0)
        return configured;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

std::string firstMessage(const dataset::DialogueRecord& record)
{
    return record.conversation.empty() ? std::string() : record.conversation.front().message;
}

} // namespace

std::string outputFileNameFor(const std::string& input_file)
{
    std::string base = fs::path(input_file).filename().string();
    auto dot = base.find('.');
    if (dot != std::string::npos)
        base.erase(dot);
    return base + "_cleaned.jsonl";
}

struct CleaningJob::Impl
{
    Impl(const config::AppConfig& cfg, const processing::ILanguageDetector& detector)
        : settings(cfg)
        , gate(detector, cfg.cleaning.target_language)
        , cleaner(gate, normalizer, substitutor)
    {
        fs::path data_dir(config::resolveDataDir(cfg));
        input_path = (data_dir / cfg.cleaning.pippa_file).string();
        const std::string output_name = cfg.cleaning.output_file.empty()
                                            ? outputFileNameFor(cfg.cleaning.pippa_file)
                                            : cfg.cleaning.output_file;
        output_path = (data_dir / output_name).string();
    }

    RecordResult process(const dataset::DialogueRecord& input) const
    {
        RecordResult result;
        try
        {
            auto outcome = cleaner.cleanConversation(input.conversation, input.character_name,
                                                     settings.cleaning.language_threshold);
            result.verdict = outcome.verdict;
            if (!outcome.conversation)
            {
                result.status = RecordResult::Status::Rejected;
                return result;
            }

            dataset::DialogueRecord cleaned = input;
            cleaned.conversation = std::move(*outcome.conversation);
            result.record = std::move(cleaned);
            result.status = RecordResult::Status::Cleaned;
        }
        catch (const std::exception& ex)
        {
            result.status = RecordResult::Status::Failed;
            result.error = ex.what();
        }
        return result;
    }

    void processChunk(const std::vector<dataset::DialogueRecord>& records, std::vector<RecordResult>& results) const
    {
        PROFILE_SCOPE_FUNCTION();

        results.assign(records.size(), RecordResult{});
        const std::size_t thread_count = std::min(resolveWorkerCount(settings.cleaning.workers), records.size());
        if (thread_count <= 1)
        {
            for (std::size_t i = 0; i < records.size(); ++i)
                results[i] = process(records[i]);
            return;
        }

        // Each record is independent; workers claim indices and write only their own slot
        std::atomic<std::size_t> next_index{ 0 };
        std::vector<std::thread> workers;
        workers.reserve(thread_count);
        for (std::size_t t = 0; t < thread_count; ++t)
        {
            workers.emplace_back(
                [&]()
                {
                    for (std::size_t i = next_index.fetch_add(1); i < records.size(); i = next_index.fetch_add(1))
                        results[i] = process(records[i]);
                });
        }
        for (auto& worker : workers)
            worker.join();
    }

    const config::AppConfig& settings;
    processing::DialogueTextNormalizer normalizer;
    processing::NameSubstitutor substitutor;
    processing::LanguageGate gate;
    processing::ConversationCleaner cleaner;
    std::string input_path;
    std::string output_path;
};

CleaningJob::CleaningJob(const config::AppConfig& config, const processing::ILanguageDetector& detector)
    : impl_(std::make_unique<Impl>(config, detector))
{
}

CleaningJob::~CleaningJob() = default;

const std::string& CleaningJob::inputPath() const noexcept { return impl_->input_path; }

const std::string& CleaningJob::outputPath() const noexcept { return impl_->output_path; }

std::optional<CleaningStats> CleaningJob::run()
{
    PROFILE_SCOPE_FUNCTION();

    dataset::JsonlRecordReader reader(impl_->input_path);
    if (!reader.isOpen())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Input, "Cannot open input file", impl_->input_path);
        return std::nullopt;
    }

    std::error_code ec;
    auto output_dir = fs::path(impl_->output_path).parent_path();
    if (!output_dir.empty())
        fs::create_directories(output_dir, ec);

    dataset::JsonlRecordWriter writer(impl_->output_path);
    if (!writer.isOpen())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Output, "Cannot create output file",
                                          impl_->output_path + (ec ? ": " + ec.message() : std::string()));
        return std::nullopt;
    }

    PLOG_INFO << "Cleaning " << impl_->input_path << " -> " << impl_->output_path
              << " (threshold=" << impl_->settings.cleaning.language_threshold
              << ", target=" << impl_->settings.cleaning.target_language << ")";

    CleaningStats stats;
    std::vector<dataset::DialogueRecord> chunk;
    std::vector<std::size_t> line_numbers;
    std::vector<RecordResult> results;
    chunk.reserve(kChunkSize);
    line_numbers.reserve(kChunkSize);

    auto flush_chunk = [&]() -> bool
    {
        impl_->processChunk(chunk, results);

        for (std::size_t i = 0; i < results.size(); ++i)
        {
            auto& result = results[i];
            switch (result.status)
            {
            case RecordResult::Status::Cleaned:
                if (!writer.write(*result.record))
                {
                    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Output, "Failed writing output file",
                                                      impl_->output_path);
                    return false;
                }
                ++stats.written;
                break;
            case RecordResult::Status::Rejected:
                ++stats.rejected;
                PLOG_INFO << "Conversation is not in " << impl_->gate.targetLanguage() << " (line "
                          << line_numbers[i] << ", " << result.verdict.non_target_turns << "/"
                          << result.verdict.total_turns
                          << " turns): " << processing::Diagnostics::Preview(firstMessage(chunk[i]));
                break;
            case RecordResult::Status::Failed:
                ++stats.failed;
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Normalization, "Record dropped after error",
                                                  "line " + std::to_string(line_numbers[i]) + ": " + result.error);
                break;
            }
        }

        chunk.clear();
        line_numbers.clear();
        return true;
    };

    dataset::JsonlRecordReader::Entry entry;
    while (reader.next(entry))
    {
        if (!entry.record)
        {
            ++stats.malformed;
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Skipping malformed record",
                                                reader.path() + ":" + std::to_string(entry.line_number) + ": " +
                                                    entry.error);
            continue;
        }

        ++stats.read;
        chunk.push_back(std::move(*entry.record));
        line_numbers.push_back(entry.line_number);
        if (chunk.size() >= kChunkSize && !flush_chunk())
            return std::nullopt;
    }

    if (!chunk.empty() && !flush_chunk())
        return std::nullopt;

    if (!writer.flush())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Output, "Failed flushing output file",
                                          impl_->output_path);
        return std::nullopt;
    }

    PLOG_INFO << "Cleaned " << stats.read << " records: " << stats.written << " written, " << stats.rejected
              << " rejected, " << stats.malformed << " malformed, " << stats.failed << " failed";
    return stats;
}

} // namespace app
