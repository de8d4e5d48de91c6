#include <catch2/catch_test_macros.hpp>
#include <string>

#include "app/CleaningJob.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/fake_language_detector.hpp"
#include "utils/temp_dir.hpp"

using app::CleaningJob;
using test_utils::FakeLanguageDetector;
using test_utils::TempDir;

namespace {

config::AppConfig makeConfig(const TempDir& dir, std::size_t workers) {
    config::AppConfig cfg;
    cfg.config_dir = dir.path().string();
    cfg.cleaning.pippa_file = "pippa.jsonl";
    cfg.cleaning.language_threshold = 0.25;
    cfg.cleaning.workers = workers;
    return cfg;
}

} // namespace

TEST_CASE("CleaningJob - output file name", "[job]") {
    REQUIRE(app::outputFileNameFor("pippa.jsonl") == "pippa_cleaned.jsonl");
    REQUIRE(app::outputFileNameFor("dir/pippa.v2.jsonl") == "pippa_cleaned.jsonl");
    REQUIRE(app::outputFileNameFor("noext") == "noext_cleaned.jsonl");
}

TEST_CASE("CleaningJob - cleans a small corpus", "[job]") {
    utils::ErrorReporter::ClearErrors();
    TempDir dir;
    dir.writeFile("data/pippa.jsonl",
                  R"({"bot_name":"Aria","conversation":[{"message":"{{char}} smiles.....","is_human":false},)"
                  R"({"message":"Hello.How are you?","is_human":true}]})" "\n"
                  "not a record\n"
                  R"({"bot_name":"Remy","conversation":[{"message":"Bonjour mon ami","is_human":false},)"
                  R"({"message":"Salut","is_human":true}]})" "\n"
                  R"({"bot_name":"Cy","conversation":[]})" "\n");

    FakeLanguageDetector detector;
    detector.setLanguage("Bonjour mon ami", "fr");
    detector.setLanguage("Salut", "fr");

    const auto cfg = makeConfig(dir, 2);
    CleaningJob job(cfg, detector);
    REQUIRE(job.outputPath() == (dir.path() / "data" / "pippa_cleaned.jsonl").lexically_normal().string());

    auto stats = job.run();
    REQUIRE(stats.has_value());
    REQUIRE(stats->read == 3);
    REQUIRE(stats->written == 2);
    REQUIRE(stats->rejected == 1);
    REQUIRE(stats->malformed == 1);
    REQUIRE(stats->failed == 0);

    REQUIRE(dir.readFile("data/pippa_cleaned.jsonl") ==
            R"({"bot_name":"Aria","conversation":[{"message":"Aria smiles...","is_human":false},)"
            R"({"message":"Hello. How are you?","is_human":true}]})" "\n"
            R"({"bot_name":"Cy","conversation":[]})" "\n");

    REQUIRE(utils::ErrorReporter::CountPending(utils::ErrorSeverity::Warning) == 1);
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Input);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("CleaningJob - input order survives chunking and workers", "[job]") {
    TempDir dir;
    std::string input;
    std::string expected;
    for (std::size_t i = 0; i < CleaningJob::kChunkSize + 44; ++i) {
        const std::string line =
            R"({"bot_name":"N","conversation":[{"message":"Line )" + std::to_string(i) + R"("}]})" "\n";
        input += line;
        expected += line;
    }
    dir.writeFile("data/pippa.jsonl", input);

    FakeLanguageDetector detector;
    auto cfg = makeConfig(dir, 3);
    cfg.cleaning.output_file = "out/clean.jsonl";

    CleaningJob job(cfg, detector);
    auto stats = job.run();
    REQUIRE(stats.has_value());
    REQUIRE(stats->written == CleaningJob::kChunkSize + 44);
    REQUIRE(dir.readFile("data/out/clean.jsonl") == expected);
}

TEST_CASE("CleaningJob - missing input is fatal", "[job]") {
    utils::ErrorReporter::ClearErrors();
    TempDir dir;
    FakeLanguageDetector detector;
    const auto cfg = makeConfig(dir, 1);

    CleaningJob job(cfg, detector);
    REQUIRE_FALSE(job.run().has_value());
    REQUIRE(utils::ErrorReporter::CountPending(utils::ErrorSeverity::Fatal) == 1);
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Input);
    utils::ErrorReporter::ClearErrors();
}
