#include <catch2/catch_test_macros.hpp>
#include <string>

#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter - pending queue", "[errors]") {
    ErrorReporter::ClearErrors();

    ErrorReporter::ReportWarning(ErrorCategory::Input, "Skipping malformed record", "line 3");
    ErrorReporter::ReportFatal(ErrorCategory::Output, "Cannot create output file", "/nope/out.jsonl");

    REQUIRE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::CountPending(ErrorSeverity::Warning) == 2);
    REQUIRE(ErrorReporter::CountPending(ErrorSeverity::Fatal) == 1);

    auto last = ErrorReporter::GetLastError();
    REQUIRE(last.is_fatal);
    REQUIRE(last.category == ErrorCategory::Output);
    REQUIRE(last.technical_details == "/nope/out.jsonl");
    REQUIRE_FALSE(last.timestamp.empty());

    SECTION("Draining empties the queue") {
        auto pending = ErrorReporter::GetPendingErrors();
        REQUIRE(pending.size() == 2);
        REQUIRE(pending.front().user_message == "Skipping malformed record");
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
        REQUIRE(ErrorReporter::CountPending(ErrorSeverity::Info) == 0);
    }

    SECTION("ClearErrors drops everything") {
        ErrorReporter::ClearErrors();
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
        REQUIRE(ErrorReporter::GetPendingErrors().empty());
    }

    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter - queue is bounded", "[errors]") {
    ErrorReporter::ClearErrors();

    for (int i = 0; i < 105; ++i)
        ErrorReporter::ReportError(ErrorCategory::Normalization, "failure " + std::to_string(i));

    REQUIRE(ErrorReporter::CountPending(ErrorSeverity::Info) == 100);
    REQUIRE(ErrorReporter::GetLastError().user_message == "failure 104");

    // oldest reports were dropped
    REQUIRE(ErrorReporter::GetPendingErrors().front().user_message == "failure 5");
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - names", "[errors]") {
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::LanguageDetection) == "Language Detection");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Warning) == "Warning");
}
