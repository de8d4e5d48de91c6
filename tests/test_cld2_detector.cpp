#include <catch2/catch_test_macros.hpp>
#include <string>

#include "processing/Cld2LanguageDetector.hpp"
#include "processing/LanguageDetector.hpp"
#include "processing/LanguageGate.hpp"

using namespace processing;

TEST_CASE("Cld2LanguageDetector - common languages", "[cld2]") {
    Cld2LanguageDetector detector;

    REQUIRE(detector.detect("I was walking down the street yesterday when I saw an old friend from school, "
                            "and we talked for hours about everything that had happened since then.") == "en");
    REQUIRE(detector.detect("Je me promenais dans la rue hier quand j'ai vu un vieil ami de l'\xC3\xA9" "cole, "
                            "et nous avons parl\xC3\xA9 pendant des heures de tout ce qui s'\xC3\xA9tait pass\xC3\xA9.") ==
            "fr");
}

TEST_CASE("Cld2LanguageDetector - text without features", "[cld2]") {
    Cld2LanguageDetector detector;

    REQUIRE_THROWS_AS(detector.detect(""), LanguageDetectionError);
    REQUIRE_THROWS_AS(detector.detect("12345 !!!"), LanguageDetectionError);
    REQUIRE_THROWS_AS(detector.detect(":) :) <3"), LanguageDetectionError);
}

TEST_CASE("Cld2LanguageDetector - control characters and noncharacters", "[cld2]") {
    Cld2LanguageDetector detector;
    const std::string english = "my friend, how are you doing today? I hope everything is going well at home.";

    SECTION("Stray C1 control") {
        REQUIRE(detector.detect("Hello there\xC2\x9D " + english) == "en");
    }

    SECTION("C0 control and noncharacter") {
        REQUIRE(detector.detect("Hello there\x01 " + english + "\xEF\xBF\xBF") == "en");
    }

    SECTION("The gate still counts the turn as English") {
        LanguageGate gate(detector);
        REQUIRE(gate.isTargetLanguage("Hello there\xC2\x9D " + english));
    }

    SECTION("Undecodable bytes are still a failure") {
        REQUIRE_THROWS_AS(detector.detect("Hello \xFF" + english), LanguageDetectionError);
    }
}

TEST_CASE("Cld2LanguageDetector - results are stable", "[cld2]") {
    Cld2LanguageDetector detector;
    const std::string text = "Well, I suppose we could try the other road tomorrow morning.";
    const std::string first = detector.detect(text);
    for (int i = 0; i < 5; ++i)
        REQUIRE(detector.detect(text) == first);
}

TEST_CASE("DetectorFactory - fixed seed and default backend", "[cld2]") {
    DetectorFactory::Initialize();
    REQUIRE(DetectorFactory::IsInitialized());
    REQUIRE(DetectorFactory::Settings().seed == 0);

    SECTION("Later settings are ignored") {
        DetectorFactory::Initialize(DetectorSettings{ 42, DetectorBackend::Cld2 });
        REQUIRE(DetectorFactory::Settings().seed == 0);
    }

    auto detector = DetectorFactory::Create();
    REQUIRE(detector != nullptr);
    REQUIRE(std::string(detector->name()) == "cld2");
}
