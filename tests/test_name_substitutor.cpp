#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "dataset/DialogueRecord.hpp"
#include "processing/NameSubstitutor.hpp"

using processing::NameSubstitutor;

TEST_CASE("NameSubstitutor - single message", "[substitution]") {
    NameSubstitutor substitutor;

    SECTION("Redaction and character placeholder") {
        REQUIRE(substitutor.substituteMessage("[REDACTED] told {{char}} hello", "Aria") == "{{user}} told Aria hello");
    }

    SECTION("Every redaction marker maps to the user placeholder") {
        const std::string input = "[NAME_IN_MESSAGE_REDACTED] [REDACTED] [FIRST_NAME_REDACTED] "
                                  "[USERNAME_REDACTED] [NAME_REDACTED]";
        REQUIRE(substitutor.substituteMessage(input, "Aria") == "{{user}} {{user}} {{user}} {{user}} {{user}}");
    }

    SECTION("All occurrences are replaced") {
        REQUIRE(substitutor.substituteMessage("{{char}}, {{char}}!", "Kai") == "Kai, Kai!");
    }

    SECTION("Near misses are untouched") {
        REQUIRE(substitutor.substituteMessage("[REDACTED {{chars}} {char}", "Kai") == "[REDACTED {{chars}} {char}");
    }

    SECTION("The user placeholder itself is kept") {
        REQUIRE(substitutor.substituteMessage("hi {{user}}", "Kai") == "hi {{user}}");
    }
}

TEST_CASE("NameSubstitutor - whole conversation", "[substitution]") {
    NameSubstitutor substitutor;
    std::vector<dataset::Turn> conversation = {
        dataset::makeTurn("Hi {{char}}, I'm [FIRST_NAME_REDACTED]", true),
        dataset::makeTurn("Nice to meet you, [NAME_REDACTED]. I'm {{char}}.", false),
        dataset::makeTurn("No placeholders here", true),
    };

    REQUIRE(substitutor.substitute(conversation, "Aria") == 4);
    REQUIRE(conversation[0].message == "Hi Aria, I'm {{user}}");
    REQUIRE(conversation[1].message == "Nice to meet you, {{user}}. I'm Aria.");
    REQUIRE(conversation[2].message == "No placeholders here");
}
