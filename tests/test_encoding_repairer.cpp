#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>

#include "processing/EncodingRepairer.hpp"

using namespace processing;

namespace {

bool hasStep(const RepairReport& report, const std::string& name) {
    return std::find(report.steps.begin(), report.steps.end(), name) != report.steps.end();
}

} // namespace

TEST_CASE("EncodingRepairer - mojibake", "[encoding]") {
    EncodingRepairer repairer;

    SECTION("UTF-8 read as Windows-1252") {
        REQUIRE(repairer.repair("caf\xC3\x83\xC2\xA9") == "caf\xC3\xA9");
        REQUIRE(repairer.repair("It\xC3\xA2\xE2\x82\xAC\xE2\x84\xA2s") == "It's");
    }

    SECTION("Double encoding is undone over several passes") {
        REQUIRE(repairer.repair("caf\xC3\x83\xC6\x92\xC3\x82\xC2\xA9") == "caf\xC3\xA9");
    }

    SECTION("Legitimate accented text is left alone") {
        REQUIRE(repairer.repair("na\xC3\xAFve caf\xC3\xA9 r\xC3\xA9sum\xC3\xA9") == "na\xC3\xAFve caf\xC3\xA9 r\xC3\xA9sum\xC3\xA9");
        REQUIRE(repairer.repair("S\xC3\x83O PAULO") == "S\xC3\x83O PAULO");
    }

    SECTION("Accented capital before standalone punctuation is not mojibake") {
        REQUIRE(repairer.repair("CAF\xC3\x89\xE2\x80\xA6") == "CAF\xC3\x89\xE2\x80\xA6");
    }

    SECTION("Lost 0xA0 continuation shown as a space") {
        REQUIRE(repairer.repair("voil\xC3\x83  c\xC3\xA2\xE2\x82\xAC\xE2\x84\xA2" "est") == "voil\xC3\xA0 c'est");
    }

    SECTION("Only a lost 0xA0 after a lowercase word is restored") {
        REQUIRE(repairer.repair("Die Stra\xC3\x9F" "e hei\xC3\x9F Fu\xC3\x9F und caf\xC3\x83\xC2\xA9") ==
                "Die Stra\xC3\x9F" "e hei\xC3\x9F Fu\xC3\x9F und caf\xC3\xA9");
        REQUIRE(repairer.repair("CAF\xC3\x89 OPEN, it\xC3\xA2\xE2\x82\xAC\xE2\x84\xA2s") == "CAF\xC3\x89 OPEN, it's");
    }

    SECTION("Accented word before dash and quote is not a lost character") {
        EncodingRepairOptions options;
        options.uncurl_quotes = false;
        EncodingRepairer keep_quotes(options);

        const std::string touche = "\xE2\x80\x9CI said touch\xC3\xA9\xE2\x80\x94\xE2\x80\x9D";
        const std::string fiance = "She was his fianc\xC3\xA9\xE2\x80\x94\xE2\x80\x9D";
        REQUIRE(keep_quotes.repair(touche) == touche);
        REQUIRE(keep_quotes.repair(fiance) == fiance);
        REQUIRE(repairer.repair(touche) == "\"I said touch\xC3\xA9\xE2\x80\x94\"");
    }

    SECTION("Lone three-byte sequence outside a word is repaired") {
        REQUIRE(repairer.repair("say \xC3\xA5\xC2\xA5\xC2\xBD") == "say \xE5\xA5\xBD");
    }

    SECTION("Sequence cut short by a replacement character") {
        REQUIRE(repairer.repair("caf\xC3\x83\xEF\xBF\xBD") == "caf\xEF\xBF\xBD");
    }
}

TEST_CASE("EncodingRepairer - single character fixes", "[encoding]") {
    EncodingRepairer repairer;

    SECTION("C1 controls become Windows-1252 characters") {
        REQUIRE(repairer.repair("5\xC2\x80") == "5\xE2\x82\xAC");
    }

    SECTION("HTML entities") {
        REQUIRE(repairer.repair("fish &amp; chips") == "fish & chips");
        REQUIRE(repairer.repair("it&#x2019;s &#39;fine&#39;") == "it's 'fine'");
        REQUIRE(repairer.repair("&lt;b&gt; <b>") == "&lt;b&gt; <b>");
        REQUIRE(repairer.repair("AT&T; &bogus;") == "AT&T; &bogus;");
    }

    SECTION("Terminal escapes") {
        REQUIRE(repairer.repair("\x1b[31mred\x1b[0m") == "red");
    }

    SECTION("Line breaks") {
        REQUIRE(repairer.repair("a\r\nb\rc\xE2\x80\xA8" "d") == "a\nb\nc\nd");
    }

    SECTION("Surrogates") {
        REQUIRE(repairer.repair("\xED\xA0\xBD\xED\xB8\x80") == "\xF0\x9F\x98\x80");
        REQUIRE(repairer.repair("x\xED\xA0\xBDy") == "x\xEF\xBF\xBDy");
    }

    SECTION("Control characters") {
        REQUIRE(repairer.repair("a\x01" "b\xEF\xBB\xBF" "c") == "abc");
        REQUIRE(repairer.repair("a\tb\nc") == "a\tb\nc");
    }

    SECTION("NFC composition") {
        REQUIRE(repairer.repair("e\xCC\x81") == "\xC3\xA9");
    }
}

TEST_CASE("EncodingRepairer - option toggles", "[encoding]") {
    const std::string ligature = "\xEF\xAC\x81";
    const std::string fullwidth = "\xEF\xBC\xA8\xEF\xBD\x89";

    SECTION("Dialogue defaults keep ligatures and fullwidth forms") {
        EncodingRepairer repairer(EncodingRepairOptions::dialogueDefaults());
        REQUIRE(repairer.repair(ligature) == ligature);
        REQUIRE(repairer.repair(fullwidth) == fullwidth);
    }

    SECTION("All fixes enabled") {
        EncodingRepairer repairer(EncodingRepairOptions{});
        REQUIRE(repairer.repair(ligature) == "fi");
        REQUIRE(repairer.repair(fullwidth) == "Hi");
    }

    SECTION("Curly quotes can be kept") {
        EncodingRepairOptions options = EncodingRepairOptions::dialogueDefaults();
        options.uncurl_quotes = false;
        EncodingRepairer repairer(options);
        REQUIRE(repairer.repair("It\xC3\xA2\xE2\x82\xAC\xE2\x84\xA2s") == "It\xE2\x80\x99s");
    }
}

TEST_CASE("EncodingRepairer - explanations", "[encoding]") {
    const std::string input = "It\xC3\xA2\xE2\x82\xAC\xE2\x84\xA2s";

    SECTION("Steps are listed when explain is on") {
        EncodingRepairer repairer(EncodingRepairOptions{});
        auto report = repairer.repairAndExplain(input);
        REQUIRE(report.text == "It's");
        REQUIRE(hasStep(report, "fix_encoding"));
        REQUIRE(hasStep(report, "uncurl_quotes"));
        REQUIRE_FALSE(hasStep(report, "unescape_html"));
    }

    SECTION("Fast mode builds no explanation") {
        EncodingRepairer repairer;
        auto report = repairer.repairAndExplain(input);
        REQUIRE(report.text == "It's");
        REQUIRE(report.steps.empty());
    }
}
