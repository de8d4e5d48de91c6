#include <catch2/catch_test_macros.hpp>
#include <string>

#include "dataset/DialogueRecord.hpp"
#include "dataset/JsonlRecordReader.hpp"
#include "dataset/JsonlRecordWriter.hpp"
#include "utils/temp_dir.hpp"

using namespace dataset;
using test_utils::TempDir;

namespace {

const std::string kRecordLine =
    R"({"submission_timestamp":1,"categories":["a"],"bot_id":"x","bot_name":"Aria","bot_greeting":"hi",)"
    R"("bot_definitions":"d","bot_description":"desc",)"
    R"("conversation":[{"message":"Hi","is_human":true},{"message":"Hello","is_human":false}]})";

} // namespace

TEST_CASE("DialogueRecord - decoding", "[dataset]") {
    auto record = parseRecordLine(kRecordLine);

    REQUIRE(record.character_name == "Aria");
    REQUIRE(record.conversation.size() == 2);
    REQUIRE(record.conversation[0].message == "Hi");
    REQUIRE(record.conversation[0].is_human == std::optional<bool>(true));
    REQUIRE(record.conversation[1].is_human == std::optional<bool>(false));
    REQUIRE(record.extra_fields["bot_id"] == "x");
}

TEST_CASE("DialogueRecord - encoding keeps key order and unknown fields", "[dataset]") {
    auto record = parseRecordLine(kRecordLine);
    REQUIRE(toJson(record).dump() == kRecordLine);

    SECTION("Cleaned messages replace the originals in place") {
        record.conversation[1].message = "Hello there";
        auto out = toJson(record);
        REQUIRE(out["conversation"][1]["message"] == "Hello there");
        REQUIRE(out["conversation"][1]["is_human"] == false);
        REQUIRE(out.begin().key() == "submission_timestamp");
    }

    SECTION("Extra turn fields survive") {
        auto with_extra = parseRecordLine(
            R"({"bot_name":"Aria","conversation":[{"message":"Hi","is_human":true,"ts":5}]})");
        REQUIRE(toJson(with_extra)["conversation"][0]["ts"] == 5);
    }
}

TEST_CASE("DialogueRecord - surrogate escapes", "[dataset]") {
    SECTION("A lone surrogate becomes a replacement character") {
        auto record = parseRecordLine("{\"bot_name\":\"A\",\"conversation\":[{\"message\":\"hi \\ud83d there\"}]}");
        REQUIRE(record.conversation[0].message == "hi \xEF\xBF\xBD there");
    }

    SECTION("Lone low surrogate at the end of a string") {
        auto record = parseRecordLine("{\"bot_name\":\"A\",\"conversation\":[{\"message\":\"bye\\udc00\"}]}");
        REQUIRE(record.conversation[0].message == "bye\xEF\xBF\xBD");
    }

    SECTION("Surrogate pairs decode normally") {
        auto record = parseRecordLine("{\"bot_name\":\"A\",\"conversation\":[{\"message\":\"\\ud83d\\ude00\"}]}");
        REQUIRE(record.conversation[0].message == "\xF0\x9F\x98\x80");
    }

    SECTION("An escaped backslash is not an escape") {
        auto record = parseRecordLine("{\"bot_name\":\"A\",\"conversation\":[{\"message\":\"C:\\\\ud83d\"}]}");
        REQUIRE(record.conversation[0].message == "C:\\ud83d");
    }
}

TEST_CASE("DialogueRecord - malformed records", "[dataset]") {
    REQUIRE_THROWS_AS(parseRecordLine(R"({"conversation":[]})"), RecordFormatError);
    REQUIRE_THROWS_AS(parseRecordLine(R"({"bot_name":"A","conversation":"hi"})"), RecordFormatError);
    REQUIRE_THROWS_AS(parseRecordLine(R"({"bot_name":"A","conversation":[{"message":3}]})"), RecordFormatError);
    REQUIRE_THROWS_AS(parseRecordLine(R"({"bot_name":"A","conversation":[{"is_human":true}]})"), RecordFormatError);
    REQUIRE_THROWS_AS(parseRecordLine(R"({"bot_name":7,"conversation":[]})"), RecordFormatError);
    REQUIRE_THROWS_AS(parseRecordLine("[1, 2]"), RecordFormatError);
    REQUIRE_THROWS_AS(parseRecordLine("{not json"), RecordFormatError);
}

TEST_CASE("JsonlRecordReader - lines", "[dataset][io]") {
    TempDir dir;
    auto path = dir.writeFile("in.jsonl",
                              kRecordLine + "\r\n" +
                              "\n"
                              "   \n"
                              "{broken\n" +
                              R"({"bot_name":"B","conversation":[]})" + "\n");

    JsonlRecordReader reader(path.string());
    REQUIRE(reader.isOpen());

    JsonlRecordReader::Entry entry;
    REQUIRE(reader.next(entry));
    REQUIRE(entry.line_number == 1);
    REQUIRE(entry.record.has_value());
    REQUIRE(entry.record->character_name == "Aria");

    REQUIRE(reader.next(entry));
    REQUIRE(entry.line_number == 4);
    REQUIRE_FALSE(entry.record.has_value());
    REQUIRE_FALSE(entry.error.empty());

    REQUIRE(reader.next(entry));
    REQUIRE(entry.line_number == 5);
    REQUIRE(entry.record.has_value());
    REQUIRE(entry.record->conversation.empty());

    REQUIRE_FALSE(reader.next(entry));
}

TEST_CASE("JsonlRecordReader - missing file", "[dataset][io]") {
    TempDir dir;
    JsonlRecordReader reader((dir.path() / "nope.jsonl").string());
    REQUIRE_FALSE(reader.isOpen());
}

TEST_CASE("JsonlRecordWriter - one compact record per line", "[dataset][io]") {
    TempDir dir;
    const auto path = (dir.path() / "out.jsonl").string();

    {
        JsonlRecordWriter writer(path);
        REQUIRE(writer.isOpen());

        DialogueRecord record;
        record.character_name = "Zo\xC3\xAB";
        record.conversation.push_back(makeTurn("Caf\xC3\xA9?", true));
        REQUIRE(writer.write(record));
        REQUIRE(writer.write(parseRecordLine(kRecordLine)));
        REQUIRE(writer.flush());
        REQUIRE(writer.recordsWritten() == 2);
    }

    REQUIRE(dir.readFile("out.jsonl") ==
            R"({"conversation":[{"message":"Caf)" "\xC3\xA9" R"(?","is_human":true}],"bot_name":"Zo)" "\xC3\xAB" "\"}\n" +
                kRecordLine + "\n");
}
