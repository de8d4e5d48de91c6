#include "DialogueRecord.hpp"

#include <utility>

namespace dataset
{

using json = nlohmann::ordered_json;

namespace
{

constexpr const char* kConversationKey = "conversation";
constexpr const char* kCharacterKey = "bot_name";
constexpr const char* kMessageKey = "message";
constexpr const char* kIsHumanKey = "is_human";

Turn parseTurn(const json& value, std::size_t index)
{
    if (!value.is_object())
        throw RecordFormatError("turn " + std::to_string(index) + " is not an object");

    auto message = value.find(kMessageKey);
    if (message == value.end())
        throw RecordFormatError("turn " + std::to_string(index) + " has no 'message'");
    if (!message->is_string())
        throw RecordFormatError("turn " + std::to_string(index) + " 'message' is not a string");

    Turn turn;
    turn.message = message->get<std::string>();
    turn.source = value;

    auto is_human = value.find(kIsHumanKey);
    if (is_human != value.end() && is_human->is_boolean())
        turn.is_human = is_human->get<bool>();

    return turn;
}

int hexDigit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Code unit of the four hex digits at pos, -1 if there are none
long readCodeUnit(const std::string& text, std::size_t pos)
{
    if (pos + 4 > text.size())
        return -1;
    long unit = 0;
    for (std::size_t k = 0; k < 4; ++k)
    {
        int digit = hexDigit(text[pos + k]);
        if (digit < 0)
            return -1;
        unit = unit * 16 + digit;
    }
    return unit;
}

bool isHighSurrogate(long unit) { return unit >= 0xD800 && unit <= 0xDBFF; }
bool isLowSurrogate(long unit) { return unit >= 0xDC00 && unit <= 0xDFFF; }

// Escapes of lone UTF-16 surrogates (D800..DFFF) are rejected by the parser.
// They are rewritten to the FFFD escape; escaped surrogate pairs are kept.
// Returns false if nothing changed.
bool replaceLoneSurrogateEscapes(const std::string& line, std::string& out)
{
    out.clear();
    out.reserve(line.size());

    bool changed = false;
    bool in_string = false;
    std::size_t i = 0;
    while (i < line.size())
    {
        const char c = line[i];
        if (c == '"')
            in_string = !in_string;

        if (!in_string || c != '\\' || i + 1 >= line.size())
        {
            out.push_back(c);
            ++i;
            continue;
        }

        const long unit = line[i + 1] == 'u' ? readCodeUnit(line, i + 2) : -1;
        if (!isHighSurrogate(unit) && !isLowSurrogate(unit))
        {
            out.append(line, i, 2);
            i += 2;
            continue;
        }

        if (isHighSurrogate(unit) && i + 7 < line.size() && line[i + 6] == '\\' && line[i + 7] == 'u' &&
            isLowSurrogate(readCodeUnit(line, i + 8)))
        {
            out.append(line, i, 12);
            i += 12;
            continue;
        }

        out += "\\uFFFD";
        i += 6;
        changed = true;
    }
    return changed;
}

json parseLine(const std::string& line)
{
    try
    {
        return json::parse(line);
    }
    catch (const json::parse_error& e)
    {
        throw RecordFormatError(std::string("JSON parse error: ") + e.what());
    }
}

} // namespace

Turn makeTurn(std::string message, std::optional<bool> is_human)
{
    Turn turn;
    turn.source = json::object();
    turn.source[kMessageKey] = message;
    if (is_human)
        turn.source[kIsHumanKey] = *is_human;
    turn.message = std::move(message);
    turn.is_human = is_human;
    return turn;
}

DialogueRecord parseRecord(const json& value)
{
    if (!value.is_object())
        throw RecordFormatError("record is not a JSON object");

    auto conversation = value.find(kConversationKey);
    if (conversation == value.end())
        throw RecordFormatError("record has no 'conversation'");
    if (!conversation->is_array())
        throw RecordFormatError("'conversation' is not an array");

    auto character = value.find(kCharacterKey);
    if (character == value.end())
        throw RecordFormatError("record has no 'bot_name'");
    if (!character->is_string())
        throw RecordFormatError("'bot_name' is not a string");

    DialogueRecord record;
    record.character_name = character->get<std::string>();
    record.conversation.reserve(conversation->size());
    for (std::size_t i = 0; i < conversation->size(); ++i)
        record.conversation.push_back(parseTurn((*conversation)[i], i));

    // Keep the whole object so the output preserves key order; conversation
    // and bot_name are overwritten from the typed fields on encode.
    record.extra_fields = value;
    return record;
}

DialogueRecord parseRecordLine(const std::string& line)
{
    std::string repaired;
    if (replaceLoneSurrogateEscapes(line, repaired))
        return parseRecord(parseLine(repaired));
    return parseRecord(parseLine(line));
}

json toJson(const DialogueRecord& record)
{
    json out = record.extra_fields.is_object() ? record.extra_fields : json::object();

    json turns = json::array();
    for (const auto& turn : record.conversation)
    {
        json turn_json = turn.source.is_object() ? turn.source : json::object();
        turn_json[kMessageKey] = turn.message;
        if (turn.is_human)
            turn_json[kIsHumanKey] = *turn.is_human;
        turns.push_back(std::move(turn_json));
    }

    out[kConversationKey] = std::move(turns);
    out[kCharacterKey] = record.character_name;
    return out;
}

} // namespace dataset
