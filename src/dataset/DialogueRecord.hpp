#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dataset
{

// Raised when a decoded JSON value does not have the dialogue record shape
class RecordFormatError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct Turn
{
    std::string message;
    std::optional<bool> is_human;  // speaker role, carried through untouched
    nlohmann::ordered_json source; // the turn object as read; written back with the cleaned message
};

struct DialogueRecord
{
    std::vector<Turn> conversation;
    std::string character_name;          // "bot_name"
    nlohmann::ordered_json extra_fields; // the top-level object as read; keys other than the two above pass through
};

/// Decode one record. Throws RecordFormatError for missing or mistyped fields.
DialogueRecord parseRecord(const nlohmann::ordered_json& value);

/// Decode one JSONL line. Parse errors are rethrown as RecordFormatError.
/// A lone UTF-16 surrogate escape decodes as U+FFFD.
DialogueRecord parseRecordLine(const std::string& line);

/// Encode a record with the original key order; "conversation" keeps its position.
nlohmann::ordered_json toJson(const DialogueRecord& record);

Turn makeTurn(std::string message, std::optional<bool> is_human = std::nullopt);

} // namespace dataset
