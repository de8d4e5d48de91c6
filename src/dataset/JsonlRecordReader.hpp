#pragma once

#include "DialogueRecord.hpp"

#include <fstream>
#include <optional>
#include <string>

namespace dataset
{

// Reads dialogue records from a JSON Lines file. Blank lines are skipped;
// a line that fails to decode comes back as an entry with an error.
class JsonlRecordReader
{
public:
    struct Entry
    {
        std::size_t line_number = 0; // 1-based
        std::optional<DialogueRecord> record;
        std::string error;
    };

    explicit JsonlRecordReader(const std::string& path);

    [[nodiscard]] bool isOpen() const { return file_.is_open(); }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // False at end of file.
    bool next(Entry& entry);

private:
    std::string path_;
    std::ifstream file_;
    std::size_t line_number_ = 0;
};

} // namespace dataset
