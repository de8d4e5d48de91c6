#pragma once

#include "DialogueRecord.hpp"

#include <fstream>
#include <string>

namespace dataset
{

// One compact JSON object per line, UTF-8 kept as-is
class JsonlRecordWriter
{
public:
    explicit JsonlRecordWriter(const std::string& path);

    [[nodiscard]] bool isOpen() const { return file_.is_open(); }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // False once the underlying stream has failed.
    bool write(const DialogueRecord& record);
    bool flush();

    [[nodiscard]] std::size_t recordsWritten() const noexcept { return written_; }

private:
    std::string path_;
    std::ofstream file_;
    std::size_t written_ = 0;
};

} // namespace dataset
