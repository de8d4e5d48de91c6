#include "JsonlRecordReader.hpp"

#include <exception>

namespace dataset
{

JsonlRecordReader::JsonlRecordReader(const std::string& path)
    : path_(path)
    , file_(path, std::ios::binary)
{
}

bool JsonlRecordReader::next(Entry& entry)
{
    std::string line;
    while (std::getline(file_, line))
    {
        ++line_number_;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line.find_first_not_of(" \t") == std::string::npos)
            continue;

        entry = Entry{};
        entry.line_number = line_number_;
        try
        {
            entry.record = parseRecordLine(line);
        }
        catch (const RecordFormatError& e)
        {
            entry.error = e.what();
        }
        catch (const nlohmann::ordered_json::exception& e)
        {
            entry.error = std::string("JSON error: ") + e.what();
        }
        return true;
    }
    return false;
}

} // namespace dataset
