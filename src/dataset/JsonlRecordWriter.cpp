#include "JsonlRecordWriter.hpp"

namespace dataset
{

JsonlRecordWriter::JsonlRecordWriter(const std::string& path)
    : path_(path)
    , file_(path, std::ios::binary | std::ios::trunc)
{
}

bool JsonlRecordWriter::write(const DialogueRecord& record)
{
    if (!file_)
        return false;

    // Invalid UTF-8 is replaced rather than aborting the whole batch
    file_ << toJson(record).dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << '\n';
    if (!file_)
        return false;

    ++written_;
    return true;
}

bool JsonlRecordWriter::flush()
{
    file_.flush();
    return static_cast<bool>(file_);
}

} // namespace dataset
