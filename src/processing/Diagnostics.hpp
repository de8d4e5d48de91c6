#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static constexpr std::size_t kMaxPreviewBytes = 160;

    // Single-line, length-limited rendering of a message for log output.
    // Never cuts a UTF-8 sequence in half.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
};

} // namespace processing
