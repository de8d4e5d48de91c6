#include "Diagnostics.hpp"

#include <algorithm>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = std::min(text.size(), kMaxPreviewBytes);
    // back off to a UTF-8 lead byte
    while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0u) == 0x80u)
        --cut;

    std::string out;
    out.reserve(cut + 16);

    for (std::size_t i = 0; i < cut; ++i)
    {
        char ch = text[i];
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }

    if (text.size() > cut)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 || c == 0x7F;
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace processing
