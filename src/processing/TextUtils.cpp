#include "TextUtils.hpp"
#include <utf8proc.h>

#include <cstdint>

namespace processing
{

namespace
{

// Decodes one sequence starting at index. Encoded surrogates (ED A0..BF xx)
// are returned as-is so the encoding repair pass can pair or replace them.
bool decodeNextUtf8(std::string_view text, size_t& index, char32_t& codepoint)
{
    const unsigned char lead = static_cast<unsigned char>(text[index]);

    if (lead < 0x80u)
    {
        codepoint = lead;
        ++index;
        return true;
    }

    size_t remaining = text.size() - index;
    if (lead < 0xC2u)
    {
        ++index;
        return false;
    }

    auto is_cont = [](unsigned char c) { return (c & 0xC0u) == 0x80u; };

    if (lead < 0xE0u)
    {
        if (remaining < 2 || !is_cont(static_cast<unsigned char>(text[index + 1])))
        {
            ++index;
            return false;
        }
        unsigned char c1 = static_cast<unsigned char>(text[index + 1]);
        codepoint = ((lead & 0x1Fu) << 6) | (c1 & 0x3Fu);
        index += 2;
        return true;
    }

    if (lead < 0xF0u)
    {
        if (remaining < 3)
        {
            ++index;
            return false;
        }
        unsigned char c1 = static_cast<unsigned char>(text[index + 1]);
        unsigned char c2 = static_cast<unsigned char>(text[index + 2]);
        if (!is_cont(c1) || !is_cont(c2) || (lead == 0xE0u && c1 < 0xA0u))
        {
            ++index;
            return false;
        }
        codepoint = ((lead & 0x0Fu) << 12) | ((c1 & 0x3Fu) << 6) | (c2 & 0x3Fu);
        index += 3;
        return true;
    }

    if (lead < 0xF5u)
    {
        if (remaining < 4)
        {
            ++index;
            return false;
        }
        unsigned char c1 = static_cast<unsigned char>(text[index + 1]);
        unsigned char c2 = static_cast<unsigned char>(text[index + 2]);
        unsigned char c3 = static_cast<unsigned char>(text[index + 3]);
        if (!is_cont(c1) || !is_cont(c2) || !is_cont(c3) || (lead == 0xF0u && c1 < 0x90u) ||
            (lead == 0xF4u && c1 >= 0x90u))
        {
            ++index;
            return false;
        }
        codepoint = ((lead & 0x07u) << 18) | ((c1 & 0x3Fu) << 12) | ((c2 & 0x3Fu) << 6) | (c3 & 0x3Fu);
        index += 4;
        return true;
    }

    ++index;
    return false;
}

} // namespace

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());

    size_t index = 0;
    while (index < utf8_str.size())
    {
        char32_t codepoint = 0;
        if (decodeNextUtf8(utf8_str, index, codepoint))
            result.push_back(codepoint);
        else
            result.push_back(REPLACEMENT_CHAR);
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        // utf8proc reserves U+FFFE/U+FFFF for its own markers
        if (cp == 0xFFFEu || cp == 0xFFFFu)
        {
            result.push_back(static_cast<char>(0xEFu));
            result.push_back(static_cast<char>(0xBFu));
            result.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
            continue;
        }

        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isWhitespace(char32_t cp)
{
    switch (static_cast<uint32_t>(cp))
    {
    case 0x0009u:
    case 0x000Au:
    case 0x000Bu:
    case 0x000Cu:
    case 0x000Du:
    case 0x0020u:
    case 0x001Cu:
    case 0x001Du:
    case 0x001Eu:
    case 0x001Fu:
    case 0x0085u:
    case 0x00A0u:
    case 0x1680u:
    case 0x2028u:
    case 0x2029u:
    case 0x202Fu:
    case 0x205Fu:
    case 0x3000u:
        return true;
    default:
        return cp >= 0x2000u && cp <= 0x200Au; // en quad .. hair space
    }
}

bool isLetter(char32_t cp)
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
        return true;
    default:
        return false;
    }
}

bool isWordChar(char32_t cp)
{
    if (cp == U'_')
        return true;
    if (cp < 0x80)
        return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= U'0' && cp <= U'9');

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return isLetter(cp);
    }
}

std::size_t replaceAll(std::string& text, std::string_view from, std::string_view to)
{
    if (from.empty() || text.size() < from.size())
        return 0;

    std::size_t count = 0;
    std::string out;
    std::size_t pos = 0;
    while (true)
    {
        std::size_t hit = text.find(from, pos);
        if (hit == std::string::npos)
            break;
        if (count == 0)
            out.reserve(text.size());
        out.append(text, pos, hit - pos);
        out.append(to);
        pos = hit + from.size();
        ++count;
    }

    if (count > 0)
    {
        out.append(text, pos, std::string::npos);
        text = std::move(out);
    }
    return count;
}

} // namespace processing
