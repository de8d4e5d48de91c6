#include "TextNormalizer.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include <plog/Log.h>

namespace processing
{

namespace
{

constexpr char32_t HORIZONTAL_ELLIPSIS = 0x2026u;
constexpr char32_t EM_DASH = 0x2014u;

bool isLoudPunctuation(char c)
{
    return c == '.' || c == '-' || c == '*' || c == '!';
}

std::string replaceEach(std::string text, std::initializer_list<std::pair<std::string_view, std::string_view>> pairs)
{
    for (const auto& [from, to] : pairs)
        replaceAll(text, from, to);
    return text;
}

} // namespace

std::string trim_whitespace(const std::string& text)
{
    if (text.empty())
        return text;

    std::u32string s = utf8ToUtf32(text);
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && isWhitespace(s[begin]))
        ++begin;
    while (end > begin && isWhitespace(s[end - 1]))
        --end;

    if (begin == 0 && end == s.size())
        return text;
    return utf32ToUtf8(s.substr(begin, end - begin));
}

std::string collapse_newlines(const std::string& text)
{
    if (text.empty())
        return text;

    std::string result;
    result.reserve(text.size());

    int consecutive_newlines = 0;
    for (char c : text)
    {
        if (c == '\n')
        {
            consecutive_newlines++;
            if (consecutive_newlines <= 2)
                result += '\n';
        }
        else
        {
            consecutive_newlines = 0;
            result += c;
        }
    }

    return result;
}

std::string remove_image_embeds(const std::string& text)
{
    if (text.find("![") == std::string::npos)
        return text;

    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        std::size_t start = text.find("![", i);
        if (start == std::string::npos)
            break;

        // "![alt](target)" on one line, closed by the first "](" and the first ')' after it
        std::size_t line_end = text.find('\n', start);
        if (line_end == std::string::npos)
            line_end = text.size();

        std::size_t label_end = text.find("](", start + 2);
        std::size_t close = label_end < line_end ? text.find(')', label_end + 2) : std::string::npos;
        if (close == std::string::npos || close >= line_end)
        {
            // no later "![" on this line can close either
            out.append(text, i, line_end - i);
            i = line_end;
            continue;
        }

        out.append(text, i, start - i);
        i = close + 1;
        while (i < text.size() && text[i] == '\n')
            ++i;
    }

    out.append(text, i, std::string::npos);
    return out;
}

std::string space_after_ellipsis(const std::string& text)
{
    if (text.find("...") == std::string::npos && text.find("\xE2\x80\xA6") == std::string::npos)
        return text;

    std::u32string s = utf8ToUtf32(text);
    std::u32string out;
    out.reserve(s.size() + 8);

    std::size_t i = 0;
    while (i < s.size())
    {
        out.push_back(s[i]);
        if (isWhitespace(s[i]))
        {
            ++i;
            continue;
        }

        std::size_t ellipsis_len = 0;
        if (i + 1 < s.size() && s[i + 1] == HORIZONTAL_ELLIPSIS)
            ellipsis_len = 1;
        else if (i + 3 < s.size() && s[i + 1] == U'.' && s[i + 2] == U'.' && s[i + 3] == U'.')
            ellipsis_len = 3;

        std::size_t next = i + 1 + ellipsis_len;
        // a following '.' belongs to a longer dot run, which is left to the loud punctuation rule
        if (ellipsis_len > 0 && next < s.size() && !isWhitespace(s[next]) && s[next] != U'.')
        {
            out.append(s, i + 1, ellipsis_len);
            out.push_back(U' ');
            i = next;
            continue;
        }
        ++i;
    }

    return utf32ToUtf8(out);
}

std::string collapse_loud_punctuation(const std::string& text)
{
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        char c = text[i];
        std::size_t run = 1;
        if (isLoudPunctuation(c))
        {
            while (i + run < text.size() && text[i + run] == c)
                ++run;
        }

        out.append(run >= 4 ? 3 : run, c);
        i += run;
    }
    return out;
}

std::string canonicalize_ellipses(const std::string& text)
{
    std::string spaced = replaceEach(text, { { " .. ", "... " }, { " ... ", "... " } });
    if (spaced.find("..") == std::string::npos)
        return spaced;

    // Two or three dots squeezed between word characters
    std::u32string s = utf8ToUtf32(spaced);
    std::u32string out;
    out.reserve(s.size() + 8);

    std::size_t i = 0;
    while (i < s.size())
    {
        if (s[i] != U'.')
        {
            out.push_back(s[i]);
            ++i;
            continue;
        }

        std::size_t run = 0;
        while (i + run < s.size() && s[i + run] == U'.')
            ++run;

        bool word_before = i > 0 && isWordChar(s[i - 1]);
        bool word_after = i + run < s.size() && isWordChar(s[i + run]);
        if ((run == 2 || run == 3) && word_before && word_after)
            out.append(U"... ");
        else
            out.append(run, U'.');
        i += run;
    }

    return utf32ToUtf8(out);
}

std::string tighten_spaced_punctuation(const std::string& text)
{
    return replaceEach(text, { { " . ", ". " }, { " , ", ", " }, { " ? ", "? " }, { " ! ", "! " } });
}

std::string space_run_on_sentences(const std::string& text)
{
    auto is_lower = [](char c) { return c >= 'a' && c <= 'z'; };
    auto is_upper = [](char c) { return c >= 'A' && c <= 'Z'; };

    std::string out;
    out.reserve(text.size() + 8);
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        out.push_back(c);
        // two ASCII lowercase letters, a terminator, then an uppercase letter
        if ((c == '.' || c == '!' || c == '?') && i >= 2 && i + 1 < text.size() && is_lower(text[i - 1]) &&
            is_lower(text[i - 2]) && is_upper(text[i + 1]))
            out.push_back(' ');
    }
    return out;
}

std::string strip_invisible_whitespace(const std::string& text)
{
    return replaceEach(text, {
                                 { "\xC2\xA0", "" },         // no-break space
                                 { "\xE2\x80\x8B", "" },     // zero width space
                                 { "\xE2\x80\x8D", " " },    // zero width joiner
                                 { "\xE2\x80\x82", " " },    // en space
                                 { "\xEF\xBB\xBF", " " },    // byte order mark
                                 { "\xC2\x9D", "" },         // C1 operating system command
                                 { "\xE2\x80\x8E", "" },     // left-to-right mark
                             });
}

std::string collapse_double_spaces(const std::string& text)
{
    if (text.find("  ") == std::string::npos)
        return text;

    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == ' ' && !out.empty() && out.back() == ' ')
            continue;
        out.push_back(c);
    }
    return out;
}

std::string unescape_literal_sequences(const std::string& text)
{
    return replaceEach(text, { { "\\n", "\n" }, { "\\~", "~" }, { "\\-", "-" } });
}

std::string strip_spaces_before_newline(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == '\n')
        {
            while (!out.empty() && out.back() == ' ')
                out.pop_back();
        }
        out.push_back(c);
    }
    return out;
}

std::string expand_horizontal_ellipsis(const std::string& text)
{
    std::string out = text;
    replaceAll(out, "\xE2\x80\xA6", "...");
    return out;
}

std::string strip_leading_dashes(const std::string& text)
{
    std::u32string s = utf8ToUtf32(text);
    std::u32string out;
    out.reserve(s.size());

    auto is_dash = [](char32_t c) { return c == U'-' || c == EM_DASH; };

    // Line starts are taken from the input, so a match that swallows a
    // newline lets the next line be stripped too.
    std::size_t i = 0;
    while (i < s.size())
    {
        if (i == 0 || s[i - 1] == U'\n')
        {
            std::size_t j = i;
            if (isWhitespace(s[j]))
                ++j;
            if (j < s.size() && is_dash(s[j]))
            {
                while (j < s.size() && is_dash(s[j]))
                    ++j;
                while (j < s.size() && isWhitespace(s[j]))
                    ++j;
                i = j;
                continue;
            }
        }
        out.push_back(s[i]);
        ++i;
    }

    if (out.size() == s.size())
        return text;
    return utf32ToUtf8(out);
}

std::string emdash_to_hyphen(const std::string& text)
{
    std::string out = text;
    replaceAll(out, "\xE2\x80\x94", "-");
    return out;
}

DialogueTextNormalizer::DialogueTextNormalizer(EncodingRepairOptions repair_options)
    : repairer_(std::move(repair_options))
{
    rules_ = {
        { "trim_whitespace", trim_whitespace },
        { "collapse_newlines", collapse_newlines },
        { "remove_image_embeds", remove_image_embeds },
        { "space_after_ellipsis", space_after_ellipsis },
        { "collapse_loud_punctuation", collapse_loud_punctuation },
        { "canonicalize_ellipses", canonicalize_ellipses },
        { "tighten_spaced_punctuation", tighten_spaced_punctuation },
        { "space_run_on_sentences", space_run_on_sentences },
        { "strip_invisible_whitespace", strip_invisible_whitespace },
        { "repair_encoding", [this](const std::string& text) { return repairer_.repair(text); } },
        { "collapse_double_spaces", collapse_double_spaces },
        { "unescape_literal_sequences", unescape_literal_sequences },
        { "strip_spaces_before_newline", strip_spaces_before_newline },
        { "expand_horizontal_ellipsis", expand_horizontal_ellipsis },
        { "strip_leading_dashes", strip_leading_dashes },
        { "emdash_to_hyphen", emdash_to_hyphen },
    };
}

std::string DialogueTextNormalizer::normalize(const std::string& text) const
{
    PROFILE_SCOPE_FUNCTION();

    std::string current = text;
    for (const auto& rule : rules_)
    {
        std::string next = rule.apply(current);
        if (Diagnostics::IsVerbose() && next != current)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[TextNormalizer] rule=" << rule.name << " output=" << Diagnostics::Preview(next);
        }
        current = std::move(next);
    }
    return current;
}

} // namespace processing
