#include "EncodingRepairer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <utility>

#include <plog/Log.h>
#include <utf8proc.h>

namespace processing
{

namespace
{

// Windows-1252 bytes 0x80..0x9F. The five undefined bytes fall back to
// their Latin-1 C1 control, which is what sloppy decoders produce.
constexpr std::array<char32_t, 32> kCp1252High = {
    0x20ACu, 0x0081u, 0x201Au, 0x0192u, 0x201Eu, 0x2026u, 0x2020u, 0x2021u,
    0x02C6u, 0x2030u, 0x0160u, 0x2039u, 0x0152u, 0x008Du, 0x017Du, 0x008Fu,
    0x0090u, 0x2018u, 0x2019u, 0x201Cu, 0x201Du, 0x2022u, 0x2013u, 0x2014u,
    0x02DCu, 0x2122u, 0x0161u, 0x203Au, 0x0153u, 0x009Du, 0x017Eu, 0x0178u,
};

// Byte a character came from if the text was decoded as Windows-1252 or
// Latin-1; -1 when it cannot be such a character.
int sloppyByte(char32_t cp)
{
    if (cp < 0x100u)
        return static_cast<int>(cp);
    for (std::size_t i = 0; i < kCp1252High.size(); ++i)
    {
        if (kCp1252High[i] == cp)
            return static_cast<int>(0x80u + i);
    }
    return -1;
}

bool isContinuationByte(int byte)
{
    return byte >= 0x80 && byte <= 0xBF;
}

std::size_t sequenceTailLength(int lead)
{
    if (lead < 0xE0)
        return 1;
    if (lead < 0xF0)
        return 2;
    return 3;
}

// Punctuation that legitimately follows an accented capital in real text,
// e.g. "CAFÉ…" or "À»". A lone two-char match ending in one of these is
// left alone unless the surrounding text is clearly mojibake.
bool isStandalonePunctuation(char32_t cp)
{
    switch (static_cast<uint32_t>(cp))
    {
    case 0x2026u: // …
    case 0x2018u: // ‘
    case 0x2019u: // ’
    case 0x201Cu: // “
    case 0x201Du: // ”
    case 0x2013u: // –
    case 0x2014u: // —
    case 0x2022u: // •
    case 0x2122u: // ™
    case 0x00A0u:
    case 0x00A1u: // ¡
    case 0x00ABu: // «
    case 0x00B0u: // °
    case 0x00BBu: // »
    case 0x00BFu: // ¿
        return true;
    default:
        return false;
    }
}

struct Sequence
{
    char32_t codepoint = 0;
    std::size_t length = 0; // characters consumed from the mojibake text
};

// A lead char for byte 0xC2..0xF4 followed by the right number of chars for
// continuation bytes, forming a well-formed UTF-8 sequence.
bool matchSequence(const std::u32string& text, std::size_t pos, Sequence& out)
{
    if (pos >= text.size())
        return false;

    int lead = sloppyByte(text[pos]);
    if (lead < 0xC2 || lead > 0xF4)
        return false;

    std::size_t tail = sequenceTailLength(lead);
    if (pos + tail >= text.size())
        return false;

    std::array<int, 4> bytes{ lead, 0, 0, 0 };
    for (std::size_t k = 1; k <= tail; ++k)
    {
        int b = sloppyByte(text[pos + k]);
        if (!isContinuationByte(b))
            return false;
        bytes[k] = b;
    }

    if ((lead == 0xE0 && bytes[1] < 0xA0) || (lead == 0xED && bytes[1] >= 0xA0) ||
        (lead == 0xF0 && bytes[1] < 0x90) || (lead == 0xF4 && bytes[1] >= 0x90))
        return false;

    uint32_t cp = 0;
    switch (tail)
    {
    case 1:
        cp = ((bytes[0] & 0x1Fu) << 6) | (bytes[1] & 0x3Fu);
        break;
    case 2:
        cp = ((bytes[0] & 0x0Fu) << 12) | ((bytes[1] & 0x3Fu) << 6) | (bytes[2] & 0x3Fu);
        break;
    default:
        cp = ((bytes[0] & 0x07u) << 18) | ((bytes[1] & 0x3Fu) << 12) | ((bytes[2] & 0x3Fu) << 6) |
             (bytes[3] & 0x3Fu);
        break;
    }

    out.codepoint = static_cast<char32_t>(cp);
    out.length = tail + 1;
    return true;
}

bool acceptSequence(const std::u32string& text, std::size_t pos, const Sequence& seq, bool prev_repaired)
{
    if (prev_repaired)
        return true;

    Sequence next;
    const bool run_continues = matchSequence(text, pos + seq.length, next);
    const int lead = sloppyByte(text[pos]);

    if (seq.length >= 3)
    {
        // "â€™", "ï»¿", "ï¿½" and "ðŸ˜€" shapes do not occur in real text
        if (lead == 0xE2 || seq.codepoint == 0xFEFFu || seq.codepoint == REPLACEMENT_CHAR || seq.codepoint >= 0x1F000u)
            return true;
        if (run_continues)
            return true;

        // A lone sequence glued to a word is an accented letter followed by
        // punctuation, as in "touché—”"
        if (pos > 0 && isLetter(text[pos - 1]))
            return false;
        for (std::size_t k = 1; k < seq.length; ++k)
        {
            if (!isStandalonePunctuation(text[pos + k]))
                return true;
        }
        return false;
    }

    if (lead == 0xC2 || lead == 0xC3)
        return true;
    if (!isStandalonePunctuation(text[pos + 1]))
        return true;
    return run_continues;
}

bool containsMojibake(const std::u32string& text)
{
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        Sequence seq;
        if (matchSequence(text, i, seq) && acceptSequence(text, i, seq, false))
            return true;
    }
    return false;
}

// A lead plus some continuations cut short by a lost byte, shown as U+FFFD or SUB.
std::size_t matchLossySequence(const std::u32string& text, std::size_t pos)
{
    int lead = sloppyByte(text[pos]);
    if (lead < 0xC2 || lead > 0xF4)
        return 0;

    std::size_t tail = sequenceTailLength(lead);
    std::size_t k = 0;
    while (k < tail && pos + 1 + k < text.size() && isContinuationByte(sloppyByte(text[pos + 1 + k])))
        ++k;

    if (k == tail || pos + 1 + k >= text.size())
        return 0;

    char32_t terminator = text[pos + 1 + k];
    if (terminator != REPLACEMENT_CHAR && terminator != 0x1Au)
        return 0;

    if (k == 0)
    {
        bool sub_after_two_byte_lead = terminator == 0x1Au && lead <= 0xDF;
        bool fffd_after_common_lead = terminator == REPLACEMENT_CHAR && (lead == 0xC2 || lead == 0xC3);
        if (!sub_after_two_byte_lead && !fffd_after_common_lead)
            return 0;
    }

    return k + 2;
}

bool isLowercaseLetter(char32_t cp)
{
    return utf8proc_category(static_cast<utf8proc_int32_t>(cp)) == UTF8PROC_CATEGORY_LL;
}

// "Ã " or "Â " whose space stands for a lost 0xA0 continuation. Only taken
// right after a repaired sequence or at the end of a lowercase word
// ("voilÃ "), where a capital Ã cannot be real.
bool isLostByteA0(const std::u32string& text, std::size_t pos, bool prev_repaired)
{
    if ((text[pos] != 0x00C2u && text[pos] != 0x00C3u) || pos + 1 >= text.size() || text[pos + 1] != U' ')
        return false;
    return prev_repaired || (pos > 0 && isLowercaseLetter(text[pos - 1]));
}

struct NamedEntity
{
    std::u32string_view name;
    char32_t codepoint;
};

constexpr std::array<NamedEntity, 33> kHtmlEntities = { {
    { U"amp", U'&' },       { U"lt", U'<' },        { U"gt", U'>' },        { U"quot", U'"' },
    { U"apos", U'\'' },     { U"nbsp", 0x00A0u },   { U"hellip", 0x2026u }, { U"mdash", 0x2014u },
    { U"ndash", 0x2013u },  { U"lsquo", 0x2018u },  { U"rsquo", 0x2019u },  { U"ldquo", 0x201Cu },
    { U"rdquo", 0x201Du },  { U"bull", 0x2022u },   { U"copy", 0x00A9u },   { U"reg", 0x00AEu },
    { U"trade", 0x2122u },  { U"deg", 0x00B0u },    { U"laquo", 0x00ABu },  { U"raquo", 0x00BBu },
    { U"eacute", 0x00E9u }, { U"egrave", 0x00E8u }, { U"agrave", 0x00E0u }, { U"aacute", 0x00E1u },
    { U"ccedil", 0x00E7u }, { U"ntilde", 0x00F1u }, { U"uuml", 0x00FCu },   { U"ouml", 0x00F6u },
    { U"auml", 0x00E4u },   { U"szlig", 0x00DFu },  { U"iexcl", 0x00A1u },  { U"iquest", 0x00BFu },
    { U"euro", 0x20ACu },
} };

bool decodeEntity(std::u32string_view body, char32_t& out)
{
    if (body.empty())
        return false;

    if (body[0] == U'#')
    {
        bool hex = body.size() > 1 && (body[1] == U'x' || body[1] == U'X');
        std::size_t start = hex ? 2 : 1;
        if (start >= body.size())
            return false;

        uint32_t value = 0;
        for (std::size_t i = start; i < body.size(); ++i)
        {
            char32_t c = body[i];
            uint32_t digit = 0;
            if (c >= U'0' && c <= U'9')
                digit = c - U'0';
            else if (hex && c >= U'a' && c <= U'f')
                digit = c - U'a' + 10;
            else if (hex && c >= U'A' && c <= U'F')
                digit = c - U'A' + 10;
            else
                return false;
            value = value * (hex ? 16u : 10u) + digit;
            if (value > 0x10FFFFu)
                return false;
        }
        if (value == 0 || (value >= 0xD800u && value <= 0xDFFFu))
            return false;
        out = static_cast<char32_t>(value);
        return true;
    }

    for (const auto& entity : kHtmlEntities)
    {
        if (entity.name == body)
        {
            out = entity.codepoint;
            return true;
        }
    }
    return false;
}

struct Ligature
{
    char32_t codepoint;
    std::u32string_view expansion;
};

constexpr std::array<Ligature, 21> kLigatures = { {
    { 0xFB00u, U"ff" }, { 0xFB01u, U"fi" }, { 0xFB02u, U"fl" }, { 0xFB03u, U"ffi" }, { 0xFB04u, U"ffl" },
    { 0xFB05u, U"st" }, { 0xFB06u, U"st" }, { 0x0132u, U"IJ" }, { 0x0133u, U"ij" },  { 0x0149u, U"ʼn" },
    { 0x01C4u, U"DŽ" }, { 0x01C5u, U"Dž" }, { 0x01C6u, U"dž" }, { 0x01C7u, U"LJ" },
    { 0x01C8u, U"Lj" }, { 0x01C9u, U"lj" }, { 0x01CAu, U"NJ" }, { 0x01CBu, U"Nj" }, { 0x01CCu, U"nj" },
    { 0x01F1u, U"DZ" }, { 0x01F3u, U"dz" },
} };

std::string nfcOrEmpty(const std::string& utf8, bool compat)
{
    const auto* input = reinterpret_cast<const utf8proc_uint8_t*>(utf8.c_str());
    utf8proc_uint8_t* normalized = compat ? utf8proc_NFKC(input) : utf8proc_NFC(input);
    if (!normalized)
        return std::string();

    std::string result(reinterpret_cast<char*>(normalized));
    std::free(normalized);
    return result;
}

} // namespace

namespace encoding
{

std::u32string fix_surrogates(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        char32_t cp = text[i];
        if (cp >= 0xD800u && cp <= 0xDBFFu)
        {
            if (i + 1 < text.size() && text[i + 1] >= 0xDC00u && text[i + 1] <= 0xDFFFu)
            {
                out.push_back(0x10000u + ((cp - 0xD800u) << 10) + (text[i + 1] - 0xDC00u));
                ++i;
            }
            else
            {
                out.push_back(REPLACEMENT_CHAR);
            }
        }
        else if (cp >= 0xDC00u && cp <= 0xDFFFu)
        {
            out.push_back(REPLACEMENT_CHAR);
        }
        else
        {
            out.push_back(cp);
        }
    }
    return out;
}

std::u32string fix_line_breaks(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        char32_t c = text[i];
        if (c == U'\r')
        {
            // a "\r\n" pair collapses to one '\n'
            if (i + 1 < text.size() && text[i + 1] == U'\n')
                ++i;
            out.push_back(U'\n');
        }
        else if (c == 0x0085u || c == 0x2028u || c == 0x2029u)
        {
            out.push_back(U'\n');
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

std::u32string unescape_html(const std::u32string& text)
{
    constexpr std::size_t kMaxEntityLength = 24;

    std::u32string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == U'&')
        {
            std::size_t end = i + 1;
            while (end < text.size() && end - i - 1 < kMaxEntityLength &&
                   (text[end] == U'#' || (text[end] < 0x80u && isWordChar(text[end]) && text[end] != U'_')))
                ++end;

            char32_t decoded = 0;
            if (end < text.size() && text[end] == U';' &&
                decodeEntity(std::u32string_view(text).substr(i + 1, end - i - 1), decoded))
            {
                out.push_back(decoded);
                i = end + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::u32string remove_terminal_escapes(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == 0x1Bu && i + 1 < text.size() && text[i + 1] == U'[')
        {
            std::size_t j = i + 2;
            while (j < text.size() && ((text[j] >= U'0' && text[j] <= U'9') || text[j] == U';'))
                ++j;
            if (j < text.size() && ((text[j] >= U'a' && text[j] <= U'z') || (text[j] >= U'A' && text[j] <= U'Z')))
            {
                i = j + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::u32string fix_mojibake(const std::u32string& text, bool restore_byte_a0, bool replace_lossy)
{
    if (text.empty())
        return text;

    const bool restore_a0 = restore_byte_a0 && containsMojibake(text);

    std::u32string out;
    out.reserve(text.size());

    bool prev_repaired = false;
    std::size_t i = 0;
    while (i < text.size())
    {
        if (restore_a0 && isLostByteA0(text, i, prev_repaired))
        {
            out.push_back(static_cast<char32_t>(((sloppyByte(text[i]) & 0x1Fu) << 6) | (0xA0u & 0x3Fu)));
            i += 2;
            prev_repaired = true;
            continue;
        }

        Sequence seq;
        if (matchSequence(text, i, seq) && acceptSequence(text, i, seq, prev_repaired))
        {
            out.push_back(seq.codepoint);
            i += seq.length;
            prev_repaired = true;
            continue;
        }

        if (replace_lossy)
        {
            std::size_t lossy = matchLossySequence(text, i);
            if (lossy > 0)
            {
                out.push_back(REPLACEMENT_CHAR);
                i += lossy;
                prev_repaired = true;
                continue;
            }
        }

        out.push_back(text[i]);
        ++i;
        prev_repaired = false;
    }
    return out;
}

std::u32string fix_c1_controls(const std::u32string& text)
{
    std::u32string out(text);
    for (auto& cp : out)
    {
        if (cp >= 0x80u && cp <= 0x9Fu)
            cp = kCp1252High[cp - 0x80u];
    }
    return out;
}

std::u32string fix_latin_ligatures(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text)
    {
        auto it = std::find_if(kLigatures.begin(), kLigatures.end(),
                               [cp](const Ligature& lig) { return lig.codepoint == cp; });
        if (it != kLigatures.end())
            out.append(it->expansion);
        else
            out.push_back(cp);
    }
    return out;
}

std::u32string fix_character_width(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text)
    {
        if (cp >= 0xFF01u && cp <= 0xFF5Eu)
        {
            out.push_back(cp - 0xFEE0u);
        }
        else if (cp == 0x3000u)
        {
            out.push_back(U' ');
        }
        else if ((cp >= 0xFF5Fu && cp <= 0xFFDCu) || (cp >= 0xFFE0u && cp <= 0xFFEEu))
        {
            std::string folded = nfcOrEmpty(utf32ToUtf8(std::u32string(1, cp)), true);
            if (folded.empty())
                out.push_back(cp);
            else
                out.append(utf8ToUtf32(folded));
        }
        else
        {
            out.push_back(cp);
        }
    }
    return out;
}

std::u32string uncurl_quotes(const std::u32string& text)
{
    std::u32string out(text);
    for (auto& cp : out)
    {
        if ((cp >= 0x2018u && cp <= 0x201Bu) || cp == 0x02BCu)
            cp = U'\'';
        else if (cp >= 0x201Cu && cp <= 0x201Fu)
            cp = U'"';
    }
    return out;
}

std::u32string remove_control_chars(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text)
    {
        bool control = cp <= 0x08u || cp == 0x0Bu || (cp >= 0x0Eu && cp <= 0x1Fu) || cp == 0x7Fu ||
                       (cp >= 0x206Au && cp <= 0x206Fu) || cp == 0xFEFFu || (cp >= 0xFFF9u && cp <= 0xFFFCu) ||
                       (cp >= 0x1D173u && cp <= 0x1D17Au) || (cp >= 0xE0000u && cp <= 0xE007Fu);
        if (!control)
            out.push_back(cp);
    }
    return out;
}

std::u32string normalize_nfc(const std::u32string& text)
{
    if (text.empty())
        return text;

    std::string normalized = nfcOrEmpty(utf32ToUtf8(text), false);
    if (normalized.empty())
    {
        PLOG_WARNING << "NFC normalization failed, keeping text unnormalized";
        return text;
    }
    return utf8ToUtf32(normalized);
}

} // namespace encoding

EncodingRepairOptions EncodingRepairOptions::dialogueDefaults()
{
    EncodingRepairOptions options;
    options.fix_latin_ligatures = false;
    options.fix_character_width = false;
    options.explain = false;
    return options;
}

EncodingRepairer::EncodingRepairer(EncodingRepairOptions options)
    : options_(std::move(options))
{
}

std::string EncodingRepairer::repair(const std::string& text) const
{
    return run(text, nullptr);
}

RepairReport EncodingRepairer::repairAndExplain(const std::string& text) const
{
    RepairReport report;
    report.text = run(text, options_.explain ? &report.steps : nullptr);
    return report;
}

std::string EncodingRepairer::run(const std::string& text, std::vector<std::string>* steps) const
{
    if (text.empty())
        return text;

    auto record = [steps](const char* name)
    {
        if (steps && std::find(steps->begin(), steps->end(), name) == steps->end())
            steps->emplace_back(name);
    };

    std::u32string decoded = utf8ToUtf32(text);

    if (options_.fix_surrogates)
    {
        std::u32string fixed = encoding::fix_surrogates(decoded);
        if (fixed != decoded)
        {
            record("fix_surrogates");
            decoded = std::move(fixed);
        }
    }

    if (options_.fix_line_breaks)
    {
        std::u32string fixed = encoding::fix_line_breaks(decoded);
        if (fixed != decoded)
        {
            record("fix_line_breaks");
            decoded = std::move(fixed);
        }
    }

    std::u32string result;
    result.reserve(decoded.size());

    std::size_t start = 0;
    while (start <= decoded.size())
    {
        std::size_t newline = decoded.find(U'\n', start);
        std::size_t end = newline == std::u32string::npos ? decoded.size() : newline;

        result.append(fixLine(decoded.substr(start, end - start), steps));
        if (newline == std::u32string::npos)
            break;
        result.push_back(U'\n');
        start = newline + 1;
    }

    return utf32ToUtf8(result);
}

std::u32string EncodingRepairer::fixLine(std::u32string line, std::vector<std::string>* steps) const
{
    auto apply = [&line, steps](bool enabled, const char* name, auto&& fix)
    {
        if (!enabled)
            return;
        std::u32string fixed = fix(line);
        if (fixed == line)
            return;
        if (steps && std::find(steps->begin(), steps->end(), name) == steps->end())
            steps->emplace_back(name);
        line = std::move(fixed);
    };

    for (std::size_t pass = 0; pass < options_.max_passes; ++pass)
    {
        const std::u32string before = line;

        apply(options_.unescape_html && line.find(U'<') == std::u32string::npos, "unescape_html",
              encoding::unescape_html);
        apply(options_.remove_terminal_escapes, "remove_terminal_escapes", encoding::remove_terminal_escapes);
        apply(options_.fix_encoding, "fix_encoding",
              [this](const std::u32string& s)
              {
                  return encoding::fix_mojibake(s, options_.restore_byte_a0, options_.replace_lossy_sequences);
              });
        apply(options_.fix_c1_controls, "fix_c1_controls", encoding::fix_c1_controls);
        apply(options_.fix_latin_ligatures, "fix_latin_ligatures", encoding::fix_latin_ligatures);
        apply(options_.fix_character_width, "fix_character_width", encoding::fix_character_width);
        apply(options_.uncurl_quotes, "uncurl_quotes", encoding::uncurl_quotes);
        apply(options_.remove_control_chars, "remove_control_chars", encoding::remove_control_chars);
        apply(options_.normalize_nfc, "normalize_nfc", encoding::normalize_nfc);

        if (line == before)
            break;
    }

    return line;
}

} // namespace processing
