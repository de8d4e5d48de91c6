#include "Cld2LanguageDetector.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <string>

#include <cld2/public/compact_lang_det.h>
#include <cld2/public/encodings.h>
#include <plog/Log.h>
#include <utf8proc.h>

namespace processing
{

namespace
{

// Controls (other than tab, LF, CR) and noncharacters are valid UTF-8 but
// end CLD2's interchange-valid prefix
bool isInterchangeValid(utf8proc_int32_t cp)
{
    if (cp == '\t' || cp == '\n' || cp == '\r')
        return true;
    if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F))
        return false;
    if (cp >= 0xFDD0 && cp <= 0xFDEF)
        return false;
    return (cp & 0xFFFE) != 0xFFFE;
}

// Copy of text holding only what CLD2 accepts. Throws on undecodable bytes.
std::string interchangeText(std::string_view text, bool& has_letter)
{
    std::string out;
    out.reserve(text.size());
    has_letter = false;

    const auto* bytes = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    utf8proc_ssize_t pos = 0;
    const auto size = static_cast<utf8proc_ssize_t>(text.size());
    while (pos < size)
    {
        utf8proc_int32_t cp = 0;
        utf8proc_ssize_t len = utf8proc_iterate(bytes + pos, size - pos, &cp);
        if (len <= 0)
            throw LanguageDetectionError("invalid UTF-8 at byte " + std::to_string(pos));

        if (isInterchangeValid(cp))
        {
            out.append(text.substr(static_cast<std::size_t>(pos), static_cast<std::size_t>(len)));
            has_letter = has_letter || isLetter(static_cast<char32_t>(cp));
        }
        pos += len;
    }
    return out;
}

} // namespace

std::string Cld2LanguageDetector::detect(std::string_view text) const
{
    bool has_letter = false;
    const std::string clean = interchangeText(text, has_letter);
    if (!has_letter)
        throw LanguageDetectionError("no features in text");

    CLD2::CLDHints cldhints = { nullptr, "", CLD2::UNKNOWN_ENCODING, CLD2::UNKNOWN_LANGUAGE };

    // Dialogue turns are short, so ask for a guess instead of UNKNOWN on little evidence
    int flags = CLD2::kCLDFlagBestEffort;

    CLD2::Language language3[3] = { CLD2::UNKNOWN_LANGUAGE, CLD2::UNKNOWN_LANGUAGE, CLD2::UNKNOWN_LANGUAGE };
    int percent3[3] = {};
    double normalized_score3[3] = {};
    CLD2::ResultChunkVector* resultchunkvector = nullptr;

    int text_bytes = 0;
    bool is_reliable = false;
    int valid_prefix_bytes = 0;

    CLD2::Language language = CLD2::ExtDetectLanguageSummaryCheckUTF8(
        clean.data(), static_cast<int>(clean.size()), true, &cldhints, flags, language3, percent3,
        normalized_score3, resultchunkvector, &text_bytes, &is_reliable, &valid_prefix_bytes);

    if (valid_prefix_bytes < static_cast<int>(clean.size()))
        throw LanguageDetectionError("text rejected by CLD2 at byte " + std::to_string(valid_prefix_bytes));

    if (language == CLD2::UNKNOWN_LANGUAGE)
        throw LanguageDetectionError("language could not be determined");

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[cld2] lang=" << CLD2::LanguageCode(language) << " reliable=" << is_reliable
            << " top=" << CLD2::LanguageCode(language3[0]) << "(" << percent3[0] << "%)";
    }

    return CLD2::LanguageCode(language);
}

} // namespace processing
