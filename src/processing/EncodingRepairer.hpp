#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace processing
{

// Toggles for the encoding-artifact repair pass. The defaults enable every
// sub-fix; dialogueDefaults() is the configuration the dialogue cleaner uses.
struct EncodingRepairOptions
{
    bool unescape_html = true; // skipped on lines containing '<'
    bool remove_terminal_escapes = true;
    bool fix_encoding = true;
    bool restore_byte_a0 = true;
    bool replace_lossy_sequences = true;
    bool fix_c1_controls = true;
    bool fix_latin_ligatures = true;
    bool fix_character_width = true;
    bool uncurl_quotes = true;
    bool fix_line_breaks = true;
    bool fix_surrogates = true;
    bool remove_control_chars = true;
    bool normalize_nfc = true;
    bool explain = true;
    std::size_t max_passes = 8;

    // Ligatures and fullwidth forms are left alone, no explanation is built.
    [[nodiscard]] static EncodingRepairOptions dialogueDefaults();
};

struct RepairReport
{
    std::string text;
    std::vector<std::string> steps; // names of the sub-fixes that changed something, in order
};

class EncodingRepairer
{
public:
    explicit EncodingRepairer(EncodingRepairOptions options = EncodingRepairOptions::dialogueDefaults());

    [[nodiscard]] std::string repair(const std::string& text) const;

    // Same result as repair(); steps are only collected when options().explain is set.
    [[nodiscard]] RepairReport repairAndExplain(const std::string& text) const;

    [[nodiscard]] const EncodingRepairOptions& options() const noexcept { return options_; }

private:
    std::string run(const std::string& text, std::vector<std::string>* steps) const;
    std::u32string fixLine(std::u32string line, std::vector<std::string>* steps) const;

    EncodingRepairOptions options_;
};

// Individual sub-fixes over UTF-32 text.
namespace encoding
{

[[nodiscard]] std::u32string fix_surrogates(const std::u32string& text);
[[nodiscard]] std::u32string fix_line_breaks(const std::u32string& text);
[[nodiscard]] std::u32string unescape_html(const std::u32string& text);
[[nodiscard]] std::u32string remove_terminal_escapes(const std::u32string& text);
[[nodiscard]] std::u32string fix_mojibake(const std::u32string& text, bool restore_byte_a0, bool replace_lossy);
[[nodiscard]] std::u32string fix_c1_controls(const std::u32string& text);
[[nodiscard]] std::u32string fix_latin_ligatures(const std::u32string& text);
[[nodiscard]] std::u32string fix_character_width(const std::u32string& text);
[[nodiscard]] std::u32string uncurl_quotes(const std::u32string& text);
[[nodiscard]] std::u32string remove_control_chars(const std::u32string& text);
[[nodiscard]] std::u32string normalize_nfc(const std::u32string& text);

} // namespace encoding

} // namespace processing
