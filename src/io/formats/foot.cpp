#include "io/formats/foot.h"

#include "io/formats/config_text.h"

#include <cctype>

namespace omnote::formats::foot
{
using theme::AnsiKey;
using theme::ColorKey;
namespace ct = config_text;

namespace
{
// "<text> <cursor>": the cursor color is the last token.
static std::string_view CursorToken(std::string_view value)
{
    value = ct::TrimAscii(value);
    size_t sp = value.size();
    while (sp > 0 && !std::isspace((unsigned char)value[sp - 1]))
        --sp;
    return value.substr(sp);
}

static int TrailingDigit(std::string_view key, std::string_view prefix)
{
    if (key.size() != prefix.size() + 1 || key.substr(0, prefix.size()) != prefix)
        return -1;
    const char d = key.back();
    if (d < '0' || d > '7')
        return -1;
    return d - '0';
}
} // namespace

bool ParseColors(std::string_view text, theme::PartialPalette& out, std::string& err)
{
    err.clear();
    out = theme::PartialPalette{};

    std::string section; // "" = main section

    for (std::string_view line : ct::SplitLines(text))
    {
        line = ct::TrimAscii(line);
        if (line.empty() || line.front() == '#' || line.front() == ';')
            continue;

        if (line.front() == '[' && line.back() == ']')
        {
            section = ct::Lower(ct::TrimAscii(line.substr(1, line.size() - 2)));
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string_view::npos)
            continue;
        const std::string key = ct::Lower(ct::TrimAscii(line.substr(0, eq)));
        std::string_view value = ct::TrimAscii(line.substr(eq + 1));
        const size_t hash_comment = value.find(" #");
        if (hash_comment != std::string_view::npos)
            value = ct::TrimAscii(value.substr(0, hash_comment));

        auto set = [&](ColorKey k, std::string_view v) {
            if (auto c = theme::ParseColorValue(v))
                out.Set(k, *c);
            else
                ++out.skipped_values;
        };

        if (section.empty() || section == "main")
        {
            if (key == "include" && !value.empty())
                out.imports.emplace_back(ct::Unquote(value));
            continue;
        }

        if (section == "cursor")
        {
            if (key == "color")
                set(ColorKey::Cursor, CursorToken(value));
            continue;
        }

        if (section != "colors" && section != "colors-dark")
            continue;

        if (key == "background")
            set(ColorKey::Background, value);
        else if (key == "foreground")
            set(ColorKey::Foreground, value);
        else if (key == "selection-background")
            set(ColorKey::SelectionBackground, value);
        else if (key == "selection-foreground")
            set(ColorKey::SelectionForeground, value);
        else if (key == "cursor")
            set(ColorKey::Cursor, CursorToken(value));
        else if (int i = TrailingDigit(key, "regular"); i >= 0)
            set(AnsiKey(i), value);
        else if (int j = TrailingDigit(key, "bright"); j >= 0)
            set(AnsiKey(8 + j), value);
    }

    if (out.Empty() && out.imports.empty())
    {
        err = "No usable color keys.";
        return false;
    }
    return true;
}
} // namespace omnote::formats::foot
