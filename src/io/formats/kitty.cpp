#include "io/formats/kitty.h"

#include "io/formats/config_text.h"

#include <cctype>

namespace omnote::formats::kitty
{
using theme::ColorKey;
namespace ct = config_text;

bool ParseColors(std::string_view text, theme::PartialPalette& out, std::string& err)
{
    err.clear();
    out = theme::PartialPalette{};

    for (std::string_view line : ct::SplitLines(text))
    {
        line = ct::TrimAscii(line);
        // kitty only has whole-line comments; '#' later on the line is a color.
        if (line.empty() || line.front() == '#')
            continue;

        size_t sp = 0;
        while (sp < line.size() && !std::isspace((unsigned char)line[sp]))
            ++sp;
        const std::string key = ct::Lower(line.substr(0, sp));
        const std::string_view value = ct::TrimAscii(line.substr(sp));

        if (key == "include" || key == "globinclude")
        {
            if (!value.empty())
                out.imports.emplace_back(ct::Unquote(value));
            continue;
        }

        std::optional<ColorKey> ck;
        if (key == "active_border_color")
            ck = ColorKey::Accent;
        else if (key == "selection_background")
            ck = ColorKey::SelectionBackground;
        else if (key == "selection_foreground")
            ck = ColorKey::SelectionForeground;
        else if (key == "background" || key == "foreground" || key == "cursor" || key.rfind("color", 0) == 0)
            ck = theme::ColorKeyFromName(key);
        if (!ck)
            continue;

        // Drop a trailing inline comment after whitespace ("#fff  # note").
        std::string_view v = value;
        const size_t hash_comment = v.find(" #");
        if (hash_comment != std::string_view::npos)
            v = ct::TrimAscii(v.substr(0, hash_comment));

        if (auto c = theme::ParseColorValue(v))
            out.Set(*ck, *c);
        else
            ++out.skipped_values; // e.g. "none"
    }

    if (out.Empty() && out.imports.empty())
    {
        err = "No usable color keys.";
        return false;
    }
    return true;
}
} // namespace omnote::formats::kitty
