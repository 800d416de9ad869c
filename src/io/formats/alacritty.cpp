#include "io/formats/alacritty.h"

#include "io/formats/config_text.h"

#include <optional>
#include <vector>

namespace omnote::formats::alacritty
{
using theme::AnsiKey;
using theme::ColorKey;
using theme::PartialPalette;
namespace ct = config_text;

namespace
{
static const char* kAnsiNames[8] = {"black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"};

static std::vector<std::string> SplitDotted(std::string_view key)
{
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t i = 0; i <= key.size(); ++i)
    {
        if (i == key.size() || key[i] == '.')
        {
            const std::string_view part = ct::Unquote(key.substr(start, i - start));
            if (!part.empty())
                parts.push_back(ct::Lower(part));
            start = i + 1;
        }
    }
    return parts;
}

static std::string JoinPath(const std::vector<std::string>& parts)
{
    std::string out;
    for (const auto& p : parts)
    {
        if (!out.empty())
            out += '.';
        out += p;
    }
    return out;
}

struct Collector
{
    PartialPalette& out;
    std::optional<theme::Rgb8> sel_text;
    std::optional<theme::Rgb8> sel_foreground;
    bool sel_text_malformed = false;

    void SetColor(ColorKey k, std::string_view value)
    {
        if (auto c = theme::ParseColorValue(value))
            out.Set(k, *c);
        else
            ++out.skipped_values;
    }

    void AddImports(std::string_view value)
    {
        std::vector<std::string> paths = ct::QuotedStrings(value);
        if (paths.empty())
        {
            const std::string_view bare = ct::TrimAscii(value);
            if (!bare.empty() && bare.front() != '[')
                paths.emplace_back(bare);
        }
        for (auto& p : paths)
        {
            if (!p.empty())
                out.imports.push_back(std::move(p));
        }
    }

    // `path` is the full dotted key, lowercase.
    void Assign(const std::string& path, std::string_view value)
    {
        if (path == "import" || path == "general.import")
        {
            AddImports(value);
            return;
        }
        if (path.rfind("colors.", 0) != 0)
            return;
        const std::string key = path.substr(7);

        if (key == "primary.background")
            SetColor(ColorKey::Background, value);
        else if (key == "primary.foreground")
            SetColor(ColorKey::Foreground, value);
        else if (key == "cursor.cursor")
            SetColor(ColorKey::Cursor, value);
        else if (key == "selection.background")
            SetColor(ColorKey::SelectionBackground, value);
        else if (key == "selection.text" || key == "selection.foreground")
        {
            auto c = theme::ParseColorValue(value);
            if (!c)
            {
                // Alacritty also accepts "CellForeground" etc. here; not a palette color.
                ++out.skipped_values;
                return;
            }
            if (key == "selection.text")
                sel_text = c;
            else
                sel_foreground = c;
        }
        else
        {
            for (int bank = 0; bank < 2; ++bank)
            {
                const std::string prefix = bank == 0 ? "normal." : "bright.";
                if (key.rfind(prefix, 0) != 0)
                    continue;
                const std::string name = key.substr(prefix.size());
                for (int i = 0; i < 8; ++i)
                {
                    if (name == kAnsiNames[i])
                    {
                        SetColor(AnsiKey(bank * 8 + i), value);
                        return;
                    }
                }
            }
        }
    }

    void Finish()
    {
        if (sel_text)
            out.Set(ColorKey::SelectionForeground, *sel_text);
        else if (sel_foreground)
            out.Set(ColorKey::SelectionForeground, *sel_foreground);
    }
};

// Locates the first top-level separator outside quotes. Returns npos if none.
static size_t FindOutsideQuotes(std::string_view s, char want)
{
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i)
    {
        const char c = s[i];
        if (quote)
        {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'')
            quote = c;
        else if (c == want)
            return i;
    }
    return std::string_view::npos;
}
} // namespace

bool ParseColors(std::string_view text, PartialPalette& out, std::string& err)
{
    err.clear();
    out = PartialPalette{};
    Collector col{out};

    const std::vector<std::string_view> lines = ct::SplitLines(text);

    // TOML state
    std::vector<std::string> table;

    // YAML state: (indent, key) for every open mapping
    std::vector<std::pair<size_t, std::string>> yaml_stack;

    for (size_t li = 0; li < lines.size(); ++li)
    {
        const std::string_view raw = ct::StripComment(lines[li]);
        const std::string_view line = ct::TrimAscii(raw);
        if (line.empty())
            continue;

        // TOML table header: [colors.primary] / [[hints.enabled]]
        if (line.front() == '[' && line.back() == ']')
        {
            std::string_view inner = line;
            while (!inner.empty() && inner.front() == '[')
                inner.remove_prefix(1);
            while (!inner.empty() && inner.back() == ']')
                inner.remove_suffix(1);
            table = SplitDotted(ct::TrimAscii(inner));
            yaml_stack.clear();
            continue;
        }

        const size_t eq = FindOutsideQuotes(line, '=');
        const size_t colon = FindOutsideQuotes(line, ':');

        if (eq != std::string_view::npos && (colon == std::string_view::npos || eq < colon))
        {
            // TOML assignment (possibly an inline table or a multi-line array).
            std::vector<std::string> path = table;
            for (auto& p : SplitDotted(ct::TrimAscii(line.substr(0, eq))))
                path.push_back(std::move(p));
            std::string value(ct::TrimAscii(line.substr(eq + 1)));

            if (!value.empty() && value.front() == '[' && FindOutsideQuotes(value, ']') == std::string::npos)
            {
                while (li + 1 < lines.size())
                {
                    ++li;
                    const std::string_view more = ct::TrimAscii(ct::StripComment(lines[li]));
                    value += ' ';
                    value += more;
                    if (FindOutsideQuotes(more, ']') != std::string_view::npos)
                        break;
                }
            }

            if (!value.empty() && value.front() == '{')
            {
                // Inline table: primary = { background = "#..", foreground = ".." }
                std::string_view body(value);
                body.remove_prefix(1);
                if (!body.empty() && body.back() == '}')
                    body.remove_suffix(1);
                size_t start = 0;
                while (start < body.size())
                {
                    const size_t comma = FindOutsideQuotes(body.substr(start), ',');
                    const std::string_view item =
                        body.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma);
                    const size_t ieq = FindOutsideQuotes(item, '=');
                    if (ieq != std::string_view::npos)
                    {
                        std::vector<std::string> ipath = path;
                        for (auto& p : SplitDotted(ct::TrimAscii(item.substr(0, ieq))))
                            ipath.push_back(std::move(p));
                        col.Assign(JoinPath(ipath), item.substr(ieq + 1));
                    }
                    if (comma == std::string_view::npos)
                        break;
                    start += comma + 1;
                }
                continue;
            }

            col.Assign(JoinPath(path), value);
            continue;
        }

        // YAML
        const size_t indent = ct::IndentOf(raw);
        while (!yaml_stack.empty() && yaml_stack.back().first >= indent)
        {
            // A list item belongs to the key above it even at the same indent ("import:\n- x").
            if (line.front() == '-' && yaml_stack.back().first == indent)
                break;
            yaml_stack.pop_back();
        }

        if (line.front() == '-')
        {
            std::vector<std::string> path = table;
            for (const auto& e : yaml_stack)
                path.push_back(e.second);
            const std::string joined = JoinPath(path);
            if (joined == "import" || joined == "general.import")
                col.AddImports(ct::TrimAscii(line.substr(1)));
            continue;
        }

        if (colon == std::string_view::npos)
            continue;

        const std::string key = ct::Lower(ct::Unquote(line.substr(0, colon)));
        const std::string_view value = ct::TrimAscii(line.substr(colon + 1));
        if (value.empty())
        {
            yaml_stack.emplace_back(indent, key);
            continue;
        }

        std::vector<std::string> path = table;
        for (const auto& e : yaml_stack)
            path.push_back(e.second);
        path.push_back(key);
        col.Assign(JoinPath(path), value);
    }

    col.Finish();

    if (out.Empty() && out.imports.empty())
    {
        err = "No usable color keys.";
        return false;
    }
    return true;
}
} // namespace omnote::formats::alacritty
