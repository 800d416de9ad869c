#include "io/formats/config_text.h"

#include <cctype>

namespace omnote::formats::config_text
{
std::string_view TrimAscii(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

std::string Lower(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = (char)std::tolower((unsigned char)c);
    return out;
}

std::vector<std::string_view> SplitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    size_t i = 0;
    const size_t len = text.size();
    while (i < len)
    {
        const size_t start = i;
        while (i < len && text[i] != '\n' && text[i] != '\r')
            ++i;
        lines.push_back(text.substr(start, i - start));
        if (i < len && text[i] == '\r')
            ++i;
        if (i < len && text[i] == '\n')
            ++i;
    }
    return lines;
}

std::string_view StripComment(std::string_view line)
{
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (quote)
        {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'')
        {
            quote = c;
            continue;
        }
        if (c == '#' && (i == 0 || std::isspace((unsigned char)line[i - 1])))
        {
            // "key: #1e1e1e" would be a YAML comment too; only a color-looking token directly
            // after a separator is kept so sloppy unquoted YAML still works.
            const std::string_view rest = line.substr(i + 1);
            size_t n = 0;
            while (n < rest.size() && std::isxdigit((unsigned char)rest[n]))
                ++n;
            const bool looks_like_color = (n == 6 || n == 8) && (n == rest.size() || std::isspace((unsigned char)rest[n]));
            size_t j = i;
            while (j > 0 && std::isspace((unsigned char)line[j - 1]))
                --j;
            const bool after_separator = j > 0 && (line[j - 1] == ':' || line[j - 1] == '=');
            if (looks_like_color && after_separator)
                continue;
            return line.substr(0, i);
        }
    }
    return line;
}

std::string_view Unquote(std::string_view s)
{
    s = TrimAscii(s);
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
        return s.substr(1, s.size() - 2);
    return s;
}

std::vector<std::string> QuotedStrings(std::string_view s)
{
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size())
    {
        const char q = s[i];
        if (q != '"' && q != '\'')
        {
            ++i;
            continue;
        }
        const size_t end = s.find(q, i + 1);
        if (end == std::string_view::npos)
            break;
        out.emplace_back(s.substr(i + 1, end - i - 1));
        i = end + 1;
    }
    return out;
}

size_t IndentOf(std::string_view line)
{
    size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t'))
        ++n;
    return n;
}
} // namespace omnote::formats::config_text
