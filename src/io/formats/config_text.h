#pragma once

#include <string>
#include <string_view>
#include <vector>

// Small text helpers shared by the terminal config readers (alacritty/kitty/foot).
namespace omnote::formats::config_text
{
std::string_view TrimAscii(std::string_view s);

std::string Lower(std::string_view s);

// Splits on \n, \r\n and \r. Keeps empty lines so line numbers stay meaningful.
std::vector<std::string_view> SplitLines(std::string_view text);

// Removes a trailing "# comment": a '#' outside quotes that starts the line or follows
// whitespace. "#1e1e1e" inside quotes, or glued to a value (`key=#fff`), is kept.
std::string_view StripComment(std::string_view line);

// Strips one level of matching single/double quotes.
std::string_view Unquote(std::string_view s);

// Collects every quoted string in `s` ("a", 'b'). Used for TOML/YAML path arrays.
std::vector<std::string> QuotedStrings(std::string_view s);

// Number of leading spaces (tabs count as one).
size_t IndentOf(std::string_view line);
} // namespace omnote::formats::config_text
