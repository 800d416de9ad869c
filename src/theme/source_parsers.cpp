#include "theme/source_parsers.h"

#include "core/log.h"
#include "core/paths.h"
#include "io/file_io.h"
#include "io/formats/alacritty.h"
#include "io/formats/foot.h"
#include "io/formats/kitty.h"
#include "theme/theme_spec.h"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace omnote::theme
{
namespace fs = std::filesystem;

namespace
{
// Theme files are small; anything bigger than this is not a terminal config.
static constexpr size_t kSourceReadLimit = 1024 * 1024;

struct EnvColorName
{
    const char* suffix;
    ColorKey key;
};

static std::vector<EnvColorName> EnvColorNames()
{
    std::vector<EnvColorName> names = {
        {"BG", ColorKey::Background},
        {"FG", ColorKey::Foreground},
        {"ACCENT", ColorKey::Accent},
        {"CARET", ColorKey::Cursor},
        {"CURSOR", ColorKey::Cursor}, // after CARET: the canonical name wins
        {"SEL_BG", ColorKey::SelectionBackground},
        {"SEL_FG", ColorKey::SelectionForeground},
    };
    static const char* kAnsi[kAnsiColorCount] = {"COLOR0", "COLOR1", "COLOR2", "COLOR3", "COLOR4", "COLOR5",
                                                 "COLOR6", "COLOR7", "COLOR8", "COLOR9", "COLOR10", "COLOR11",
                                                 "COLOR12", "COLOR13", "COLOR14", "COLOR15"};
    for (int i = 0; i < (int)kAnsiColorCount; ++i)
        names.push_back({kAnsi[i], AnsiKey(i)});
    return names;
}

static std::string ResolveImportPath(const std::string& raw, const std::string& importing_file, const std::string& home_dir)
{
    const std::string expanded = ExpandUser(raw, home_dir);
    fs::path p(expanded);
    if (p.is_relative())
        p = fs::path(importing_file).parent_path() / p;
    return p.lexically_normal().string();
}

static bool LoadRecursive(ParserKind parser,
                          const std::string& path,
                          const std::string& home_dir,
                          int depth,
                          std::vector<std::string>& chain,
                          PartialPalette& out,
                          ErrorKind& kind,
                          std::string& err)
{
    std::string text;
    if (!file_io::ReadFileText(path, text, err, kSourceReadLimit))
    {
        kind = ErrorKind::SourceUnavailable;
        return false;
    }

    PartialPalette own;
    if (!ParseSourceText(parser, text, own, err))
    {
        kind = ErrorKind::SourceMalformed;
        return false;
    }
    if (own.skipped_values > 0)
        OMNOTE_LOG_WARN("theme", "%s: skipped %zu malformed color value(s)", path.c_str(), own.skipped_values);

    PartialPalette merged;
    chain.push_back(path);
    for (const std::string& raw : own.imports)
    {
        const std::string import_path = ResolveImportPath(raw, path, home_dir);
        if (std::find(chain.begin(), chain.end(), import_path) != chain.end())
        {
            OMNOTE_LOG_WARN("theme", "%s: import cycle through %s, skipped", path.c_str(), import_path.c_str());
            continue;
        }
        if (depth + 1 > kMaxImportDepth)
        {
            OMNOTE_LOG_WARN("theme", "%s: import depth limit reached, skipped %s", path.c_str(), import_path.c_str());
            continue;
        }

        PartialPalette imported;
        ErrorKind import_kind = ErrorKind::SourceUnavailable;
        std::string import_err;
        if (!LoadRecursive(parser, import_path, home_dir, depth + 1, chain, imported, import_kind, import_err))
        {
            OMNOTE_LOG_DEBUG("theme",
                             "%s: import %s skipped (%s: %s)",
                             path.c_str(),
                             import_path.c_str(),
                             ErrorKindName(import_kind),
                             import_err.c_str());
            continue;
        }
        merged.OverlayFrom(imported);
        merged.skipped_values += imported.skipped_values;
    }
    chain.pop_back();

    merged.OverlayFrom(own);
    merged.skipped_values += own.skipped_values;
    merged.imports = own.imports;
    out = std::move(merged);
    return true;
}
} // namespace

bool ParseSourceText(ParserKind kind, std::string_view text, PartialPalette& out, std::string& err)
{
    switch (kind)
    {
    case ParserKind::Alacritty: return formats::alacritty::ParseColors(text, out, err);
    case ParserKind::Kitty: return formats::kitty::ParseColors(text, out, err);
    case ParserKind::Foot: return formats::foot::ParseColors(text, out, err);
    case ParserKind::OmarchyThemeDir:
    case ParserKind::Environment:
    case ParserKind::SystemGtk:
        break;
    }
    err = std::string("Not a text source: ") + ParserKindName(kind);
    return false;
}

bool LoadConfigFile(ParserKind parser,
                    const std::string& path,
                    const std::string& home_dir,
                    PartialPalette& out,
                    ErrorKind& kind,
                    std::string& err)
{
    std::vector<std::string> chain;
    return LoadRecursive(parser, path, home_dir, 0, chain, out, kind, err);
}

PartialPalette EnvironmentColors(const Environment& env)
{
    PartialPalette out;
    for (const char* prefix : {"MICROPAD_", "OMNOTE_"})
    {
        for (const EnvColorName& n : EnvColorNames())
        {
            const std::string name = std::string(prefix) + n.suffix;
            const std::string value = EnvOrEmpty(env, name.c_str());
            if (value.empty())
                continue;
            if (auto c = ParseColorValue(value))
                out.Set(n.key, *c);
            else
            {
                ++out.skipped_values;
                OMNOTE_LOG_WARN("theme", "Ignoring %s: not a color (\"%s\")", name.c_str(), value.c_str());
            }
        }
    }
    return out;
}

bool LoadSourcePalette(const SourceDescriptor& desc,
                       const Environment& env,
                       PartialPalette& out,
                       ErrorKind& kind,
                       std::string& err)
{
    err.clear();
    const std::string home_dir = EnvOrEmpty(env, "HOME");

    switch (desc.parser_kind)
    {
    case ParserKind::SystemGtk:
        out = SystemDefaultPalette();
        return true;

    case ParserKind::Environment:
        out = EnvironmentColors(env);
        if (!out.IsUsable())
        {
            kind = ErrorKind::SourceUnavailable;
            err = "No background/foreground in the environment.";
            return false;
        }
        return true;

    case ParserKind::OmarchyThemeDir:
    {
        std::error_code ec;
        if (desc.filesystem_path.empty() || !fs::is_directory(desc.filesystem_path, ec))
        {
            kind = ErrorKind::SourceUnavailable;
            err = "Theme directory not found.";
            return false;
        }
        struct Candidate
        {
            const char* file;
            ParserKind parser;
        };
        static const Candidate kCandidates[] = {
            {"alacritty.toml", ParserKind::Alacritty},
            {"alacritty.yaml", ParserKind::Alacritty},
            {"alacritty.yml", ParserKind::Alacritty},
            {"kitty.conf", ParserKind::Kitty},
            {"foot.ini", ParserKind::Foot},
        };
        kind = ErrorKind::SourceUnavailable;
        err = "No usable terminal config in theme directory.";
        for (const Candidate& c : kCandidates)
        {
            const std::string path = (fs::path(desc.filesystem_path) / c.file).string();
            PartialPalette p;
            ErrorKind file_kind = ErrorKind::SourceUnavailable;
            std::string file_err;
            if (!LoadConfigFile(c.parser, path, home_dir, p, file_kind, file_err))
            {
                if (file_kind == ErrorKind::SourceMalformed)
                {
                    kind = ErrorKind::SourceMalformed;
                    OMNOTE_LOG_WARN("theme", "%s: %s", path.c_str(), file_err.c_str());
                }
                continue;
            }
            if (!p.IsUsable())
            {
                kind = ErrorKind::SourceMalformed;
                OMNOTE_LOG_WARN("theme", "%s: no background/foreground", path.c_str());
                continue;
            }
            out = std::move(p);
            return true;
        }
        return false;
    }

    case ParserKind::Alacritty:
    case ParserKind::Kitty:
    case ParserKind::Foot:
    {
        if (desc.filesystem_path.empty())
        {
            kind = ErrorKind::SourceUnavailable;
            err = "No path.";
            return false;
        }
        PartialPalette p;
        if (!LoadConfigFile(desc.parser_kind, desc.filesystem_path, home_dir, p, kind, err))
            return false;
        if (!p.IsUsable())
        {
            kind = ErrorKind::SourceMalformed;
            err = "No background/foreground.";
            return false;
        }
        out = std::move(p);
        return true;
    }
    }

    kind = ErrorKind::SourceUnavailable;
    err = "Unknown source kind.";
    return false;
}
} // namespace omnote::theme
