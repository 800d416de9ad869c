#include "io/session/autosave_record.h"

#include "core/content_hash.h"
#include "core/log.h"
#include "io/file_io.h"
#include "io/session/path_json.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace omnote
{
static constexpr int kAutosaveSidecarVersion = 1;

std::string AutosaveBlobPath(const std::string& dir, const std::string& autosave_id)
{
    return (fs::path(dir) / (autosave_id + ".txt")).string();
}

std::string AutosaveSidecarPath(const std::string& dir, const std::string& autosave_id)
{
    return (fs::path(dir) / (autosave_id + ".json")).string();
}

bool WriteAutosaveRecord(const std::string& dir, AutosaveRecord& record, const std::string& content, std::string& err)
{
    err.clear();
    if (record.autosave_id.empty())
    {
        err = "Autosave record has no id.";
        return false;
    }

    record.blob_path = AutosaveBlobPath(dir, record.autosave_id);
    record.content_hash = ContentHashHex(content);

    if (!file_io::WriteFileAtomic(record.blob_path, content, err))
        return false;

    json j;
    j["version"] = kAutosaveSidecarVersion;
    j["tab_id"] = record.tab_id;
    j["autosave_id"] = record.autosave_id;
    j["timestamp_ms"] = record.timestamp_ms;
    j["content_hash"] = record.content_hash;
    j["blob"] = fs::path(record.blob_path).filename().string();
    path_json::WritePath(j, "file_path", record.file_path);
    j["cursor_offset"] = record.cursor_offset;
    j["scroll_offset"] = record.scroll_offset;

    std::string text;
    try
    {
        text = j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to serialize autosave sidecar: ") + e.what();
        return false;
    }
    return file_io::WriteFileAtomic(AutosaveSidecarPath(dir, record.autosave_id), text, err);
}

bool ReadAutosaveSidecar(const std::string& sidecar_path, AutosaveRecord& out, std::string& err)
{
    std::string text;
    if (!file_io::ReadFileText(sidecar_path, text, err, 1024 * 1024))
        return false;

    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse autosave sidecar: ") + e.what();
        return false;
    }

    if (!j.is_object() ||
        !(j.contains("tab_id") && j["tab_id"].is_number_unsigned()) ||
        !(j.contains("autosave_id") && j["autosave_id"].is_string()) ||
        !(j.contains("timestamp_ms") && j["timestamp_ms"].is_number_integer()) ||
        !(j.contains("content_hash") && j["content_hash"].is_string()) ||
        !(j.contains("blob") && j["blob"].is_string()))
    {
        err = "Autosave sidecar is missing required fields.";
        return false;
    }

    AutosaveRecord r;
    r.tab_id = j["tab_id"].get<std::uint64_t>();
    if (r.tab_id == 0 || r.tab_id == std::numeric_limits<std::uint64_t>::max())
    {
        err = "Autosave sidecar tab_id is out of range.";
        return false;
    }
    r.autosave_id = j["autosave_id"].get<std::string>();
    r.timestamp_ms = j["timestamp_ms"].get<std::int64_t>();
    r.content_hash = j["content_hash"].get<std::string>();

    // The blob always sits next to its sidecar; never follow a path out of the directory.
    const std::string blob_name = fs::path(j["blob"].get<std::string>()).filename().string();
    if (blob_name.empty())
    {
        err = "Autosave sidecar has an empty blob name.";
        return false;
    }
    r.blob_path = (fs::path(sidecar_path).parent_path() / blob_name).string();

    std::string path_err;
    if (!path_json::ReadPath(j, "file_path", r.file_path, path_err))
        OMNOTE_LOG_WARN("autosave", "%s: %s", sidecar_path.c_str(), path_err.c_str());
    if (j.contains("cursor_offset") && j["cursor_offset"].is_number_unsigned())
        r.cursor_offset = j["cursor_offset"].get<std::uint64_t>();
    if (j.contains("scroll_offset") && j["scroll_offset"].is_number_unsigned())
        r.scroll_offset = j["scroll_offset"].get<std::uint64_t>();

    out = std::move(r);
    return true;
}

bool ReadAutosaveBlob(const AutosaveRecord& record, std::string& out, std::string& err)
{
    std::string text;
    if (!file_io::ReadFileText(record.blob_path, text, err))
        return false;
    // The blob is replaced before its sidecar; a crash in between leaves a newer (complete)
    // blob behind an older sidecar. Keep the newer text.
    if (ContentHashHex(text) != record.content_hash)
        OMNOTE_LOG_WARN("autosave", "%s is newer than its sidecar; using the blob", record.blob_path.c_str());
    out = std::move(text);
    return true;
}

bool RemoveAutosaveRecord(const std::string& dir, const std::string& autosave_id, std::string& err)
{
    if (!file_io::RemoveFile(AutosaveSidecarPath(dir, autosave_id), err))
        return false;
    return file_io::RemoveFile(AutosaveBlobPath(dir, autosave_id), err);
}

bool ScanAutosaveDir(const std::string& dir, AutosaveScan& out, std::string& err)
{
    err.clear();
    out = AutosaveScan{};

    std::error_code ec;
    if (!fs::exists(dir, ec))
        return true;

    std::vector<std::string> sidecars;
    std::vector<std::string> blobs;
    for (fs::directory_iterator it(dir, ec), end; it != end; it.increment(ec))
    {
        if (ec)
            break;
        std::error_code fec;
        if (!it->is_regular_file(fec))
            continue;
        const fs::path& p = it->path();
        const std::string ext = p.extension().string();
        if (ext == ".json")
            sidecars.push_back(p.stem().string());
        else if (ext == ".txt")
            blobs.push_back(p.stem().string());
    }
    if (ec)
    {
        err = "Failed to list autosave directory " + dir + ": " + ec.message();
        return false;
    }
    std::sort(sidecars.begin(), sidecars.end());
    std::sort(blobs.begin(), blobs.end());

    for (const auto& id : sidecars)
    {
        AutosaveRecord r;
        std::string rerr;
        if (!ReadAutosaveSidecar(AutosaveSidecarPath(dir, id), r, rerr) || r.autosave_id != id ||
            !fs::exists(r.blob_path, ec))
        {
            out.broken_ids.push_back(id);
            continue;
        }
        out.records.push_back(std::move(r));
    }
    for (const auto& id : blobs)
    {
        if (!std::binary_search(sidecars.begin(), sidecars.end(), id))
            out.broken_ids.push_back(id);
    }
    return true;
}
} // namespace omnote
