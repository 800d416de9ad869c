#pragma once

#include <cstdint>
#include <string>
#include <vector>

// On-disk autosave records.
//
// Each record is two files in the autosave directory:
//   <autosave_id>.txt   buffer contents (UTF-8, verbatim)
//   <autosave_id>.json  sidecar: tab identity, timestamp, content hash, cursor/scroll
// The blob is written first and the sidecar last, so a sidecar always describes a complete
// blob. A blob without a sidecar is debris from an interrupted write.
namespace omnote
{
struct AutosaveRecord
{
    std::uint64_t tab_id = 0;
    std::string   autosave_id;
    std::int64_t  timestamp_ms = 0; // wall clock, ms since epoch; non-decreasing per tab
    std::string   content_hash;     // ContentHashHex() of the blob
    std::string   blob_path;        // absolute, filled in when read
    std::string   file_path;        // the tab's file, empty for untitled buffers
    std::uint64_t cursor_offset = 0;
    std::uint64_t scroll_offset = 0;
};

std::string AutosaveBlobPath(const std::string& dir, const std::string& autosave_id);
std::string AutosaveSidecarPath(const std::string& dir, const std::string& autosave_id);

// Writes blob then sidecar, both atomically. Fills record.blob_path and record.content_hash.
bool WriteAutosaveRecord(const std::string& dir, AutosaveRecord& record, const std::string& content, std::string& err);

bool ReadAutosaveSidecar(const std::string& sidecar_path, AutosaveRecord& out, std::string& err);

// Reads the blob. A hash mismatch is logged but not an error.
bool ReadAutosaveBlob(const AutosaveRecord& record, std::string& out, std::string& err);

// Removes sidecar then blob. Missing files are fine.
bool RemoveAutosaveRecord(const std::string& dir, const std::string& autosave_id, std::string& err);

struct AutosaveScan
{
    std::vector<AutosaveRecord> records;

    // Records that cannot be used: unreadable sidecar, missing blob, blob without sidecar.
    std::vector<std::string> broken_ids;
};

// Lists the autosave directory. A missing directory is an empty scan.
bool ScanAutosaveDir(const std::string& dir, AutosaveScan& out, std::string& err);
} // namespace omnote
