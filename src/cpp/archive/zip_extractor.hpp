#pragma once
// Thin libzip wrapper: list entries, unpack into a directory, sniff export layout
#include <cstddef>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../ingest/conversation.hpp"

namespace chatingest {

struct ExtractResult {
    std::string extracted_dir;
    size_t files_written = 0;
    size_t entries_skipped = 0;   // Unsafe paths or unreadable entries
    std::string error;            // Empty on success

    [[nodiscard]] bool ok() const { return error.empty(); }
};

class ZipExtractor {
public:
    static ReadResult<std::vector<std::string>> list_entries(const std::string& zip_path);

    // Unpacks every entry below dest_dir (which must exist). Entries whose
    // normalized path is absolute or climbs out with ".." are skipped.
    static ExtractResult extract_all(const std::string& zip_path, const std::string& dest_dir);

    // Discord if any entry contains "messages/index.json", else Instagram if
    // any contains "inbox/" (both case-insensitive), else UNKNOWN
    static ArchiveKind detect_kind(const std::string& zip_path);
    static ArchiveKind detect_kind(const std::vector<std::string>& entry_names);

    static bool is_safe_entry_path(const std::string& entry_name);
};

} // namespace chatingest
