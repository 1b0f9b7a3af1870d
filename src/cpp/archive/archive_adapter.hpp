#pragma once
// Abstract interface for export-archive adapters
// Each adapter knows one vendor layout: where conversations live inside the
// unpacked archive, how to preview them and how to merge one into the
// canonical schema. Extraction and cleanup are shared.
//
// Extraction directories are <extract_root>/<archive_id>. Re-extracting an
// id wipes the previous directory first, so ids must be unique per upload:
// two concurrent uploads sharing an id race on the same directory.
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../ingest/conversation.hpp"
#include "zip_extractor.hpp"

namespace chatingest {

class ArchiveAdapter {
public:
    explicit ArchiveAdapter(std::string extract_root) : extract_root_(std::move(extract_root)) {}
    virtual ~ArchiveAdapter() = default;

    // Idempotent: any earlier directory for archive_id is removed, then the
    // archive is unpacked fresh
    ExtractResult extract(const std::string& zip_path, const std::string& archive_id) const;

    // Removes the extraction directory; no-op when already gone
    void cleanup(const std::string& archive_id) const;

    [[nodiscard]] std::string extraction_dir(const std::string& archive_id) const;
    [[nodiscard]] const std::string& extract_root() const { return extract_root_; }

    // Conversation candidates, sorted by descending message count.
    // A missing conversation subtree yields an empty list.
    [[nodiscard]] virtual std::vector<ConversationUnit> enumerate(
        const std::string& extracted_dir) const = 0;

    // One chronologically reassembled record, nullopt if the unit has no readable data
    [[nodiscard]] virtual std::optional<Conversation> merge(const ConversationUnit& unit) const = 0;

    [[nodiscard]] virtual ArchiveKind kind() const = 0;
    [[nodiscard]] virtual const char* name() const = 0;

    // Format tag recorded for records this adapter produces
    [[nodiscard]] virtual DetectedFormat merged_format() const = 0;

    // Archive ids become directory names; reject anything that could escape extract_root
    static bool is_valid_archive_id(const std::string& archive_id);

protected:
    std::string extract_root_;
};

// Export layout of a zip upload from its entry names; UNKNOWN when unreadable
ArchiveKind detect_archive_kind(const std::string& zip_path);

// Factory; nullptr for ArchiveKind::UNKNOWN
std::unique_ptr<ArchiveAdapter> make_archive_adapter(ArchiveKind kind, const std::string& extract_root);

} // namespace chatingest
