#pragma once
// Pending archives bridge an upload and the later conversation selection.
// The pipeline only sees the abstract store; the in-memory variant is the default.
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "../ingest/conversation.hpp"

namespace chatingest {

struct PendingArchive {
    std::string archive_id;
    std::string zip_path;          // Stored upload, deleted on cleanup
    std::string extracted_path;    // <extract_dir>/<archive_id>
    std::string original_name;
    ArchiveKind kind = ArchiveKind::UNKNOWN;
    std::vector<ConversationUnit> conversations;

    nlohmann::ordered_json to_json() const;
};

class PendingArchiveStore {
public:
    virtual ~PendingArchiveStore() = default;

    // Replaces an existing entry with the same id
    virtual void put(PendingArchive archive) = 0;
    virtual std::optional<PendingArchive> find(const std::string& archive_id) const = 0;

    // True if an entry was removed
    virtual bool erase(const std::string& archive_id) = 0;
    virtual std::vector<std::string> ids() const = 0;
};

class InMemoryPendingArchiveStore : public PendingArchiveStore {
public:
    void put(PendingArchive archive) override;
    std::optional<PendingArchive> find(const std::string& archive_id) const override;
    bool erase(const std::string& archive_id) override;
    std::vector<std::string> ids() const override;

    size_t size() const { return archives_.size(); }

private:
    std::map<std::string, PendingArchive> archives_;
};

} // namespace chatingest
