#include "pending_archive_store.hpp"
#include "../utils/logger.hpp"

namespace chatingest {

nlohmann::ordered_json PendingArchive::to_json() const {
    nlohmann::ordered_json units = nlohmann::ordered_json::array();
    for (const auto& unit : conversations) units.push_back(unit.to_json());

    return {
        {"archive_id", archive_id},
        {"original_name", original_name},
        {"kind", archive_kind_str(kind)},
        {"extracted_path", extracted_path},
        {"conversations", units}
    };
}

void InMemoryPendingArchiveStore::put(PendingArchive archive) {
    LOG_DBG("[pending] Registering %s (%zu conversations)",
        archive.archive_id.c_str(), archive.conversations.size());
    std::string id = archive.archive_id;
    archives_[id] = std::move(archive);
}

std::optional<PendingArchive> InMemoryPendingArchiveStore::find(const std::string& archive_id) const {
    auto it = archives_.find(archive_id);
    if (it == archives_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryPendingArchiveStore::erase(const std::string& archive_id) {
    return archives_.erase(archive_id) > 0;
}

std::vector<std::string> InMemoryPendingArchiveStore::ids() const {
    std::vector<std::string> out;
    out.reserve(archives_.size());
    for (const auto& [id, archive] : archives_) out.push_back(id);
    return out;
}

} // namespace chatingest
