#include "instagram_archive_adapter.hpp"
#include "../ingest/chat_parser.hpp"
#include "../utils/logger.hpp"
#include "../utils/utf8.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <system_error>
#include <tuple>

namespace chatingest {
namespace fs = std::filesystem;

// ============================================================================
// Locating the inbox
// ============================================================================

std::optional<fs::path> InstagramArchiveAdapter::find_inbox(const fs::path& root) {
    std::error_code ec;
    std::vector<fs::path> candidates = {
        root / "your_instagram_activity" / "messages" / "inbox",
        root / "messages" / "inbox",
    };

    // Exports are sometimes wrapped in a single root folder
    std::vector<fs::path> wrappers;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) wrappers.push_back(it->path());
    }
    std::sort(wrappers.begin(), wrappers.end());
    for (const auto& w : wrappers) {
        candidates.push_back(w / "your_instagram_activity" / "messages" / "inbox");
        candidates.push_back(w / "messages" / "inbox");
    }

    for (const auto& c : candidates) {
        if (fs::is_directory(c, ec)) return c;
    }
    return std::nullopt;
}

std::vector<std::pair<int, fs::path>> InstagramArchiveAdapter::numbered_message_files(
    const fs::path& folder) {

    static const std::regex numbered_re(R"(^message_(\d+)\.json$)");

    std::vector<std::pair<int, fs::path>> files;
    std::error_code ec;
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string fname = it->path().filename().string();
        std::smatch m;
        if (!std::regex_match(fname, m, numbered_re)) continue;
        try {
            files.emplace_back(std::stoi(m[1].str()), it->path());
        } catch (const std::out_of_range&) {
            LOG_WRN("[instagram] Ignoring %s: chunk number out of range", fname.c_str());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// Preview / enumeration
// ============================================================================

std::string InstagramArchiveAdapter::display_name_for(const std::vector<std::string>& participants) {
    std::string display;
    for (size_t i = 0; i < participants.size() && i < 2; ++i) {
        if (i > 0) display += ", ";
        display += participants[i];
    }
    if (participants.size() > 2) {
        display += " +" + std::to_string(participants.size() - 2);
    }
    return display;
}

std::optional<ConversationUnit> InstagramArchiveAdapter::preview(const fs::path& folder) {
    auto files = numbered_message_files(folder);
    if (files.empty()) return std::nullopt;

    auto first = ChatParser::load_json(files.front().second.string());
    if (!first.ok() || !first.value.is_object()) {
        LOG_WRN("[instagram] Cannot preview %s: %s", folder.filename().c_str(),
            first.ok() ? "not a JSON object" : first.error.c_str());
        return std::nullopt;
    }

    ConversationUnit unit;
    unit.folder_name = folder.filename().string();
    unit.path = folder.string();

    const auto& j = first.value;
    if (j.contains("participants") && j["participants"].is_array()) {
        for (const auto& p : j["participants"]) {
            std::string name = "Unknown";
            if (p.is_object() && p.contains("name") && p["name"].is_string()) {
                name = p["name"].get<std::string>();
            }
            unit.participant_preview.push_back(repair_latin1_mojibake(name));
        }
    }

    for (const auto& entry : files) {
        auto doc = ChatParser::load_json(entry.second.string());
        if (!doc.ok()) {
            LOG_DBG("[instagram] Skipping %s in count: %s", entry.second.c_str(), doc.error.c_str());
            continue;
        }
        if (doc.value.is_object() && doc.value.contains("messages") &&
            doc.value["messages"].is_array()) {
            unit.message_count += static_cast<int64_t>(doc.value["messages"].size());
        }
    }

    unit.display_name = display_name_for(unit.participant_preview);
    if (unit.display_name.empty()) unit.display_name = unit.folder_name;
    return unit;
}

std::vector<ConversationUnit> InstagramArchiveAdapter::enumerate(
    const std::string& extracted_dir) const {

    std::vector<ConversationUnit> units;
    auto inbox = find_inbox(extracted_dir);
    if (!inbox) {
        LOG_WRN("[instagram] No messages/inbox folder under %s", extracted_dir.c_str());
        return units;
    }

    std::vector<fs::path> folders;
    std::error_code ec;
    for (fs::directory_iterator it(*inbox, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) folders.push_back(it->path());
    }
    std::sort(folders.begin(), folders.end());

    for (const auto& folder : folders) {
        if (auto unit = preview(folder)) {
            units.push_back(std::move(*unit));
        }
    }

    std::stable_sort(units.begin(), units.end(),
        [](const ConversationUnit& a, const ConversationUnit& b) {
            return a.message_count > b.message_count;
        });

    LOG_INF("[instagram] Found %zu conversations in %s", units.size(), inbox->c_str());
    return units;
}

// ============================================================================
// Merge
// ============================================================================

std::optional<Conversation> InstagramArchiveAdapter::merge(const ConversationUnit& unit) const {
    auto files = numbered_message_files(unit.path);
    if (files.empty()) {
        LOG_WRN("[instagram] No message files in %s", unit.path.c_str());
        return std::nullopt;
    }

    Conversation merged;
    std::optional<int> base_number;
    bool parsed_any = false;

    // Highest number first: oldest chunk in Instagram's numbering
    for (auto it = files.rbegin(); it != files.rend(); ++it) {
        const auto& [number, path] = *it;
        auto doc = ChatParser::load_json(path.string());
        if (!doc.ok() || !doc.value.is_object()) {
            LOG_WRN("[instagram] Skipping unreadable chunk %s", path.c_str());
            continue;
        }
        parsed_any = true;

        Conversation chunk = Conversation::from_json(doc.value);
        if (doc.value.contains("participants") && (!base_number || number < *base_number)) {
            merged.participants = chunk.participants;
            base_number = number;
        }
        merged.messages.insert(merged.messages.end(),
            std::make_move_iterator(chunk.messages.begin()),
            std::make_move_iterator(chunk.messages.end()));
    }

    if (!parsed_any) return std::nullopt;

    std::stable_sort(merged.messages.begin(), merged.messages.end(),
        [](const NormalizedMessage& a, const NormalizedMessage& b) {
            return a.timestamp_ms < b.timestamp_ms;
        });

    // Overlapping chunks repeat messages verbatim
    std::set<std::tuple<int64_t, std::string, std::string>> seen;
    size_t before = merged.messages.size();
    merged.messages.erase(std::remove_if(merged.messages.begin(), merged.messages.end(),
        [&seen](const NormalizedMessage& m) {
            return !seen.emplace(m.timestamp_ms, m.sender_name, m.content).second;
        }), merged.messages.end());

    LOG_INF("[instagram] Merged %s: %zu files, %zu messages (%zu duplicates dropped)",
        unit.folder_name.c_str(), files.size(), merged.messages.size(),
        before - merged.messages.size());
    return merged;
}

} // namespace chatingest
