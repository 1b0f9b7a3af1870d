#include "discord_archive_adapter.hpp"
#include "../ingest/chat_parser.hpp"
#include "../utils/civil_time.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

namespace chatingest {
namespace fs = std::filesystem;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Ids show up as JSON strings in newer exports and as numbers in older ones
std::string id_string(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    return "";
}

std::optional<fs::path> messages_child(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir / "messages", ec)) return dir / "messages";

    std::vector<fs::path> matches;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && lower(it->path().filename().string()) == "messages") {
            matches.push_back(it->path());
        }
    }
    if (matches.empty()) return std::nullopt;
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

} // namespace

// ============================================================================
// Locating messages/ and index.json
// ============================================================================

std::optional<fs::path> DiscordArchiveAdapter::find_messages_dir(const fs::path& root) {
    if (auto direct = messages_child(root)) return direct;

    std::vector<fs::path> wrappers;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) wrappers.push_back(it->path());
    }
    std::sort(wrappers.begin(), wrappers.end());
    for (const auto& w : wrappers) {
        if (auto nested = messages_child(w)) return nested;
    }
    return std::nullopt;
}

std::map<std::string, std::string> DiscordArchiveAdapter::load_index(const fs::path& messages_dir) {
    std::map<std::string, std::string> index;
    fs::path index_path = messages_dir / "index.json";

    std::error_code ec;
    if (!fs::exists(index_path, ec)) return index;

    auto doc = ChatParser::load_json(index_path.string());
    if (!doc.ok() || !doc.value.is_object()) {
        LOG_WRN("[discord] Cannot read %s: %s", index_path.c_str(),
            doc.ok() ? "not a JSON object" : doc.error.c_str());
        return index;
    }
    for (const auto& [channel_id, display] : doc.value.items()) {
        if (display.is_string()) index[channel_id] = display.get<std::string>();
    }
    return index;
}

std::string DiscordArchiveAdapter::strip_dm_prefix(const std::string& display) {
    const std::string prefix = DM_PREFIX;
    if (display.compare(0, prefix.size(), prefix) == 0) return display.substr(prefix.size());
    return display;
}

// ============================================================================
// Enumeration (DM channels only)
// ============================================================================

std::vector<ConversationUnit> DiscordArchiveAdapter::enumerate(
    const std::string& extracted_dir) const {

    std::vector<ConversationUnit> units;
    auto messages_dir = find_messages_dir(extracted_dir);
    if (!messages_dir) {
        LOG_WRN("[discord] No messages folder under %s", extracted_dir.c_str());
        return units;
    }

    auto index = load_index(*messages_dir);

    std::vector<fs::path> channels;
    std::error_code ec;
    for (fs::directory_iterator it(*messages_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec)) continue;
        std::string folder = it->path().filename().string();
        if (folder.empty() || folder.front() != 'c') continue;
        channels.push_back(it->path());
    }
    std::sort(channels.begin(), channels.end());

    size_t skipped_non_dm = 0;
    for (const auto& folder : channels) {
        fs::path channel_json = folder / "channel.json";
        if (!fs::exists(channel_json, ec)) continue;

        auto channel = ChatParser::load_json(channel_json.string());
        if (!channel.ok() || !channel.value.is_object()) {
            LOG_WRN("[discord] Skipping channel %s: %s", folder.filename().c_str(),
                channel.ok() ? "channel.json is not an object" : channel.error.c_str());
            continue;
        }

        const auto& ch = channel.value;
        if (!ch.contains("type") || !ch["type"].is_string() || ch["type"].get<std::string>() != "DM") {
            skipped_non_dm++;
            continue;
        }

        ConversationUnit unit;
        unit.folder_name = folder.filename().string();
        unit.path = folder.string();
        unit.channel_id = ch.contains("id") ? id_string(ch["id"]) : "";
        if (unit.channel_id.empty()) unit.channel_id = unit.folder_name.substr(1);

        auto messages = ChatParser::load_json((folder / "messages.json").string());
        if (messages.ok() && messages.value.is_array()) {
            unit.message_count = static_cast<int64_t>(messages.value.size());
        } else if (!messages.ok()) {
            LOG_DBG("[discord] No message count for %s: %s", unit.folder_name.c_str(),
                messages.error.c_str());
        }

        auto it = index.find(unit.channel_id);
        unit.display_name = strip_dm_prefix(
            it != index.end() ? it->second : "DM " + unit.channel_id);

        units.push_back(std::move(unit));
    }

    std::stable_sort(units.begin(), units.end(),
        [](const ConversationUnit& a, const ConversationUnit& b) {
            return a.message_count > b.message_count;
        });

    LOG_INF("[discord] Found %zu DM channels in %s (%zu non-DM channels skipped)",
        units.size(), messages_dir->c_str(), skipped_non_dm);
    return units;
}

// ============================================================================
// Conversion to the canonical schema
// ============================================================================

std::optional<Conversation> DiscordArchiveAdapter::merge(const ConversationUnit& unit) const {
    const fs::path folder(unit.path);
    auto messages = ChatParser::load_json((folder / "messages.json").string());
    if (!messages.ok() || !messages.value.is_array()) {
        LOG_WRN("[discord] Cannot convert %s: %s", unit.folder_name.c_str(),
            messages.ok() ? "messages.json is not an array" : messages.error.c_str());
        return std::nullopt;
    }
    const auto& raw = messages.value;

    Conversation conv;

    // (a) Author.ID -> Author.Username across the whole channel, first-seen id order
    std::vector<std::pair<std::string, std::string>> users;
    for (const auto& msg : raw) {
        if (!msg.is_object() || !msg.contains("Author") || !msg["Author"].is_object()) continue;
        const auto& author = msg["Author"];
        std::string user_id = author.contains("ID") ? id_string(author["ID"]) : "";
        std::string username = author.contains("Username") && author["Username"].is_string()
            ? author["Username"].get<std::string>() : "";
        if (user_id.empty() || username.empty()) continue;

        auto it = std::find_if(users.begin(), users.end(),
            [&](const auto& u) { return u.first == user_id; });
        if (it != users.end()) it->second = username;
        else users.emplace_back(user_id, username);
    }
    for (const auto& u : users) conv.add_participant(u.second);

    // (b) Older exports without Author: recipient from the index, plus the exporter
    if (conv.participants.empty()) {
        std::string channel_id = unit.channel_id;
        auto channel = ChatParser::load_json((folder / "channel.json").string());
        if (channel.ok() && channel.value.is_object() && channel.value.contains("id")) {
            channel_id = id_string(channel.value["id"]);
        }

        auto index = load_index(folder.parent_path());
        auto it = index.find(channel_id);
        const std::string prefix = DM_PREFIX;
        if (!channel_id.empty() && it != index.end() &&
            it->second.compare(0, prefix.size(), prefix) == 0) {
            std::string username = it->second.substr(prefix.size());
            auto hash = username.rfind('#');
            if (hash != std::string::npos) username = username.substr(0, hash);
            if (!username.empty()) conv.add_participant(username);
            conv.add_participant(EXPORTER_NAME);
        }
    }

    // (c) Nothing to go on
    if (conv.participants.empty()) conv.add_participant(PLACEHOLDER_USER);

    for (const auto& msg : raw) {
        if (!msg.is_object()) continue;
        std::string content = msg.contains("Contents") && msg["Contents"].is_string()
            ? msg["Contents"].get<std::string>() : "";
        // Attachment-only messages have no text
        if (content.empty()) continue;

        NormalizedMessage out;
        out.content = std::move(content);

        std::string ts = msg.contains("Timestamp") && msg["Timestamp"].is_string()
            ? msg["Timestamp"].get<std::string>() : "";
        out.timestamp_ms = parse_sql_timestamp_ms(ts).value_or(0);

        if (msg.contains("Author") && !msg["Author"].is_null()) {
            const auto& author = msg["Author"];
            if (author.is_object()) {
                if (author.contains("Username") && author["Username"].is_string()) {
                    out.sender_name = author["Username"].get<std::string>();
                } else if (author.contains("ID")) {
                    out.sender_name = id_string(author["ID"]);
                }
                if (out.sender_name.empty()) out.sender_name = UNKNOWN_SENDER;
            } else if (author.is_string()) {
                out.sender_name = author.get<std::string>();
            } else {
                out.sender_name = author.dump();
            }
        } else {
            out.sender_name = PLACEHOLDER_USER;
        }

        conv.messages.push_back(std::move(out));
    }

    conv.has_sender_info = std::any_of(conv.messages.begin(), conv.messages.end(),
        [](const NormalizedMessage& m) {
            return m.sender_name != UNKNOWN_SENDER && m.sender_name != PLACEHOLDER_USER;
        });

    std::stable_sort(conv.messages.begin(), conv.messages.end(),
        [](const NormalizedMessage& a, const NormalizedMessage& b) {
            return a.timestamp_ms < b.timestamp_ms;
        });
    std::reverse(conv.messages.begin(), conv.messages.end());

    if (!conv.has_sender_info) {
        conv.warning = NO_SENDER_WARNING;
        LOG_WRN("[discord] %s has no sender attribution", unit.folder_name.c_str());
    }

    LOG_INF("[discord] Converted %s: %zu messages, %zu participants",
        unit.folder_name.c_str(), conv.messages.size(), conv.participants.size());
    return conv;
}

} // namespace chatingest
