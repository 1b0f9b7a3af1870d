#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "archive_adapter.hpp"

namespace chatingest {

// Discord data package.
// <root>/messages/index.json maps channel id -> display string and every
// channel sits in messages/c<id>/ with channel.json (id, type) and
// messages.json (array of {ID, Timestamp, Contents, Author?}).
// Only one-to-one DM channels are offered; group and server channels are skipped.
class DiscordArchiveAdapter : public ArchiveAdapter {
public:
    using ArchiveAdapter::ArchiveAdapter;

    static constexpr const char* DM_PREFIX = "Direct Message with ";
    static constexpr const char* PLACEHOLDER_USER = "Discord_User";
    static constexpr const char* UNKNOWN_SENDER = "Unknown";
    static constexpr const char* EXPORTER_NAME = "Me";
    static constexpr const char* NO_SENDER_WARNING =
        "This Discord export uses an older format without sender information. "
        "All messages will appear as 'Discord_User'. For proper AI training, "
        "request a new data export from Discord which includes Author data.";

    [[nodiscard]] std::vector<ConversationUnit> enumerate(
        const std::string& extracted_dir) const override;

    // Converts one channel folder into the canonical schema. Messages come
    // out newest first, matching the Instagram on-disk order.
    [[nodiscard]] std::optional<Conversation> merge(const ConversationUnit& unit) const override;

    [[nodiscard]] ArchiveKind kind() const override { return ArchiveKind::DISCORD; }
    [[nodiscard]] const char* name() const override { return "discord"; }
    [[nodiscard]] DetectedFormat merged_format() const override { return DetectedFormat::DISCORD_JSON; }

    // "messages" (any letter case) at the root or one wrapper folder down
    static std::optional<std::filesystem::path> find_messages_dir(const std::filesystem::path& root);

    // Channel id -> display string; empty when index.json is absent or unreadable
    static std::map<std::string, std::string> load_index(const std::filesystem::path& messages_dir);

    // "Direct Message with alice#0" -> "alice#0"
    static std::string strip_dm_prefix(const std::string& display);
};

} // namespace chatingest
