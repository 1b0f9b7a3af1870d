#pragma once
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include "archive_adapter.hpp"

namespace chatingest {

// Instagram "Download your information" export.
// Conversations live in <root>/your_instagram_activity/messages/inbox/<thread>/,
// each split into message_1.json .. message_N.json where message_1 holds the
// newest chunk and the highest number the oldest.
class InstagramArchiveAdapter : public ArchiveAdapter {
public:
    using ArchiveAdapter::ArchiveAdapter;

    [[nodiscard]] std::vector<ConversationUnit> enumerate(
        const std::string& extracted_dir) const override;
    [[nodiscard]] std::optional<Conversation> merge(const ConversationUnit& unit) const override;

    [[nodiscard]] ArchiveKind kind() const override { return ArchiveKind::INSTAGRAM; }
    [[nodiscard]] const char* name() const override { return "instagram"; }
    [[nodiscard]] DetectedFormat merged_format() const override { return DetectedFormat::INSTAGRAM_JSON; }

    // Searches the root and one wrapper folder down
    static std::optional<std::filesystem::path> find_inbox(const std::filesystem::path& root);

    // message_<N>.json files of a thread folder, ascending by N
    static std::vector<std::pair<int, std::filesystem::path>> numbered_message_files(
        const std::filesystem::path& folder);

    // Preview from the lowest-numbered file; message_count sums all files
    static std::optional<ConversationUnit> preview(const std::filesystem::path& folder);

    static std::string display_name_for(const std::vector<std::string>& participants);
};

} // namespace chatingest
