#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "archive/archive_adapter.hpp"
#include "archive/instagram_archive_adapter.hpp"
#include "test_support.hpp"

using namespace chatingest;
using namespace chatingest::test;

static const std::string INBOX = "your_instagram_activity/messages/inbox/";

int main() {
    std::cout << "[Test] Starting Instagram Archive Test..." << std::endl;
    quiet_logs();
    ScratchDir dir("instagram");

    // "José" after a Latin-1 round trip
    const std::string mojibake = "Jos\xC3\x83\xC2\xA9";
    const std::string repaired = "Jos\xC3\xA9";

    std::string zip = make_zip(dir.path() / "export.zip", {
        {INBOX + "alice_123/message_1.json", instagram_doc({"alice", "me"}, {
            instagram_message("alice", "third", 300),
            instagram_message("me", "fourth", 400)}).dump()},
        {INBOX + "alice_123/message_2.json", instagram_doc({"alice", "me"}, {
            instagram_message("me", "first", 100),
            instagram_message("alice", "second", 200)}).dump()},
        {INBOX + "group_9/message_1.json", instagram_doc({mojibake, "kim", "lee", "me"}, {
            instagram_message("kim", "hey all", 50)}).dump()},
        {INBOX + "empty_thread/", ""},
        {INBOX + "notes_1/readme.txt", "not a conversation"},
    });

    std::cout << "[Test] Archive kind detection..." << std::endl;
    assert(detect_archive_kind(zip) == ArchiveKind::INSTAGRAM);

    auto adapter = make_archive_adapter(ArchiveKind::INSTAGRAM, dir / "extract");
    assert(adapter);
    assert(adapter->kind() == ArchiveKind::INSTAGRAM);

    auto extracted = adapter->extract(zip, "arch1");
    assert(extracted.ok());
    assert(extracted.extracted_dir == adapter->extraction_dir("arch1"));

    std::cout << "[Test] Enumeration sorted by message count..." << std::endl;
    auto units = adapter->enumerate(extracted.extracted_dir);
    assert(units.size() == 2);
    assert(units[0].folder_name == "alice_123");
    assert(units[0].message_count == 4);
    assert(units[0].display_name == "alice, me");
    assert(units[1].folder_name == "group_9");
    assert(units[1].message_count == 1);
    assert(units[1].participant_preview.size() == 4);
    assert(units[1].participant_preview[0] == repaired);
    assert(units[1].display_name == repaired + ", kim +2");

    std::cout << "[Test] Merge reassembles chunks chronologically..." << std::endl;
    auto merged = adapter->merge(units[0]);
    assert(merged);
    assert(merged->messages.size() == 4);
    std::vector<int64_t> stamps;
    for (const auto& m : merged->messages) stamps.push_back(m.timestamp_ms);
    assert((stamps == std::vector<int64_t>{100, 200, 300, 400}));
    assert(merged->messages[0].content == "first");
    assert((merged->participant_names() == std::vector<std::string>{"alice", "me"}));

    std::cout << "[Test] Folder without numbered files merges to nothing..." << std::endl;
    ConversationUnit bare;
    bare.folder_name = "empty_thread";
    bare.path = (std::filesystem::path(extracted.extracted_dir) / INBOX / "empty_thread").string();
    assert(!adapter->merge(bare));

    std::cout << "[Test] Missing inbox yields no conversations..." << std::endl;
    auto none = adapter->enumerate(dir / "nowhere");
    assert(none.empty());

    std::cout << "[Test] Re-extracting an id replaces the previous contents..." << std::endl;
    std::string second = make_zip(dir.path() / "second.zip", {
        {"wrapped/messages/inbox/solo_1/message_1.json", instagram_doc({"solo"}, {
            instagram_message("solo", "only", 7)}).dump()},
    });
    auto again = adapter->extract(second, "arch1");
    assert(again.ok());
    assert(!std::filesystem::exists(std::filesystem::path(again.extracted_dir) / "your_instagram_activity"));
    auto units2 = adapter->enumerate(again.extracted_dir);
    assert(units2.size() == 1);
    assert(units2[0].folder_name == "solo_1");

    std::size_t dirs = 0;
    for (const auto& e : std::filesystem::directory_iterator(adapter->extract_root())) {
        if (e.is_directory()) dirs++;
    }
    assert(dirs == 1);

    std::cout << "[Test] Cleanup is idempotent..." << std::endl;
    adapter->cleanup("arch1");
    assert(!std::filesystem::exists(adapter->extraction_dir("arch1")));
    adapter->cleanup("arch1");

    std::cout << "[Test] Corrupt archives and hostile ids are refused..." << std::endl;
    std::string junk = write_file(dir.path() / "junk.zip", "this is not a zip");
    assert(detect_archive_kind(junk) == ArchiveKind::UNKNOWN);
    auto bad = adapter->extract(junk, "arch2");
    assert(!bad.ok());
    assert(!std::filesystem::exists(adapter->extraction_dir("arch2")));
    assert(!adapter->extract(zip, "../escape").ok());
    assert(!ArchiveAdapter::is_valid_archive_id(".."));
    assert(ArchiveAdapter::is_valid_archive_id("a1b2c3d4e5f6"));

    std::cout << "[Test] Out-of-range timestamps read as zero..." << std::endl;
    auto odd = nlohmann::json::parse(R"({
        "participants": [{"name": "a"}],
        "messages": [
            {"sender_name": "a", "content": "negative", "timestamp_ms": -5},
            {"sender_name": "a", "content": "too big", "timestamp_ms": 18446744073709551615},
            {"sender_name": "a", "content": "float", "timestamp_ms": 1.5e3},
            {"sender_name": "a", "content": "negative float", "timestamp_ms": -2.5},
            {"sender_name": "a", "content": "huge float", "timestamp_ms": 1e30},
            {"sender_name": "a", "content": "string", "timestamp_ms": "100"},
            {"sender_name": "a", "content": "fine", "timestamp_ms": 1700000000000}
        ]})");
    Conversation odd_conv = Conversation::from_json(odd);
    assert(odd_conv.messages.size() == 7);
    assert(odd_conv.messages[0].timestamp_ms == 0);
    assert(odd_conv.messages[1].timestamp_ms == 0);
    assert(odd_conv.messages[2].timestamp_ms == 1500);
    assert(odd_conv.messages[3].timestamp_ms == 0);
    assert(odd_conv.messages[4].timestamp_ms == 0);
    assert(odd_conv.messages[5].timestamp_ms == 0);
    assert(odd_conv.messages[6].timestamp_ms == 1700000000000LL);

    std::cout << "[PASS] Instagram Archive Test." << std::endl;
    return 0;
}
