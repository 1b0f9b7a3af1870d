#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "archive/archive_adapter.hpp"
#include "archive/discord_archive_adapter.hpp"
#include "archive/zip_extractor.hpp"
#include "test_support.hpp"

using namespace chatingest;
using namespace chatingest::test;
using json = nlohmann::ordered_json;

int main() {
    std::cout << "[Test] Starting Discord Archive Test..." << std::endl;
    quiet_logs();
    ScratchDir dir("discord");

    json index = {
        {"111", "Direct Message with bob#1234"},
        {"222", "general in Some Server"},
        {"333", "Direct Message with carol#0001"}
    };

    json dm_messages = json::array({
        {{"ID", "m2"}, {"Timestamp", "2023-05-01 10:00:05"}, {"Contents", "reply"},
         {"Author", {{"ID", "2"}, {"Username", "bob"}}}},
        {{"ID", "m1"}, {"Timestamp", "2023-05-01 10:00:00"}, {"Contents", "hello"},
         {"Author", {{"ID", "1"}, {"Username", "alice"}}}},
        {{"ID", "m3"}, {"Timestamp", "2023-05-01 10:00:09"}, {"Contents", ""},
         {"Author", {{"ID", "1"}, {"Username", "alice"}}}}
    });

    json server_messages = json::array();
    for (int i = 0; i < 5; ++i) {
        server_messages.push_back({{"ID", std::to_string(i)}, {"Timestamp", "2023-01-01 00:00:00"},
                                   {"Contents", "server chatter"}});
    }

    // Older export: numeric id, no Author data
    json old_messages = json::array({
        {{"ID", "1"}, {"Timestamp", "2022-01-01 00:00:00"}, {"Contents", "old msg"}},
        {{"ID", "2"}, {"Timestamp", "garbage"}, {"Contents", "undated"}}
    });

    json anon_messages = json::array({
        {{"ID", "1"}, {"Timestamp", "2021-06-01 12:00:00"}, {"Contents", "x"}, {"Author", {{"ID", "9"}}}}
    });

    std::string zip = make_zip(dir.path() / "package.zip", {
        {"messages/index.json", index.dump()},
        {"messages/c111/channel.json", json({{"id", "111"}, {"type", "DM"}}).dump()},
        {"messages/c111/messages.json", dm_messages.dump()},
        {"messages/c222/channel.json", json({{"id", "222"}, {"type", "GUILD_TEXT"}, {"name", "general"}}).dump()},
        {"messages/c222/messages.json", server_messages.dump()},
        {"messages/c333/channel.json", json({{"id", 333}, {"type", "DM"}}).dump()},
        {"messages/c333/messages.json", old_messages.dump()},
        {"messages/c444/channel.json", json({{"type", "DM"}}).dump()},
        {"messages/c444/messages.json", anon_messages.dump()},
        {"messages/notes/channel.json", json({{"id", "5"}, {"type", "DM"}}).dump()},
        {"account/user.json", "{}"},
    });

    std::cout << "[Test] Archive kind detection..." << std::endl;
    assert(detect_archive_kind(zip) == ArchiveKind::DISCORD);
    assert(ZipExtractor::detect_kind(std::vector<std::string>{"a/inbox/x.json", "pkg/Messages/Index.json"})
           == ArchiveKind::DISCORD);
    assert(ZipExtractor::detect_kind(std::vector<std::string>{"a/inbox/x.json"}) == ArchiveKind::INSTAGRAM);
    assert(ZipExtractor::detect_kind(std::vector<std::string>{"readme.txt"}) == ArchiveKind::UNKNOWN);

    auto adapter = make_archive_adapter(ArchiveKind::DISCORD, dir / "extract");
    assert(adapter);
    auto extracted = adapter->extract(zip, "disc1");
    assert(extracted.ok());

    std::cout << "[Test] Only DM channels are enumerated..." << std::endl;
    auto units = adapter->enumerate(extracted.extracted_dir);
    assert(units.size() == 3);
    for (const auto& u : units) assert(u.folder_name != "c222");

    assert(units[0].folder_name == "c111");
    assert(units[0].message_count == 3);
    assert(units[0].display_name == "bob#1234");
    assert(units[0].channel_id == "111");
    assert(units[1].folder_name == "c333");
    assert(units[1].channel_id == "333");
    assert(units[1].display_name == "carol#0001");
    assert(units[2].folder_name == "c444");
    assert(units[2].channel_id == "444");
    assert(units[2].display_name == "DM 444");

    std::cout << "[Test] Author data drives participants and senders..." << std::endl;
    auto dm = adapter->merge(units[0]);
    assert(dm);
    assert((dm->participant_names() == std::vector<std::string>{"bob", "alice"}));
    assert(dm->messages.size() == 2);
    // Newest first
    assert(dm->messages[0].content == "reply");
    assert(dm->messages[0].sender_name == "bob");
    assert(dm->messages[0].timestamp_ms == 1682935205000LL);
    assert(dm->messages[1].content == "hello");
    assert(dm->messages[1].timestamp_ms == 1682935200000LL);
    assert(dm->has_sender_info);
    assert(!dm->warning);

    std::cout << "[Test] Older exports fall back to the index name..." << std::endl;
    auto old = adapter->merge(units[1]);
    assert(old);
    assert((old->participant_names() == std::vector<std::string>{"carol", "Me"}));
    assert(old->messages.size() == 2);
    assert(old->messages[0].content == "old msg");
    assert(old->messages[0].timestamp_ms == 1640995200000LL);
    assert(old->messages[1].content == "undated");
    assert(old->messages[1].timestamp_ms == 0);
    assert(old->messages[0].sender_name == DiscordArchiveAdapter::PLACEHOLDER_USER);
    assert(!old->has_sender_info);
    assert(old->warning && *old->warning == DiscordArchiveAdapter::NO_SENDER_WARNING);

    std::cout << "[Test] No name anywhere gives the placeholder participant..." << std::endl;
    auto anon = adapter->merge(units[2]);
    assert(anon);
    assert((anon->participant_names() == std::vector<std::string>{"Discord_User"}));
    assert(anon->messages.size() == 1);
    assert(anon->messages[0].sender_name == "9");
    assert(anon->has_sender_info);

    std::cout << "[Test] Canonical JSON keeps participants first..." << std::endl;
    std::string dumped = old->to_json().dump();
    assert(dumped.find("\"participants\"") < dumped.find("\"messages\""));
    assert(dumped.find("\"warning\"") != std::string::npos);

    std::cout << "[Test] messages folder lookup is case-insensitive and may be wrapped..." << std::endl;
    std::filesystem::create_directories(dir.path() / "wrapped" / "pkg" / "Messages");
    auto found = DiscordArchiveAdapter::find_messages_dir(dir.path() / "wrapped");
    assert(found && found->filename() == "Messages");
    assert(!DiscordArchiveAdapter::find_messages_dir(dir.path() / "extract" / "nothing"));
    assert(adapter->enumerate(dir / "wrapped").empty());

    assert(DiscordArchiveAdapter::strip_dm_prefix("Direct Message with x#1") == "x#1");
    assert(DiscordArchiveAdapter::strip_dm_prefix("general") == "general");

    adapter->cleanup("disc1");
    assert(!std::filesystem::exists(adapter->extraction_dir("disc1")));

    std::cout << "[PASS] Discord Archive Test." << std::endl;
    return 0;
}
