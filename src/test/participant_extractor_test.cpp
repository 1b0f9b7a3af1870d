#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "ingest/chat_parser.hpp"
#include "ingest/participant_extractor.hpp"
#include "test_support.hpp"

using namespace chatingest;
using namespace chatingest::test;

int main() {
    std::cout << "[Test] Starting Participant Extractor Test..." << std::endl;
    quiet_logs();
    ScratchDir dir("participants");

    std::cout << "[Test] WhatsApp senders, sorted and distinct..." << std::endl;
    std::string chat = write_file(dir.path() / "chat.txt",
        "12/03/2021, 10:15 - Messages and calls are end-to-end encrypted.\n"
        "12/03/2021, 10:16 - Zoe: hey\n"
        "12/03/2021, 10:17 - Adam: hi there\n"
        "a continuation line: with a colon\n"
        "12/03/2021, 10:18 - Zoe: how are you?\r\n"
        "13/03/2021, 9:01 pm - Adam: fine: thanks\n");
    auto names = ParticipantExtractor::extract(chat, DetectedFormat::WHATSAPP_TEXT);
    assert((names == std::vector<std::string>{"Adam", "Zoe"}));

    std::cout << "[Test] Sender is cut at the first colon..." << std::endl;
    assert(ParticipantExtractor::whatsapp_sender("1/1/22, 10:00 - Dr: Who: hello") == "Dr");
    assert(ParticipantExtractor::whatsapp_sender("no header here: x").empty());

    std::cout << "[Test] Instagram participants..." << std::endl;
    std::string insta = write_json(dir.path() / "message_1.json",
        instagram_doc({"zed", "amy", "zed"}, {instagram_message("amy", "yo", 5)}));
    names = ParticipantExtractor::extract(insta, DetectedFormat::INSTAGRAM_JSON);
    assert((names == std::vector<std::string>{"amy", "zed"}));

    std::cout << "[Test] Malformed JSON fails soft..." << std::endl;
    std::string broken = write_file(dir.path() / "broken.json", "{\"participants\": [");
    assert(ParticipantExtractor::extract(broken, DetectedFormat::INSTAGRAM_JSON).empty());
    auto checked = ParticipantExtractor::extract_checked(broken, DetectedFormat::INSTAGRAM_JSON);
    assert(checked.status == ReadStatus::MALFORMED);

    auto missing = ParticipantExtractor::extract_checked(dir / "nope.txt", DetectedFormat::WHATSAPP_TEXT);
    assert(missing.status == ReadStatus::UNREADABLE);

    auto unknown = ParticipantExtractor::extract_checked(chat, DetectedFormat::UNKNOWN);
    assert(unknown.status == ReadStatus::EMPTY);
    assert(unknown.value.empty());

    std::cout << "[Test] WhatsApp loader keeps first-appearance order..." << std::endl;
    auto conv = ChatParser::load_whatsapp(chat);
    assert(conv.ok());
    assert(conv.value.messages.size() == 4);
    assert((conv.value.participant_names() == std::vector<std::string>{"Zoe", "Adam"}));
    assert(conv.value.messages[0].sender_name == "Zoe");
    assert(conv.value.messages[0].content == "hey");
    assert(conv.value.messages[3].content == "fine: thanks");
    // 13/03/2021 21:01 UTC
    assert(conv.value.messages[3].timestamp_ms == 1615669260000LL);

    std::cout << "[Test] Sender is the text after the last dash with a colon behind it..." << std::endl;
    auto split = ChatParser::split_whatsapp_line("1/1/22, 10:00 - Ann - Lee: re: plans - Bob: ok");
    assert(split && split->sender == "Bob" && split->content == "ok");
    split = ChatParser::split_whatsapp_line("1/1/22, 10:00 - Ann: 10:30 works");
    assert(split && split->sender == "Ann" && split->content == "10:30 works");
    assert(!ChatParser::split_whatsapp_line("1/1/22, 10:00 - Ann:no space"));
    assert(!ChatParser::split_whatsapp_line("hello 1/1/22, 10:00 - Ann: mid-line"));
    assert(ParticipantExtractor::whatsapp_sender("hello 1/1/22, 10:00 - Ann: mid-line") == "Ann");

    std::cout << "[Test] Very long message lines..." << std::endl;
    const std::string huge(400000, 'x');
    std::string long_chat = write_file(dir.path() / "long.txt",
        "12/03/2021, 10:15 - Alice: " + huge + "\n"
        "12/03/2021, 10:16 - Bob: " + huge + " - still: talking\n"
        "12/03/2021, 10:17 - " + huge + "\n"
        "12/03/2021, 10:18 - Carol: short\n");
    names = ParticipantExtractor::extract(long_chat, DetectedFormat::WHATSAPP_TEXT);
    assert((names == std::vector<std::string>{"Alice", "Carol", "still"}));

    auto long_conv = ChatParser::load_whatsapp(long_chat);
    assert(long_conv.ok());
    assert(long_conv.value.messages.size() == 3);
    assert(long_conv.value.messages[0].sender_name == "Alice");
    assert(long_conv.value.messages[0].content == huge);
    assert(long_conv.value.messages[1].sender_name == "still");
    assert(long_conv.value.messages[1].content == "talking");
    assert(long_conv.value.messages[2].content == "short");

    std::cout << "[PASS] Participant Extractor Test." << std::endl;
    return 0;
}
