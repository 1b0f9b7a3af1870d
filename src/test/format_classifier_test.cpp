#include <cassert>
#include <iostream>
#include <string>

#include "ingest/format_classifier.hpp"
#include "test_support.hpp"

using namespace chatingest;
using namespace chatingest::test;

int main() {
    std::cout << "[Test] Starting Format Classifier Test..." << std::endl;
    quiet_logs();

    std::cout << "[Test] JSON markers beat date-like text..." << std::endl;
    assert(FormatClassifier::classify_prefix(
        R"({"participants": [{"name": "a"}], "messages": [{"content": "12/03/2021, 10:15 - x: y"}]})")
        == DetectedFormat::INSTAGRAM_JSON);
    assert(FormatClassifier::classify_prefix(
        "  \n[{\"participants\":[],\"messages\":[]}]") == DetectedFormat::INSTAGRAM_JSON);
    // Truncated JSON still classifies
    assert(FormatClassifier::classify_prefix(
        R"({"participants": [{"name": "a"}], "messages": [{"sender_name": "a", "cont)")
        == DetectedFormat::INSTAGRAM_JSON);

    std::cout << "[Test] One JSON marker is not enough..." << std::endl;
    assert(FormatClassifier::classify_prefix(R"({"messages": []})") == DetectedFormat::UNKNOWN);
    assert(FormatClassifier::classify_prefix(
        "{\"messages\": [], \"note\": \"1/2/21, 9:00 - a: b\"}") == DetectedFormat::WHATSAPP_TEXT);

    std::cout << "[Test] Markers without a JSON opener are not JSON..." << std::endl;
    assert(FormatClassifier::classify_prefix(
        "\"participants\": \"messages\": plain words") == DetectedFormat::UNKNOWN);

    std::cout << "[Test] WhatsApp transcripts..." << std::endl;
    assert(FormatClassifier::classify_prefix(
        "12/03/2021, 10:15 - Alice: hello\n12/03/2021, 10:16 - Bob: hi\n")
        == DetectedFormat::WHATSAPP_TEXT);
    assert(FormatClassifier::classify_prefix(
        "Messages are end-to-end encrypted.\n1/2/21, 9:05 pm - Bob: yo\n")
        == DetectedFormat::WHATSAPP_TEXT);
    assert(FormatClassifier::classify_prefix("just some notes\nnothing here\n") == DetectedFormat::UNKNOWN);
    assert(FormatClassifier::classify_prefix("") == DetectedFormat::UNKNOWN);

    std::cout << "[Test] Rule table order..." << std::endl;
    const auto& rules = FormatClassifier::rules();
    assert(rules.size() == 2);
    assert(std::string(rules[0].name) == "instagram_json");
    assert(rules[0].format == DetectedFormat::INSTAGRAM_JSON);
    assert(rules[1].format == DetectedFormat::WHATSAPP_TEXT);

    std::cout << "[Test] Files and the bounded prefix..." << std::endl;
    ScratchDir dir("classifier");
    FormatClassifier classifier;

    std::string chat = write_file(dir.path() / "chat.txt", "10/10/2020, 08:00 - Ana: bom dia\n");
    assert(classifier.classify(chat) == DetectedFormat::WHATSAPP_TEXT);

    std::string insta = write_json(dir.path() / "message_1.json",
        instagram_doc({"ana", "bo"}, {instagram_message("ana", "hi", 1)}));
    assert(classifier.classify(insta) == DetectedFormat::INSTAGRAM_JSON);

    // The header sits beyond the prefix window
    std::string late = write_file(dir.path() / "late.txt",
        std::string(5000, 'x') + "\n10/10/2020, 08:00 - Ana: bom dia\n");
    assert(classifier.classify(late) == DetectedFormat::UNKNOWN);
    assert(FormatClassifier(8192).classify(late) == DetectedFormat::WHATSAPP_TEXT);

    std::cout << "[Test] A wide prefix over one very long line..." << std::endl;
    std::string long_line = write_file(dir.path() / "long_line.txt",
        "10/10/2020, 08:00 - Ana: " + std::string(500000, 'z') + "\n");
    assert(FormatClassifier(1 << 20).classify(long_line) == DetectedFormat::WHATSAPP_TEXT);
    std::string long_plain = write_file(dir.path() / "long_plain.txt",
        "10/10/2020, 08:00 " + std::string(500000, 'z') + "\n");
    assert(FormatClassifier(1 << 20).classify(long_plain) == DetectedFormat::UNKNOWN);

    std::cout << "[Test] Unreadable input fails open..." << std::endl;
    std::string missing = dir / "missing.txt";
    assert(classifier.classify(missing) == DetectedFormat::UNKNOWN);
    auto checked = classifier.classify_checked(missing);
    assert(!checked.ok());
    assert(checked.status == ReadStatus::UNREADABLE);
    assert(checked.value == DetectedFormat::UNKNOWN);

    std::string empty = write_file(dir.path() / "empty.txt", "");
    auto empty_checked = classifier.classify_checked(empty);
    assert(empty_checked.ok());
    assert(empty_checked.status == ReadStatus::EMPTY);
    assert(empty_checked.value == DetectedFormat::UNKNOWN);

    std::cout << "[PASS] Format Classifier Test." << std::endl;
    return 0;
}
