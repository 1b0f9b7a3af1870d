#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "ingest/chat_parser.hpp"
#include "ingest/corpus_store.hpp"
#include "test_support.hpp"

using namespace chatingest;
using namespace chatingest::test;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Corpus Store Test..." << std::endl;
    quiet_logs();
    ScratchDir dir("corpus");
    CorpusStore corpus(dir / "text");

    std::cout << "[Test] Ids are 12 lowercase hex characters..." << std::endl;
    std::string id = CorpusStore::new_file_id();
    assert(id.size() == 12);
    assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    assert(CorpusStore::new_file_id() != id);

    std::cout << "[Test] Storing an upload keeps its lowercased extension..." << std::endl;
    std::string src = write_file(dir.path() / "incoming" / "Chat With Bob.TXT",
        "12/03/2021, 10:15 - Alice: hello\n12/03/2021, 10:16 - Bob: hi\n");
    StoredFile stored = corpus.store_file(src, "Chat With Bob.TXT");
    assert(stored.ok());
    assert(stored.file_name == stored.id + ".txt");
    assert(fs::exists(stored.path));
    assert(fs::exists(corpus.sidecar_path(stored.id)));

    std::cout << "[Test] Storing a merged conversation writes a sidecar..." << std::endl;
    Conversation conv;
    conv.add_participant("carol");
    conv.add_participant("Me");
    conv.messages.push_back({"Discord_User", "old msg", 1640995200000LL});
    conv.has_sender_info = false;
    conv.warning = "no senders";
    StoredFile merged = corpus.store_conversation(conv, DetectedFormat::DISCORD_JSON, "carol#0001");
    assert(merged.ok());
    assert(merged.file_name == merged.id + ".json");

    auto reloaded = ChatParser::load_instagram(merged.path);
    assert(reloaded.ok());
    assert(reloaded.value.messages.size() == 1);
    assert(!reloaded.value.has_sender_info);
    assert(reloaded.value.warning && *reloaded.value.warning == "no senders");

    std::cout << "[Test] Listing skips sidecars and applies overrides..." << std::endl;
    auto entries = corpus.list();
    assert(entries.size() == 2);
    for (const auto& e : entries) assert(!CorpusStore::is_sidecar(e.file_name));
    assert(entries[0].file_name < entries[1].file_name);

    auto text_entry = corpus.find(stored.id);
    assert(text_entry);
    assert(text_entry->detected_format == DetectedFormat::WHATSAPP_TEXT);
    assert(text_entry->original_name == "Chat With Bob.TXT");
    assert((text_entry->participants == std::vector<std::string>{"Alice", "Bob"}));
    assert(!text_entry->subject);
    assert(text_entry->size > 0);

    // Content sniffs as Instagram, the sidecar says Discord
    auto discord_entry = corpus.find(merged.id);
    assert(discord_entry);
    assert(discord_entry->detected_format == DetectedFormat::DISCORD_JSON);
    assert(discord_entry->original_name == "carol#0001");
    assert((discord_entry->participants == std::vector<std::string>{"carol", "Me"}));

    std::cout << "[Test] Subjects merge into the sidecar..." << std::endl;
    assert(corpus.set_subject(merged.id, "carol"));
    discord_entry = corpus.find(merged.id);
    assert(discord_entry->subject && *discord_entry->subject == "carol");
    assert(discord_entry->detected_format == DetectedFormat::DISCORD_JSON);
    assert(!corpus.set_subject("000000000000", "nobody"));

    std::cout << "[Test] Fingerprints follow file-name order and drop empty sets..." << std::endl;
    write_file(dir.path() / "text" / "zzzzzzzzzzzz.txt", "nothing to see\n");
    FingerprintEngine engine;
    auto fps = corpus.fingerprints(engine);
    assert(fps.size() == 2);
    assert(fps[0].first < fps[1].first);
    for (const auto& [name, set] : fps) {
        assert(name != "zzzzzzzzzzzz.txt");
        assert(set.size() == (name == stored.file_name ? 2u : 1u));
    }

    std::cout << "[Test] Removing by id or file name deletes the sidecar too..." << std::endl;
    assert(corpus.remove(merged.id));
    assert(!fs::exists(merged.path));
    assert(!fs::exists(corpus.sidecar_path(merged.id)));
    assert(corpus.remove(stored.file_name));
    assert(!fs::exists(corpus.sidecar_path(stored.id)));
    assert(!corpus.remove(stored.file_name));
    assert(!corpus.remove("../outside.txt"));
    assert(corpus.list().size() == 1);

    std::cout << "[PASS] Corpus Store Test." << std::endl;
    return 0;
}
