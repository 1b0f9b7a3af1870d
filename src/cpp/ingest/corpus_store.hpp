#pragma once
// =============================================================================
// Corpus Store -- flat directory of accepted chat files
//
//   <corpus_dir>/<id><ext>        accepted upload or merged archive record
//   <corpus_dir>/<id>.meta.json   optional sidecar {detected_type, participants,
//                                 original_name, subject}
//
// <id> is 12 random lowercase hex characters. Sidecar values override what
// content sniffing reports when the corpus is listed.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "conversation.hpp"
#include "fingerprint_engine.hpp"
#include "format_classifier.hpp"

namespace chatingest {

struct StoredFile {
    std::string id;
    std::string file_name;   // <id><ext>
    std::string path;
    std::string error;       // Empty on success

    [[nodiscard]] bool ok() const { return error.empty(); }
};

struct CorpusEntry {
    std::string id;
    std::string file_name;
    std::string original_name;
    DetectedFormat detected_format = DetectedFormat::UNKNOWN;
    std::vector<std::string> participants;
    std::optional<std::string> subject;
    std::string path;
    uint64_t size = 0;

    nlohmann::ordered_json to_json() const;
};

class CorpusStore {
public:
    static constexpr const char* SIDECAR_SUFFIX = ".meta.json";
    static constexpr size_t ID_HEX_CHARS = 12;

    explicit CorpusStore(std::string dir, FormatClassifier classifier = FormatClassifier())
        : dir_(std::move(dir)), classifier_(classifier) {}

    // Copies src into the corpus as <id><ext>, ext taken lowercased from original_name.
    // A sidecar records the original name.
    StoredFile store_file(const std::string& src, const std::string& original_name);

    // Writes <id>.json in canonical form plus a sidecar with the format tag
    StoredFile store_conversation(const Conversation& conv, DetectedFormat format,
                                  const std::string& display_name);

    // Accepts a file name or a bare id; deletes the file and its sidecar
    bool remove(const std::string& name);

    // Every non-sidecar file, sorted by file name
    [[nodiscard]] std::vector<CorpusEntry> list() const;

    [[nodiscard]] std::optional<CorpusEntry> find(const std::string& id) const;

    // Merges {"subject": subject} into the sidecar of an existing file
    bool set_subject(const std::string& id, const std::string& subject);

    // (file name, fingerprints) in file-name order; sidecars and empty sets left out
    [[nodiscard]] NamedFingerprints fingerprints(const FingerprintEngine& engine) const;

    [[nodiscard]] const std::string& dir() const { return dir_; }
    [[nodiscard]] std::string path_for(const std::string& file_name) const;
    [[nodiscard]] std::string sidecar_path(const std::string& id) const;

    static bool is_sidecar(const std::string& file_name);
    static std::string new_file_id();

private:
    std::string dir_;
    FormatClassifier classifier_;

    bool ensure_dir(std::string& error) const;
    std::string unused_id() const;
    std::vector<std::string> corpus_file_names() const;
    std::optional<std::string> file_name_for_id(const std::string& id) const;
    CorpusEntry describe(const std::string& file_name) const;

    template <typename Json>
    static bool write_json(const std::string& path, const Json& j, std::string& error);
};

} // namespace chatingest
