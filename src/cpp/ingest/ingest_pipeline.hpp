#pragma once
// Orchestrates one upload batch and the follow-up archive selection:
//   loose file:  extension check -> store -> fingerprint -> gate (corpus, then batch)
//   zip archive: extension check -> store -> detect layout -> extract -> enumerate
//                -> registered as pending until select_conversations()/cleanup()
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "../archive/archive_adapter.hpp"
#include "../archive/pending_archive_store.hpp"
#include "corpus_store.hpp"
#include "duplicate_gate.hpp"
#include "fingerprint_engine.hpp"

namespace chatingest {

struct UploadedFile {
    std::string id;
    std::string file_name;
    std::string original_name;
    DetectedFormat detected_format = DetectedFormat::UNKNOWN;
    std::vector<std::string> participants;
    std::string path;
    uint64_t size = 0;

    nlohmann::ordered_json to_json() const;
};

struct RejectedFile {
    std::string name;
    std::string reason;

    nlohmann::ordered_json to_json() const;
};

struct BatchResult {
    std::vector<UploadedFile> uploaded;
    std::vector<RejectedFile> rejected;
    std::vector<PendingArchive> pending_archives;
    int64_t duration_ms = 0;

    nlohmann::ordered_json to_json() const;
};

struct SelectionResult {
    std::string archive_id;
    std::vector<UploadedFile> uploaded;
    std::vector<RejectedFile> rejected;
    std::string error;   // Set when the archive itself could not be used

    [[nodiscard]] bool ok() const { return error.empty(); }
    nlohmann::ordered_json to_json() const;
};

class IngestPipeline {
public:
    IngestPipeline(const IngestConfig& cfg, PendingArchiveStore& pending);

    // Original name of each upload is its file name
    BatchResult ingest_batch(const std::vector<std::string>& paths);

    // Merges, gates and stores the named conversations of a pending archive.
    // The archive's zip, extraction directory and pending entry are always
    // released afterwards, whatever happened to the individual conversations.
    SelectionResult select_conversations(const std::string& archive_id,
                                         const std::vector<std::string>& folder_names);

    // Idempotent
    void cleanup(const std::string& archive_id);

    [[nodiscard]] bool extension_allowed(const std::string& file_name) const;

    CorpusStore& corpus() { return corpus_; }
    [[nodiscard]] const FingerprintEngine& engine() const { return engine_; }

private:
    IngestConfig cfg_;
    PendingArchiveStore& pending_;
    FingerprintEngine engine_;
    CorpusStore corpus_;

    void ingest_file(const std::string& path, DuplicateGate& gate, BatchResult& result);
    void ingest_archive(const StoredFile& stored, const std::string& original_name,
                        BatchResult& result);
    UploadedFile describe_upload(const StoredFile& stored, const std::string& original_name) const;
    void reject(BatchResult& result, const std::string& name, const std::string& reason,
                const StoredFile* stored = nullptr);
};

} // namespace chatingest
