#include "ingest_pipeline.hpp"
#include "../archive/zip_extractor.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <system_error>

namespace chatingest {
namespace fs = std::filesystem;

// ============================================================================
// Result serialization
// ============================================================================

nlohmann::ordered_json UploadedFile::to_json() const {
    return {
        {"id", id},
        {"file_name", file_name},
        {"original_name", original_name},
        {"detected_type", detected_format_str(detected_format)},
        {"participants", participants},
        {"path", path},
        {"size", size}
    };
}

nlohmann::ordered_json RejectedFile::to_json() const {
    return {{"name", name}, {"reason", reason}};
}

nlohmann::ordered_json BatchResult::to_json() const {
    nlohmann::ordered_json up = nlohmann::ordered_json::array();
    for (const auto& u : uploaded) up.push_back(u.to_json());
    nlohmann::ordered_json rej = nlohmann::ordered_json::array();
    for (const auto& r : rejected) rej.push_back(r.to_json());
    nlohmann::ordered_json pend = nlohmann::ordered_json::array();
    for (const auto& p : pending_archives) pend.push_back(p.to_json());

    return {
        {"uploaded", up},
        {"rejected", rej},
        {"pending_archives", pend},
        {"uploaded_count", uploaded.size()},
        {"duration_ms", duration_ms}
    };
}

nlohmann::ordered_json SelectionResult::to_json() const {
    nlohmann::ordered_json up = nlohmann::ordered_json::array();
    for (const auto& u : uploaded) up.push_back(u.to_json());
    nlohmann::ordered_json rej = nlohmann::ordered_json::array();
    for (const auto& r : rejected) rej.push_back(r.to_json());

    nlohmann::ordered_json j = {
        {"archive_id", archive_id},
        {"uploaded", up},
        {"rejected", rej}
    };
    if (!error.empty()) j["error"] = error;
    return j;
}

// ============================================================================
// Pipeline
// ============================================================================

IngestPipeline::IngestPipeline(const IngestConfig& cfg, PendingArchiveStore& pending)
    : cfg_(cfg),
      pending_(pending),
      engine_(FormatClassifier(cfg.classify_prefix_bytes), cfg.fingerprint_boundary),
      corpus_(cfg.corpus_dir, FormatClassifier(cfg.classify_prefix_bytes)) {}

bool IngestPipeline::extension_allowed(const std::string& file_name) const {
    std::string ext = fs::path(file_name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !ext.empty() &&
           std::find(cfg_.allowed_extensions.begin(), cfg_.allowed_extensions.end(), ext)
               != cfg_.allowed_extensions.end();
}

void IngestPipeline::reject(BatchResult& result, const std::string& name,
                            const std::string& reason, const StoredFile* stored) {
    if (stored && !stored->file_name.empty()) corpus_.remove(stored->file_name);
    LOG_INF("[pipeline] Rejected %s: %s", name.c_str(), reason.c_str());
    result.rejected.push_back({name, reason});
}

UploadedFile IngestPipeline::describe_upload(const StoredFile& stored,
                                             const std::string& original_name) const {
    UploadedFile up;
    up.id = stored.id;
    up.file_name = stored.file_name;
    up.original_name = original_name;
    up.path = stored.path;

    if (auto entry = corpus_.find(stored.id)) {
        up.detected_format = entry->detected_format;
        up.participants = entry->participants;
        up.size = entry->size;
    }
    return up;
}

BatchResult IngestPipeline::ingest_batch(const std::vector<std::string>& paths) {
    BatchResult result;
    Timer timer;
    timer.start();

    // Corpus snapshot taken once; later accepts only reach the batch stage
    DuplicateGate gate(corpus_.fingerprints(engine_), cfg_.overlap_threshold);
    LOG_INF("[pipeline] Batch of %zu files against %zu fingerprinted corpus files",
        paths.size(), gate.corpus().size());

    for (const auto& path : paths) {
        ingest_file(path, gate, result);
    }

    timer.stop();
    result.duration_ms = timer.elapsed_ms();
    LOG_INF("[pipeline] Batch done in %lld ms: %zu uploaded, %zu rejected, %zu archives pending",
        static_cast<long long>(result.duration_ms), result.uploaded.size(),
        result.rejected.size(), result.pending_archives.size());
    return result;
}

void IngestPipeline::ingest_file(const std::string& path, DuplicateGate& gate,
                                 BatchResult& result) {
    const std::string original_name = fs::path(path).filename().string();
    if (original_name.empty()) {
        reject(result, path, "No file name");
        return;
    }

    if (!extension_allowed(original_name)) {
        reject(result, original_name, "Invalid extension");
        return;
    }

    StoredFile stored = corpus_.store_file(path, original_name);
    if (!stored.ok()) {
        reject(result, original_name, "Upload failed: " + stored.error);
        return;
    }

    if (fs::path(stored.file_name).extension() == ".zip") {
        ingest_archive(stored, original_name, result);
        return;
    }

    FingerprintSet fps = engine_.fingerprint(stored.path);
    GateVerdict verdict = gate.check(fps);
    if (verdict.is_duplicate()) {
        reject(result, original_name, verdict.reason(), &stored);
        return;
    }
    gate.accept(stored.file_name, std::move(fps));

    result.uploaded.push_back(describe_upload(stored, original_name));
}

void IngestPipeline::ingest_archive(const StoredFile& stored, const std::string& original_name,
                                    BatchResult& result) {
    auto entries = ZipExtractor::list_entries(stored.path);
    if (!entries.ok()) {
        reject(result, original_name, "ZIP error: " + entries.error, &stored);
        return;
    }

    ArchiveKind kind = ZipExtractor::detect_kind(entries.value);
    auto adapter = make_archive_adapter(kind, cfg_.extract_dir);
    if (!adapter) {
        reject(result, original_name, "ZIP error: not an Instagram or Discord export", &stored);
        return;
    }

    ExtractResult extracted = adapter->extract(stored.path, stored.id);
    if (!extracted.ok()) {
        reject(result, original_name, "ZIP error: " + extracted.error, &stored);
        return;
    }

    PendingArchive archive;
    archive.archive_id = stored.id;
    archive.zip_path = stored.path;
    archive.extracted_path = extracted.extracted_dir;
    archive.original_name = original_name;
    archive.kind = kind;
    archive.conversations = adapter->enumerate(extracted.extracted_dir);

    LOG_INF("[pipeline] %s is a %s export with %zu conversations (archive %s)",
        original_name.c_str(), adapter->name(), archive.conversations.size(),
        archive.archive_id.c_str());

    pending_.put(archive);
    result.pending_archives.push_back(std::move(archive));
}

SelectionResult IngestPipeline::select_conversations(const std::string& archive_id,
                                                     const std::vector<std::string>& folder_names) {
    SelectionResult result;
    result.archive_id = archive_id;

    auto archive = pending_.find(archive_id);
    if (!archive) {
        result.error = "Archive not found: " + archive_id;
        LOG_WRN("[pipeline] %s", result.error.c_str());
        return result;
    }

    auto release = [this, &archive_id]() { cleanup(archive_id); };
    ScopeExit<decltype(release)> guard(release);

    auto adapter = make_archive_adapter(archive->kind, cfg_.extract_dir);
    if (!adapter) {
        result.error = "Unsupported archive kind for " + archive_id;
        LOG_ERR("[pipeline] %s", result.error.c_str());
        return result;
    }

    DuplicateGate gate(corpus_.fingerprints(engine_), cfg_.overlap_threshold);
    const char* source_label = detected_format_str(adapter->merged_format());

    for (const auto& folder : folder_names) {
        auto unit = std::find_if(archive->conversations.begin(), archive->conversations.end(),
            [&folder](const ConversationUnit& u) { return u.folder_name == folder; });
        if (unit == archive->conversations.end()) {
            LOG_WRN("[pipeline] %s has no conversation %s", archive_id.c_str(), folder.c_str());
            result.rejected.push_back({folder, "Conversation not found"});
            continue;
        }

        std::optional<Conversation> merged;
        try {
            merged = adapter->merge(*unit);
        } catch (const std::exception& e) {
            LOG_ERR("[pipeline] Merging %s failed: %s", unit->folder_name.c_str(), e.what());
            result.rejected.push_back({unit->display_name, e.what()});
            continue;
        }
        if (!merged) {
            result.rejected.push_back({unit->display_name, "Failed to merge"});
            continue;
        }

        FingerprintSet fps = engine_.fingerprint(*merged);
        GateVerdict verdict = gate.check(fps);
        if (verdict.is_duplicate()) {
            LOG_INF("[pipeline] Rejected %s: %s", unit->display_name.c_str(), verdict.reason().c_str());
            result.rejected.push_back({unit->display_name, verdict.reason()});
            continue;
        }

        StoredFile stored = corpus_.store_conversation(*merged, adapter->merged_format(),
                                                       unit->display_name);
        if (!stored.ok()) {
            result.rejected.push_back({unit->display_name, stored.error});
            continue;
        }
        gate.accept(stored.file_name, std::move(fps));

        UploadedFile up = describe_upload(stored, unit->display_name + " (" + source_label + ")");
        result.uploaded.push_back(std::move(up));
    }

    LOG_INF("[pipeline] Selection from %s: %zu stored, %zu rejected",
        archive_id.c_str(), result.uploaded.size(), result.rejected.size());
    return result;
}

void IngestPipeline::cleanup(const std::string& archive_id) {
    auto archive = pending_.find(archive_id);
    if (!archive) {
        LOG_DBG("[pipeline] Nothing pending for %s", archive_id.c_str());
        return;
    }

    std::error_code ec;
    const fs::path zip(archive->zip_path);
    if (fs::equivalent(zip.parent_path(), corpus_.dir(), ec)) {
        corpus_.remove(zip.filename().string());
    } else if (!fs::remove(zip, ec) && ec) {
        LOG_WRN("[pipeline] Cannot remove %s: %s", zip.c_str(), ec.message().c_str());
    }

    if (auto adapter = make_archive_adapter(archive->kind, cfg_.extract_dir)) {
        adapter->cleanup(archive_id);
    }

    pending_.erase(archive_id);
    LOG_INF("[pipeline] Released archive %s", archive_id.c_str());
}

} // namespace chatingest
