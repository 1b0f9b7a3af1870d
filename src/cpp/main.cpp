// =============================================================================
// chatingest -- chat export ingestion for a persona training corpus
//
// Classifies WhatsApp / Instagram / Discord exports, normalizes them into one
// conversation schema, unpacks vendor zip archives and keeps near-duplicate
// conversations out of the corpus directory.
//
// Results are JSON on stdout; logging goes to stderr.
// =============================================================================

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "utils/logger.hpp"
#include "ingest/corpus_store.hpp"
#include "ingest/fingerprint_engine.hpp"
#include "ingest/format_classifier.hpp"
#include "ingest/ingest_pipeline.hpp"
#include "ingest/participant_extractor.hpp"
#include "archive/archive_adapter.hpp"
#include "archive/pending_archive_store.hpp"

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS] COMMAND [ARGS...]\n"
        "\n"
        "Commands:\n"
        "  classify FILE...         Detect the export format of each file\n"
        "  participants FILE...     List the participants of each file\n"
        "  fingerprint FILE...      Boundary-sample fingerprints of each file\n"
        "  ingest FILE...           Add files to the corpus, rejecting duplicates.\n"
        "                           Zip exports are unpacked and every conversation\n"
        "                           (or those named by --select) is imported\n"
        "  list-archive ZIP         Show the conversations inside a zip export\n"
        "  list                     List the corpus\n"
        "  set-subject ID NAME      Mark NAME as the persona subject of corpus file ID\n"
        "  remove NAME              Delete a corpus file (file name or id) and its sidecar\n"
        "\n"
        "Options:\n"
        "  --config PATH            JSON config file (default: built-in defaults)\n"
        "  --corpus-dir PATH        Corpus directory (default: uploads/text)\n"
        "  --extract-dir PATH       Archive extraction root (default: temp_zip)\n"
        "  --threshold X            Duplicate overlap threshold (default: 0.8)\n"
        "  --boundary N             Fingerprint boundary sample size (default: 20)\n"
        "  --select LIST            Comma-separated conversation folders to import\n"
        "  --verbose                Enable debug logging\n"
        "  --help                   Show this help\n",
        prog);
}

static std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

static void emit(const nlohmann::ordered_json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << std::endl;
}

// ============================================================================
// Commands
// ============================================================================

static int cmd_classify(const chatingest::IngestConfig& cfg, const std::vector<std::string>& files) {
    chatingest::FormatClassifier classifier(cfg.classify_prefix_bytes);
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& f : files) {
        auto r = classifier.classify_checked(f);
        nlohmann::ordered_json item = {
            {"file", f},
            {"detected_type", chatingest::detected_format_str(r.value)}
        };
        if (!r.ok()) item["error"] = r.error;
        out.push_back(item);
    }
    emit(out);
    return 0;
}

static int cmd_participants(const chatingest::IngestConfig& cfg, const std::vector<std::string>& files) {
    chatingest::FormatClassifier classifier(cfg.classify_prefix_bytes);
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& f : files) {
        auto format = classifier.classify(f);
        auto r = chatingest::ParticipantExtractor::extract_checked(f, format);
        nlohmann::ordered_json item = {
            {"file", f},
            {"detected_type", chatingest::detected_format_str(format)},
            {"participants", r.value}
        };
        if (!r.ok()) item["error"] = r.error;
        out.push_back(item);
    }
    emit(out);
    return 0;
}

static int cmd_fingerprint(const chatingest::IngestConfig& cfg, const std::vector<std::string>& files) {
    chatingest::FingerprintEngine engine(
        chatingest::FormatClassifier(cfg.classify_prefix_bytes), cfg.fingerprint_boundary);
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& f : files) {
        auto r = engine.fingerprint_checked(f);
        nlohmann::ordered_json item = {
            {"file", f},
            {"fingerprints", r.value}
        };
        if (!r.ok()) item["error"] = r.error;
        out.push_back(item);
    }
    emit(out);
    return 0;
}

static int cmd_ingest(const chatingest::IngestConfig& cfg, const std::vector<std::string>& files,
                      const std::optional<std::vector<std::string>>& selection) {
    chatingest::InMemoryPendingArchiveStore pending;
    chatingest::IngestPipeline pipeline(cfg, pending);

    auto batch = pipeline.ingest_batch(files);
    size_t stored = batch.uploaded.size();

    nlohmann::ordered_json selections = nlohmann::ordered_json::array();
    for (const auto& archive : batch.pending_archives) {
        std::vector<std::string> folders;
        if (selection) {
            folders = *selection;
        } else {
            for (const auto& unit : archive.conversations) folders.push_back(unit.folder_name);
        }
        auto sel = pipeline.select_conversations(archive.archive_id, folders);
        stored += sel.uploaded.size();
        selections.push_back(sel.to_json());
    }

    nlohmann::ordered_json out = batch.to_json();
    out["selections"] = selections;
    emit(out);

    // Only a batch in which nothing at all made it into the corpus counts as a failure
    return (stored == 0 && !batch.rejected.empty()) ? 1 : 0;
}

static int cmd_list_archive(const chatingest::IngestConfig& cfg, const std::string& zip_path) {
    auto kind = chatingest::detect_archive_kind(zip_path);
    auto adapter = chatingest::make_archive_adapter(kind, cfg.extract_dir);
    if (!adapter) {
        LOG_ERR("%s is not an Instagram or Discord export", zip_path.c_str());
        return 1;
    }

    const std::string archive_id = chatingest::CorpusStore::new_file_id();
    auto extracted = adapter->extract(zip_path, archive_id);
    if (!extracted.ok()) {
        LOG_ERR("ZIP error: %s", extracted.error.c_str());
        return 1;
    }

    nlohmann::ordered_json units = nlohmann::ordered_json::array();
    for (const auto& unit : adapter->enumerate(extracted.extracted_dir)) {
        units.push_back(unit.to_json());
    }
    adapter->cleanup(archive_id);

    emit({
        {"file", zip_path},
        {"kind", chatingest::archive_kind_str(kind)},
        {"conversations", units}
    });
    return 0;
}

static int cmd_list(const chatingest::IngestConfig& cfg) {
    chatingest::CorpusStore corpus(cfg.corpus_dir, chatingest::FormatClassifier(cfg.classify_prefix_bytes));
    auto entries = corpus.list();
    nlohmann::ordered_json files = nlohmann::ordered_json::array();
    for (const auto& e : entries) files.push_back(e.to_json());
    emit({{"files", files}, {"count", entries.size()}});
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<std::string> corpus_dir;
    std::optional<std::string> extract_dir;
    std::optional<double> threshold;
    std::optional<size_t> boundary;
    std::optional<std::vector<std::string>> selection;
    bool verbose = false;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (std::strcmp(argv[i], "--corpus-dir") == 0 && i + 1 < argc) {
                corpus_dir = argv[++i];
            } else if (std::strcmp(argv[i], "--extract-dir") == 0 && i + 1 < argc) {
                extract_dir = argv[++i];
            } else if (std::strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
                threshold = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--boundary") == 0 && i + 1 < argc) {
                boundary = std::stoul(argv[++i]);
            } else if (std::strcmp(argv[i], "--select") == 0 && i + 1 < argc) {
                selection = split_csv(argv[++i]);
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
            } else if (std::strncmp(argv[i], "--", 2) == 0) {
                std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
                print_usage(argv[0]);
                return 1;
            } else {
                positional.emplace_back(argv[i]);
            }
        }
    } catch (const std::logic_error& e) {
        std::fprintf(stderr, "Invalid numeric argument (%s)\n", e.what());
        print_usage(argv[0]);
        return 1;
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    chatingest::IngestConfig cfg;
    if (!config_path.empty()) {
        cfg = chatingest::IngestConfig::from_json(config_path);
    }
    if (corpus_dir) cfg.corpus_dir = *corpus_dir;
    if (extract_dir) cfg.extract_dir = *extract_dir;
    if (threshold) cfg.overlap_threshold = *threshold;
    if (boundary) cfg.fingerprint_boundary = *boundary;

    chatingest::g_log_level = chatingest::parse_log_level(cfg.log_level);
    if (verbose) chatingest::g_log_level = chatingest::LogLevel::DEBUG;

    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());
    LOG_DBG("Command %s with %zu arguments (corpus: %s, extract: %s)",
        command.c_str(), args.size(), cfg.corpus_dir.c_str(), cfg.extract_dir.c_str());

    if (command == "classify" && !args.empty()) return cmd_classify(cfg, args);
    if (command == "participants" && !args.empty()) return cmd_participants(cfg, args);
    if (command == "fingerprint" && !args.empty()) return cmd_fingerprint(cfg, args);
    if (command == "ingest" && !args.empty()) return cmd_ingest(cfg, args, selection);
    if (command == "list-archive" && args.size() == 1) return cmd_list_archive(cfg, args[0]);
    if (command == "list" && args.empty()) return cmd_list(cfg);

    if (command == "set-subject" && args.size() == 2) {
        chatingest::CorpusStore corpus(cfg.corpus_dir);
        bool ok = corpus.set_subject(args[0], args[1]);
        emit({{"success", ok}, {"id", args[0]}, {"subject", args[1]}});
        return ok ? 0 : 1;
    }
    if (command == "remove" && args.size() == 1) {
        chatingest::CorpusStore corpus(cfg.corpus_dir);
        bool ok = corpus.remove(args[0]);
        emit({{"success", ok}, {"removed", args[0]}});
        return ok ? 0 : 1;
    }

    std::fprintf(stderr, "Unknown command or wrong arguments: %s\n", command.c_str());
    print_usage(argv[0]);
    return 1;
}
