#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace chatingest {

// Closed set of formats a corpus file can carry
enum class DetectedFormat { WHATSAPP_TEXT, INSTAGRAM_JSON, DISCORD_JSON, UNKNOWN };

inline const char* detected_format_str(DetectedFormat f) {
    switch (f) {
        case DetectedFormat::WHATSAPP_TEXT:  return "WhatsApp";
        case DetectedFormat::INSTAGRAM_JSON: return "Instagram";
        case DetectedFormat::DISCORD_JSON:   return "Discord";
        case DetectedFormat::UNKNOWN:        return "NULL";
    }
    return "NULL";
}

inline DetectedFormat parse_detected_format(const std::string& s) {
    if (s == "WhatsApp")  return DetectedFormat::WHATSAPP_TEXT;
    if (s == "Instagram") return DetectedFormat::INSTAGRAM_JSON;
    if (s == "Discord")   return DetectedFormat::DISCORD_JSON;
    return DetectedFormat::UNKNOWN;
}

// Export archive layouts the adapters understand
enum class ArchiveKind { INSTAGRAM, DISCORD, UNKNOWN };

inline const char* archive_kind_str(ArchiveKind k) {
    switch (k) {
        case ArchiveKind::INSTAGRAM: return "instagram";
        case ArchiveKind::DISCORD:   return "discord";
        case ArchiveKind::UNKNOWN:   return "unknown";
    }
    return "unknown";
}

// Full ingest configuration
struct IngestConfig {
    // Flat corpus directory: accepted files plus <id>.meta.json sidecars
    std::string corpus_dir = "uploads/text";

    // Root for per-archive extraction directories (<extract_dir>/<archive_id>)
    std::string extract_dir = "temp_zip";

    // Classifier never reads more than this many bytes
    size_t classify_prefix_bytes = 4096;

    // Boundary sample: first n and last n messages
    size_t fingerprint_boundary = 20;

    // DuplicateGate: |A & B| / min(|A|, |B|) at or above this is a duplicate
    double overlap_threshold = 0.8;

    std::vector<std::string> allowed_extensions = {".txt", ".json", ".zip", ".html"};

    std::string log_level = "info";

    static IngestConfig from_json(const std::string& path);
};

inline IngestConfig IngestConfig::from_json(const std::string& path) {
    IngestConfig cfg;

    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[config] %s not found, using defaults", path.c_str());
        return cfg;
    }

    try {
        nlohmann::json j;
        f >> j;

        cfg.corpus_dir = j.value("corpus_dir", cfg.corpus_dir);
        cfg.extract_dir = j.value("extract_dir", cfg.extract_dir);
        cfg.classify_prefix_bytes = j.value("classify_prefix_bytes", cfg.classify_prefix_bytes);
        cfg.fingerprint_boundary = j.value("fingerprint_boundary", cfg.fingerprint_boundary);
        cfg.overlap_threshold = j.value("overlap_threshold", cfg.overlap_threshold);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("allowed_extensions") && j["allowed_extensions"].is_array()) {
            cfg.allowed_extensions.clear();
            for (const auto& ext : j["allowed_extensions"]) {
                if (ext.is_string()) cfg.allowed_extensions.push_back(ext.get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[config] %s could not be loaded (%s), using defaults", path.c_str(), e.what());
        return IngestConfig{};
    }

    return cfg;
}

} // namespace chatingest
