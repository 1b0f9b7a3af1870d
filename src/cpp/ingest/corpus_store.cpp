#include "corpus_store.hpp"
#include "chat_parser.hpp"
#include "participant_extractor.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <random>
#include <system_error>

namespace chatingest {
namespace fs = std::filesystem;

nlohmann::ordered_json CorpusEntry::to_json() const {
    nlohmann::ordered_json j = {
        {"id", id},
        {"file_name", file_name},
        {"original_name", original_name},
        {"detected_type", detected_format_str(detected_format)},
        {"participants", participants},
        {"subject", nullptr},
        {"path", path},
        {"size", size}
    };
    if (subject) j["subject"] = *subject;
    return j;
}

// ============================================================================
// Naming
// ============================================================================

bool CorpusStore::is_sidecar(const std::string& file_name) {
    const std::string suffix = SIDECAR_SUFFIX;
    return file_name.size() >= suffix.size() &&
           file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string CorpusStore::new_file_id() {
    static std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";

    std::string id;
    id.reserve(ID_HEX_CHARS);
    while (id.size() < ID_HEX_CHARS) {
        uint64_t bits = rng();
        for (int i = 0; i < 16 && id.size() < ID_HEX_CHARS; ++i) {
            id.push_back(hex[bits & 0xF]);
            bits >>= 4;
        }
    }
    return id;
}

std::string CorpusStore::path_for(const std::string& file_name) const {
    return (fs::path(dir_) / file_name).string();
}

std::string CorpusStore::sidecar_path(const std::string& id) const {
    return path_for(id + SIDECAR_SUFFIX);
}

bool CorpusStore::ensure_dir(std::string& error) const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        error = "cannot create corpus directory " + dir_ + ": " + ec.message();
        LOG_ERR("[corpus] %s", error.c_str());
        return false;
    }
    return true;
}

std::string CorpusStore::unused_id() const {
    std::string id = new_file_id();
    while (file_name_for_id(id)) id = new_file_id();
    return id;
}

std::vector<std::string> CorpusStore::corpus_file_names() const {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string name = it->path().filename().string();
        if (!is_sidecar(name)) names.push_back(std::move(name));
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<std::string> CorpusStore::file_name_for_id(const std::string& id) const {
    for (const auto& name : corpus_file_names()) {
        if (fs::path(name).stem().string() == id) return name;
    }
    return std::nullopt;
}

template <typename Json>
bool CorpusStore::write_json(const std::string& path, const Json& j, std::string& error) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        error = "cannot write " + path;
        return false;
    }
    // Invalid UTF-8 from a vendor export is replaced rather than aborting the write
    f << j.dump(-1, ' ', false, Json::error_handler_t::replace);
    if (!f.good()) {
        error = "write failed for " + path;
        return false;
    }
    return true;
}

// ============================================================================
// Writes
// ============================================================================

StoredFile CorpusStore::store_file(const std::string& src, const std::string& original_name) {
    StoredFile out;
    if (!ensure_dir(out.error)) return out;

    std::string ext = fs::path(original_name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    out.id = unused_id();
    out.file_name = out.id + ext;
    out.path = path_for(out.file_name);

    std::error_code ec;
    fs::copy_file(src, out.path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        out.error = "cannot copy " + src + ": " + ec.message();
        LOG_ERR("[corpus] %s", out.error.c_str());
        return out;
    }

    nlohmann::ordered_json meta = {{"original_name", original_name}};
    std::string meta_error;
    if (!write_json(sidecar_path(out.id), meta, meta_error)) {
        LOG_WRN("[corpus] %s, original name of %s is lost", meta_error.c_str(), out.file_name.c_str());
    }

    LOG_INF("[corpus] Stored %s as %s", original_name.c_str(), out.file_name.c_str());
    return out;
}

StoredFile CorpusStore::store_conversation(const Conversation& conv, DetectedFormat format,
                                           const std::string& display_name) {
    StoredFile out;
    if (!ensure_dir(out.error)) return out;

    out.id = unused_id();
    out.file_name = out.id + ".json";
    out.path = path_for(out.file_name);

    if (!write_json(out.path, conv.to_json(), out.error)) {
        LOG_ERR("[corpus] %s", out.error.c_str());
        return out;
    }

    nlohmann::ordered_json meta = {
        {"detected_type", detected_format_str(format)},
        {"participants", conv.participant_names()},
        {"original_name", display_name}
    };
    if (!write_json(sidecar_path(out.id), meta, out.error)) {
        LOG_ERR("[corpus] %s", out.error.c_str());
        std::error_code ec;
        fs::remove(out.path, ec);
        return out;
    }

    LOG_INF("[corpus] Stored %s record '%s' as %s (%zu messages)",
        detected_format_str(format), display_name.c_str(), out.file_name.c_str(),
        conv.messages.size());
    return out;
}

bool CorpusStore::remove(const std::string& name) {
    if (name.empty() || name.find_first_of("/\\") != std::string::npos || is_sidecar(name)) {
        LOG_WRN("[corpus] Refusing to remove '%s'", name.c_str());
        return false;
    }

    std::error_code ec;
    std::string file_name = name;
    if (!fs::is_regular_file(path_for(file_name), ec)) {
        auto by_id = file_name_for_id(name);
        if (!by_id) {
            LOG_WRN("[corpus] %s not found", name.c_str());
            return false;
        }
        file_name = *by_id;
    }

    if (!fs::remove(path_for(file_name), ec) || ec) {
        LOG_ERR("[corpus] Cannot remove %s: %s", file_name.c_str(), ec.message().c_str());
        return false;
    }
    fs::remove(sidecar_path(fs::path(file_name).stem().string()), ec);
    LOG_INF("[corpus] Removed %s", file_name.c_str());
    return true;
}

bool CorpusStore::set_subject(const std::string& id, const std::string& subject) {
    if (!file_name_for_id(id)) {
        LOG_WRN("[corpus] Cannot set subject: no file with id %s", id.c_str());
        return false;
    }

    const std::string meta_path = sidecar_path(id);
    nlohmann::json meta = nlohmann::json::object();
    std::error_code ec;
    if (fs::exists(meta_path, ec)) {
        auto existing = ChatParser::load_json(meta_path);
        if (existing.ok() && existing.value.is_object()) {
            meta = std::move(existing.value);
        } else {
            LOG_WRN("[corpus] Replacing unreadable sidecar %s", meta_path.c_str());
        }
    }
    meta["subject"] = subject;

    std::string error;
    if (!write_json(meta_path, meta, error)) {
        LOG_ERR("[corpus] %s", error.c_str());
        return false;
    }
    LOG_INF("[corpus] Subject of %s set to '%s'", id.c_str(), subject.c_str());
    return true;
}

// ============================================================================
// Reads
// ============================================================================

CorpusEntry CorpusStore::describe(const std::string& file_name) const {
    CorpusEntry entry;
    entry.file_name = file_name;
    entry.original_name = file_name;
    entry.id = fs::path(file_name).stem().string();
    entry.path = path_for(file_name);

    std::error_code ec;
    auto size = fs::file_size(entry.path, ec);
    if (!ec) entry.size = static_cast<uint64_t>(size);

    entry.detected_format = classifier_.classify(entry.path);
    if (entry.detected_format != DetectedFormat::UNKNOWN) {
        entry.participants = ParticipantExtractor::extract(entry.path, entry.detected_format);
    }

    const std::string meta_path = sidecar_path(entry.id);
    if (!fs::exists(meta_path, ec)) return entry;

    auto meta = ChatParser::load_json(meta_path);
    if (!meta.ok() || !meta.value.is_object()) {
        LOG_WRN("[corpus] Ignoring sidecar %s: %s", meta_path.c_str(),
            meta.ok() ? "not a JSON object" : meta.error.c_str());
        return entry;
    }

    const auto& m = meta.value;
    if (m.contains("detected_type") && m["detected_type"].is_string()) {
        entry.detected_format = parse_detected_format(m["detected_type"].get<std::string>());
    }
    if (m.contains("participants") && m["participants"].is_array()) {
        entry.participants.clear();
        for (const auto& p : m["participants"]) {
            if (p.is_string()) entry.participants.push_back(p.get<std::string>());
        }
    }
    if (m.contains("original_name") && m["original_name"].is_string()) {
        entry.original_name = m["original_name"].get<std::string>();
    }
    if (m.contains("subject") && m["subject"].is_string()) {
        entry.subject = m["subject"].get<std::string>();
    }
    return entry;
}

std::vector<CorpusEntry> CorpusStore::list() const {
    std::vector<CorpusEntry> entries;
    for (const auto& name : corpus_file_names()) entries.push_back(describe(name));
    LOG_DBG("[corpus] %zu files in %s", entries.size(), dir_.c_str());
    return entries;
}

std::optional<CorpusEntry> CorpusStore::find(const std::string& id) const {
    auto name = file_name_for_id(id);
    if (!name) return std::nullopt;
    return describe(*name);
}

NamedFingerprints CorpusStore::fingerprints(const FingerprintEngine& engine) const {
    NamedFingerprints out;
    for (const auto& name : corpus_file_names()) {
        // Binary leftovers (zip uploads awaiting selection) cannot be fingerprinted
        if (fs::path(name).extension() == ".zip") continue;

        auto r = engine.fingerprint_checked(path_for(name));
        if (!r.ok()) {
            LOG_DBG("[corpus] %s not fingerprinted: %s", name.c_str(), r.error.c_str());
            continue;
        }
        if (!r.value.empty()) out.emplace_back(name, std::move(r.value));
    }
    LOG_DBG("[corpus] Fingerprinted %zu of the files in %s", out.size(), dir_.c_str());
    return out;
}

} // namespace chatingest
