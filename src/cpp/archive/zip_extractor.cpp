#include "zip_extractor.hpp"
#include "../utils/logger.hpp"

#include <zip.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

namespace chatingest {
namespace fs = std::filesystem;

namespace {

using ZipHandle = std::unique_ptr<zip_t, decltype(&zip_discard)>;
using ZipFileHandle = std::unique_ptr<zip_file_t, decltype(&zip_fclose)>;

ZipHandle open_archive(const std::string& zip_path, std::string& error) {
    int code = 0;
    zip_t* za = zip_open(zip_path.c_str(), ZIP_RDONLY, &code);
    if (!za) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, code);
        error = zip_path + ": " + zip_error_strerror(&ze);
        zip_error_fini(&ze);
    }
    return ZipHandle(za, &zip_discard);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool write_entry(zip_t* za, zip_uint64_t index, const fs::path& target) {
    ZipFileHandle zf(zip_fopen_index(za, index, 0), &zip_fclose);
    if (!zf) return false;

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;

    char buf[64 * 1024];
    zip_int64_t n = 0;
    while ((n = zip_fread(zf.get(), buf, sizeof(buf))) > 0) {
        out.write(buf, static_cast<std::streamsize>(n));
    }
    return n == 0 && out.good();
}

} // namespace

bool ZipExtractor::is_safe_entry_path(const std::string& entry_name) {
    if (entry_name.empty()) return false;
    if (entry_name.front() == '/' || entry_name.front() == '\\') return false;
    if (entry_name.find('\\') != std::string::npos) return false;
    if (entry_name.size() > 1 && entry_name[1] == ':') return false;

    fs::path normalized = fs::path(entry_name).lexically_normal();
    if (normalized.empty() || normalized.is_absolute()) return false;
    auto first = normalized.begin();
    return first != normalized.end() && *first != "..";
}

ReadResult<std::vector<std::string>> ZipExtractor::list_entries(const std::string& zip_path) {
    std::string error;
    ZipHandle za = open_archive(zip_path, error);
    if (!za) return ReadResult<std::vector<std::string>>::failure(ReadStatus::MALFORMED, error);

    std::vector<std::string> names;
    zip_int64_t count = zip_get_num_entries(za.get(), 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const char* name = zip_get_name(za.get(), static_cast<zip_uint64_t>(i), 0);
        if (name) names.emplace_back(name);
    }
    bool empty = names.empty();
    return ReadResult<std::vector<std::string>>::success(std::move(names), empty);
}

ExtractResult ZipExtractor::extract_all(const std::string& zip_path, const std::string& dest_dir) {
    ExtractResult result;
    result.extracted_dir = dest_dir;

    ZipHandle za = open_archive(zip_path, result.error);
    if (!za) {
        LOG_ERR("[zip] %s", result.error.c_str());
        return result;
    }

    const fs::path root(dest_dir);
    zip_int64_t count = zip_get_num_entries(za.get(), 0);

    for (zip_int64_t i = 0; i < count; ++i) {
        auto index = static_cast<zip_uint64_t>(i);
        const char* raw_name = zip_get_name(za.get(), index, 0);
        if (!raw_name) {
            result.entries_skipped++;
            continue;
        }
        std::string name(raw_name);
        if (!is_safe_entry_path(name)) {
            LOG_WRN("[zip] Skipping unsafe entry path: %s", name.c_str());
            result.entries_skipped++;
            continue;
        }

        fs::path target = root / fs::path(name).lexically_normal();
        std::error_code ec;

        if (name.back() == '/') {
            fs::create_directories(target, ec);
            continue;
        }

        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_WRN("[zip] Cannot create %s: %s", target.parent_path().c_str(), ec.message().c_str());
            result.entries_skipped++;
            continue;
        }

        if (!write_entry(za.get(), index, target)) {
            LOG_WRN("[zip] Failed to unpack entry %s", name.c_str());
            result.entries_skipped++;
            continue;
        }
        result.files_written++;
    }

    LOG_INF("[zip] Unpacked %zu files from %s into %s (%zu skipped)",
        result.files_written, zip_path.c_str(), dest_dir.c_str(), result.entries_skipped);
    return result;
}

ArchiveKind ZipExtractor::detect_kind(const std::vector<std::string>& entry_names) {
    bool has_inbox = false;
    for (const auto& raw : entry_names) {
        std::string name = to_lower(raw);
        if (name.find("messages/index.json") != std::string::npos) return ArchiveKind::DISCORD;
        if (name.find("inbox/") != std::string::npos) has_inbox = true;
    }
    return has_inbox ? ArchiveKind::INSTAGRAM : ArchiveKind::UNKNOWN;
}

ArchiveKind ZipExtractor::detect_kind(const std::string& zip_path) {
    auto entries = list_entries(zip_path);
    if (!entries.ok()) {
        LOG_WRN("[zip] %s", entries.error.c_str());
        return ArchiveKind::UNKNOWN;
    }
    return detect_kind(entries.value);
}

} // namespace chatingest
