#include "archive_adapter.hpp"
#include "instagram_archive_adapter.hpp"
#include "discord_archive_adapter.hpp"
#include "../utils/logger.hpp"

#include <filesystem>
#include <system_error>

namespace chatingest {
namespace fs = std::filesystem;

bool ArchiveAdapter::is_valid_archive_id(const std::string& archive_id) {
    if (archive_id.empty() || archive_id == "." || archive_id == "..") return false;
    return archive_id.find_first_of("/\\") == std::string::npos;
}

std::string ArchiveAdapter::extraction_dir(const std::string& archive_id) const {
    return (fs::path(extract_root_) / archive_id).string();
}

ExtractResult ArchiveAdapter::extract(const std::string& zip_path,
                                      const std::string& archive_id) const {
    ExtractResult result;
    if (!is_valid_archive_id(archive_id)) {
        result.error = "invalid archive id: '" + archive_id + "'";
        LOG_ERR("[%s] %s", name(), result.error.c_str());
        return result;
    }

    const std::string dir = extraction_dir(archive_id);
    result.extracted_dir = dir;

    std::error_code ec;
    if (fs::exists(dir, ec)) {
        LOG_DBG("[%s] Removing previous extraction %s", name(), dir.c_str());
        fs::remove_all(dir, ec);
        if (ec) {
            result.error = "cannot clear " + dir + ": " + ec.message();
            LOG_ERR("[%s] %s", name(), result.error.c_str());
            return result;
        }
    }

    fs::create_directories(dir, ec);
    if (ec) {
        result.error = "cannot create " + dir + ": " + ec.message();
        LOG_ERR("[%s] %s", name(), result.error.c_str());
        return result;
    }

    result = ZipExtractor::extract_all(zip_path, dir);
    if (!result.ok()) {
        // Leave nothing behind for a corrupt archive
        fs::remove_all(dir, ec);
    }
    return result;
}

void ArchiveAdapter::cleanup(const std::string& archive_id) const {
    if (!is_valid_archive_id(archive_id)) {
        LOG_WRN("[%s] Refusing cleanup for invalid archive id '%s'", name(), archive_id.c_str());
        return;
    }
    const std::string dir = extraction_dir(archive_id);
    std::error_code ec;
    auto removed = fs::remove_all(dir, ec);
    if (ec) {
        LOG_ERR("[%s] Cleanup of %s failed: %s", name(), dir.c_str(), ec.message().c_str());
    } else if (removed > 0) {
        LOG_INF("[%s] Cleaned up %s", name(), dir.c_str());
    }
}

ArchiveKind detect_archive_kind(const std::string& zip_path) {
    ArchiveKind kind = ZipExtractor::detect_kind(zip_path);
    LOG_DBG("[zip] %s looks like a %s export", zip_path.c_str(), archive_kind_str(kind));
    return kind;
}

std::unique_ptr<ArchiveAdapter> make_archive_adapter(ArchiveKind kind,
                                                     const std::string& extract_root) {
    switch (kind) {
        case ArchiveKind::INSTAGRAM:
            return std::make_unique<InstagramArchiveAdapter>(extract_root);
        case ArchiveKind::DISCORD:
            return std::make_unique<DiscordArchiveAdapter>(extract_root);
        case ArchiveKind::UNKNOWN:
            break;
    }
    return nullptr;
}

} // namespace chatingest
