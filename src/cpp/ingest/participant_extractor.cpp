#include "participant_extractor.hpp"
#include "chat_parser.hpp"
#include "../utils/logger.hpp"

#include <set>

namespace chatingest {

using NameList = std::vector<std::string>;

ReadResult<NameList> ParticipantExtractor::from_instagram_json(const std::string& path) {
    auto doc = ChatParser::load_json(path);
    if (!doc.ok()) return ReadResult<NameList>::failure(doc.status, doc.error);

    std::set<std::string> names;
    const auto& j = doc.value;
    if (j.is_object() && j.contains("participants") && j["participants"].is_array()) {
        for (const auto& p : j["participants"]) {
            if (p.is_object() && p.contains("name") && p["name"].is_string()) {
                names.insert(p["name"].get<std::string>());
            }
        }
    }

    bool empty = names.empty();
    return ReadResult<NameList>::success(NameList(names.begin(), names.end()), empty);
}

std::string ParticipantExtractor::whatsapp_sender(const std::string& line) {
    auto span = ChatParser::whatsapp_sender_span(
        line, ChatParser::whatsapp_header_end(line, false), false);
    if (!span) return "";
    return line.substr(span->first, span->second - span->first);
}

ReadResult<NameList> ParticipantExtractor::from_whatsapp_text(const std::string& path) {
    auto lines = ChatParser::read_lines(path);
    if (!lines.ok()) return ReadResult<NameList>::failure(lines.status, lines.error);

    std::set<std::string> names;
    for (const auto& line : lines.value) {
        std::string sender = whatsapp_sender(line);
        if (!sender.empty()) names.insert(std::move(sender));
    }

    bool empty = names.empty();
    return ReadResult<NameList>::success(NameList(names.begin(), names.end()), empty);
}

ReadResult<NameList> ParticipantExtractor::extract_checked(
    const std::string& path, DetectedFormat format) {

    switch (format) {
        case DetectedFormat::INSTAGRAM_JSON:
        case DetectedFormat::DISCORD_JSON:
            return from_instagram_json(path);
        case DetectedFormat::WHATSAPP_TEXT:
            return from_whatsapp_text(path);
        case DetectedFormat::UNKNOWN:
            break;
    }
    return ReadResult<NameList>::success({}, true);
}

NameList ParticipantExtractor::extract(const std::string& path, DetectedFormat format) {
    auto r = extract_checked(path, format);
    if (!r.ok()) {
        LOG_WRN("[participants] %s (%s)", r.error.c_str(), read_status_str(r.status));
        return {};
    }
    return r.value;
}

} // namespace chatingest
