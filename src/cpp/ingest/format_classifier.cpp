#include "format_classifier.hpp"
#include "chat_parser.hpp"
#include "../utils/logger.hpp"

#include <string>

namespace chatingest {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim_left(std::string_view s) {
    size_t i = 0;
    // UTF-8 byte order mark
    if (s.size() >= 3 && s.substr(0, 3) == "\xEF\xBB\xBF") i = 3;
    while (i < s.size() && is_space(s[i])) ++i;
    return s.substr(i);
}

} // namespace

bool FormatClassifier::looks_like_instagram_json(std::string_view prefix) {
    std::string_view body = trim_left(prefix);
    if (body.empty() || (body.front() != '{' && body.front() != '[')) return false;
    return prefix.find("\"participants\":") != std::string_view::npos &&
           prefix.find("\"messages\":") != std::string_view::npos;
}

// A "D/M/Y, H:MM" header followed by "- " on the same line, anywhere in the prefix
bool FormatClassifier::looks_like_whatsapp_text(std::string_view prefix) {
    size_t pos = 0;
    while (pos < prefix.size()) {
        size_t eol = prefix.find_first_of("\r\n", pos);
        if (eol == std::string_view::npos) eol = prefix.size();

        std::string line(prefix.substr(pos, eol - pos));
        size_t header_end = ChatParser::whatsapp_header_end(line, false);
        if (header_end != std::string::npos) {
            for (size_t i = header_end; i + 1 < line.size(); ++i) {
                if (line[i] == '-' && is_space(line[i + 1])) return true;
            }
        }
        pos = eol + 1;
    }
    return false;
}

const std::vector<ClassificationRule>& FormatClassifier::rules() {
    static const std::vector<ClassificationRule> table = {
        {"instagram_json", &FormatClassifier::looks_like_instagram_json, DetectedFormat::INSTAGRAM_JSON},
        {"whatsapp_text",  &FormatClassifier::looks_like_whatsapp_text,  DetectedFormat::WHATSAPP_TEXT},
    };
    return table;
}

DetectedFormat FormatClassifier::classify_prefix(std::string_view prefix) {
    for (const auto& rule : rules()) {
        if (rule.matches(prefix)) {
            LOG_DBG("[classifier] rule %s matched", rule.name);
            return rule.format;
        }
    }
    return DetectedFormat::UNKNOWN;
}

ReadResult<DetectedFormat> FormatClassifier::classify_checked(const std::string& path) const {
    auto prefix = ChatParser::read_prefix(path, prefix_bytes_);
    if (!prefix.ok()) {
        auto r = ReadResult<DetectedFormat>::failure(prefix.status, prefix.error);
        r.value = DetectedFormat::UNKNOWN;
        return r;
    }
    DetectedFormat f = classify_prefix(prefix.value);
    return ReadResult<DetectedFormat>::success(f, prefix.status == ReadStatus::EMPTY);
}

DetectedFormat FormatClassifier::classify(const std::string& path) const {
    auto r = classify_checked(path);
    if (!r.ok()) {
        LOG_WRN("[classifier] %s (%s)", r.error.c_str(), read_status_str(r.status));
        return DetectedFormat::UNKNOWN;
    }
    return r.value;
}

} // namespace chatingest
