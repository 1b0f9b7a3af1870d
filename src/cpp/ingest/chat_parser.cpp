#include "chat_parser.hpp"
#include "../utils/civil_time.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace chatingest {
namespace fs = std::filesystem;

namespace {

ReadResult<std::ifstream> open_input(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return ReadResult<std::ifstream>::failure(ReadStatus::UNREADABLE,
            "not a readable file: " + path);
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return ReadResult<std::ifstream>::failure(ReadStatus::UNREADABLE,
            "cannot open: " + path);
    }
    return ReadResult<std::ifstream>::success(std::move(f));
}

} // namespace

// ============================================================================
// Raw readers
// ============================================================================

ReadResult<std::string> ChatParser::read_prefix(const std::string& path, size_t max_bytes) {
    auto in = open_input(path);
    if (!in.ok()) return ReadResult<std::string>::failure(in.status, in.error);

    std::string buf(max_bytes, '\0');
    in.value.read(buf.data(), static_cast<std::streamsize>(max_bytes));
    buf.resize(static_cast<size_t>(in.value.gcount()));
    bool empty = buf.empty();
    return ReadResult<std::string>::success(std::move(buf), empty);
}

ReadResult<std::string> ChatParser::read_all(const std::string& path) {
    auto in = open_input(path);
    if (!in.ok()) return ReadResult<std::string>::failure(in.status, in.error);

    std::ostringstream oss;
    oss << in.value.rdbuf();
    std::string content = oss.str();
    bool empty = content.empty();
    return ReadResult<std::string>::success(std::move(content), empty);
}

std::string ChatParser::strip_line_ending(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    return line;
}

ReadResult<std::vector<std::string>> ChatParser::read_lines(const std::string& path) {
    auto in = open_input(path);
    if (!in.ok()) return ReadResult<std::vector<std::string>>::failure(in.status, in.error);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in.value, line)) {
        lines.push_back(strip_line_ending(std::move(line)));
    }
    bool empty = lines.empty();
    return ReadResult<std::vector<std::string>>::success(std::move(lines), empty);
}

ReadResult<nlohmann::json> ChatParser::load_json(const std::string& path) {
    auto raw = read_all(path);
    if (!raw.ok()) return ReadResult<nlohmann::json>::failure(raw.status, raw.error);

    try {
        return ReadResult<nlohmann::json>::success(nlohmann::json::parse(raw.value));
    } catch (const nlohmann::json::exception& e) {
        return ReadResult<nlohmann::json>::failure(ReadStatus::MALFORMED,
            path + ": " + e.what());
    }
}

// ============================================================================
// Instagram / canonical JSON
// ============================================================================

ReadResult<Conversation> ChatParser::load_instagram(const std::string& path) {
    auto doc = load_json(path);
    if (!doc.ok()) return ReadResult<Conversation>::failure(doc.status, doc.error);

    if (!doc.value.is_object()) {
        return ReadResult<Conversation>::failure(ReadStatus::MALFORMED,
            path + ": top-level JSON value is not an object");
    }
    if (!doc.value.contains("participants") && !doc.value.contains("messages")) {
        return ReadResult<Conversation>::failure(ReadStatus::MALFORMED,
            path + ": neither participants nor messages present");
    }

    Conversation conv = Conversation::from_json(doc.value);
    bool empty = conv.messages.empty() && conv.participants.empty();
    return ReadResult<Conversation>::success(std::move(conv), empty);
}

// ============================================================================
// WhatsApp text transcript
// ============================================================================

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string header_window(const std::string& line) {
    return line.substr(0, std::min(line.size(), ChatParser::WHATSAPP_HEADER_SCAN_BYTES));
}

} // namespace

size_t ChatParser::whatsapp_header_end(const std::string& line, bool anchored) {
    static const std::regex header_re(R"(\d{1,2}/\d{1,2}/\d{2,4},\s\d{1,2}:\d{2})");

    const std::string window = header_window(line);
    std::smatch m;
    auto flags = anchored ? std::regex_constants::match_continuous
                          : std::regex_constants::match_default;
    if (!std::regex_search(window, m, header_re, flags)) return std::string::npos;
    return static_cast<size_t>(m.position(0) + m.length(0));
}

std::optional<std::pair<size_t, size_t>> ChatParser::whatsapp_sender_span(
    const std::string& line, size_t header_end, bool colon_space) {

    if (header_end == std::string::npos || header_end >= line.size()) return std::nullopt;

    auto is_separator = [&](size_t i) {
        if (line[i] != ':') return false;
        return !colon_space || (i + 1 < line.size() && is_space(line[i + 1]));
    };

    size_t last_sep = std::string::npos;
    for (size_t i = line.size(); i-- > header_end;) {
        if (is_separator(i)) {
            last_sep = i;
            break;
        }
    }
    if (last_sep == std::string::npos || last_sep < header_end + 2) return std::nullopt;

    size_t dash = std::string::npos;
    for (size_t p = last_sep - 1; p-- > header_end;) {
        if (line[p] == '-' && is_space(line[p + 1])) {
            dash = p;
            break;
        }
    }
    if (dash == std::string::npos) return std::nullopt;

    size_t begin = dash + 2;
    size_t end = begin;
    while (!is_separator(end)) ++end;
    return std::make_pair(begin, end);
}

std::optional<ChatParser::WhatsAppLine> ChatParser::split_whatsapp_line(const std::string& line) {
    auto span = whatsapp_sender_span(line, whatsapp_header_end(line, true), true);
    if (!span) return std::nullopt;

    WhatsAppLine parsed;
    parsed.sender = line.substr(span->first, span->second - span->first);
    parsed.content = line.substr(span->second + 2);
    return parsed;
}

int64_t ChatParser::whatsapp_line_timestamp_ms(const std::string& line) {
    static const std::regex header(
        R"(^(\d{1,2})/(\d{1,2})/(\d{2,4}),\s(\d{1,2}):(\d{2})(?::(\d{2}))?\s*([ap])?)",
        std::regex::icase);

    const std::string window = header_window(line);
    std::smatch m;
    if (!std::regex_search(window, m, header)) return 0;

    int day = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int year = std::stoi(m[3].str());
    int hour = std::stoi(m[4].str());
    int minute = std::stoi(m[5].str());
    int second = m[6].matched ? std::stoi(m[6].str()) : 0;

    if (year < 100) year += 2000;
    if (m[7].matched) {
        bool pm = m[7].str() == "p" || m[7].str() == "P";
        hour = hour % 12 + (pm ? 12 : 0);
    }

    if (!valid_civil(year, month, day, hour, minute, second)) return 0;
    return epoch_ms_from_civil(year, month, day, hour, minute, second);
}

ReadResult<Conversation> ChatParser::load_whatsapp(const std::string& path) {
    auto lines = read_lines(path);
    if (!lines.ok()) return ReadResult<Conversation>::failure(lines.status, lines.error);

    Conversation conv;
    for (const auto& line : lines.value) {
        auto parsed = split_whatsapp_line(line);
        if (!parsed) continue;

        NormalizedMessage msg;
        msg.sender_name = std::move(parsed->sender);
        msg.content = std::move(parsed->content);
        msg.timestamp_ms = whatsapp_line_timestamp_ms(line);
        conv.add_participant(msg.sender_name);
        conv.messages.push_back(std::move(msg));
    }

    bool empty = conv.messages.empty();
    return ReadResult<Conversation>::success(std::move(conv), empty);
}

ReadResult<Conversation> ChatParser::load(const std::string& path, DetectedFormat format) {
    switch (format) {
        case DetectedFormat::INSTAGRAM_JSON:
        case DetectedFormat::DISCORD_JSON:
            return load_instagram(path);
        case DetectedFormat::WHATSAPP_TEXT:
            return load_whatsapp(path);
        case DetectedFormat::UNKNOWN:
            break;
    }
    return ReadResult<Conversation>::failure(ReadStatus::MALFORMED,
        path + ": unrecognized chat format");
}

} // namespace chatingest
