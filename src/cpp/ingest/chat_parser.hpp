#pragma once
// =============================================================================
// Chat Parser -- Loads loose chat export files into the canonical schema
//
// Two on-disk shapes reach the corpus as single files:
//   WhatsApp:  "D/M/Y, H:MM<anything> - Sender: message" text lines
//   Instagram: message_N.json objects (also the canonical written form, so
//              merged Discord records load through the same path)
//
// Loaders never throw for bad input; the ReadResult says what went wrong.
// =============================================================================

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "../config.hpp"
#include "conversation.hpp"

namespace chatingest {

class ChatParser {
public:
    // Lines are only searched this far for their "D/M/Y, H:MM" header
    static constexpr size_t WHATSAPP_HEADER_SCAN_BYTES = 64;

    struct WhatsAppLine {
        std::string sender;
        std::string content;
    };

    // First max_bytes bytes of a file (fewer if the file is shorter)
    static ReadResult<std::string> read_prefix(const std::string& path, size_t max_bytes);

    static ReadResult<std::string> read_all(const std::string& path);

    static ReadResult<std::vector<std::string>> read_lines(const std::string& path);

    static ReadResult<nlohmann::json> load_json(const std::string& path);

    // Instagram / canonical JSON file
    static ReadResult<Conversation> load_instagram(const std::string& path);

    // WhatsApp transcript: matching lines become messages, senders become
    // participants in order of first appearance. Continuation lines are dropped.
    static ReadResult<Conversation> load_whatsapp(const std::string& path);

    // Dispatch on format; UNKNOWN yields MALFORMED
    static ReadResult<Conversation> load(const std::string& path, DetectedFormat format);

    // Offset just past the "D/M/Y, H:MM" header, npos when the first
    // WHATSAPP_HEADER_SCAN_BYTES of the line hold none. Anchored headers must open the line.
    static size_t whatsapp_header_end(const std::string& line, bool anchored);

    // [begin, end) of the sender after header_end. The sender starts after the last
    // "- " that still has a separator behind it and stops at the first separator.
    // The separator is ": " when colon_space is set, a bare ':' otherwise.
    static std::optional<std::pair<size_t, size_t>> whatsapp_sender_span(
        const std::string& line, size_t header_end, bool colon_space);

    // "D/M/Y, H:MM... - Sender: content" split, nullopt for lines without a header
    static std::optional<WhatsAppLine> split_whatsapp_line(const std::string& line);

    // Best-effort timestamp from a WhatsApp line header (day-first, 12/24h), 0 when unparsable
    static int64_t whatsapp_line_timestamp_ms(const std::string& line);

private:
    static std::string strip_line_ending(std::string line);
};

} // namespace chatingest
