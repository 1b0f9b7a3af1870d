#pragma once
// Extracts the sorted, distinct participant names of a loose chat file.
//
// Instagram/canonical JSON: every participants[].name of the fully parsed file.
// WhatsApp text: the text between the final "- " and the next ':' of every
// header line. A sender whose name contains ':' is cut at that ':'. Lines
// without a header (system notices, continuations) are skipped.
#include <string>
#include <vector>

#include "../config.hpp"
#include "conversation.hpp"

namespace chatingest {

class ParticipantExtractor {
public:
    // Fail-open: unreadable or malformed input gives an empty list
    static std::vector<std::string> extract(const std::string& path, DetectedFormat format);

    static ReadResult<std::vector<std::string>> extract_checked(
        const std::string& path, DetectedFormat format);

    static ReadResult<std::vector<std::string>> from_instagram_json(const std::string& path);
    static ReadResult<std::vector<std::string>> from_whatsapp_text(const std::string& path);

    // Sender of a single WhatsApp header line, empty if the line has none.
    // The header may sit anywhere in the line's first ChatParser::WHATSAPP_HEADER_SCAN_BYTES.
    static std::string whatsapp_sender(const std::string& line);
};

} // namespace chatingest
