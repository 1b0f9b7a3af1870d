#pragma once
// =============================================================================
// Format Classifier -- tags a chat export from a bounded byte prefix
//
// Rules are evaluated in table order, first match wins:
//   1. instagram_json  trimmed prefix opens with '{' or '[' and contains both
//                      "participants": and "messages": (substring sniffing,
//                      a truncated prefix never aborts classification)
//   2. whatsapp_text   a "D/M/Y, H:MM ... - " header occurs anywhere
//   otherwise UNKNOWN
//
// JSON-likeness is tested before text-likeness because transcripts can
// contain date-like substrings while real JSON exports are unambiguous.
// =============================================================================

#include <string>
#include <string_view>
#include <vector>

#include "../config.hpp"
#include "conversation.hpp"

namespace chatingest {

struct ClassificationRule {
    const char* name;
    bool (*matches)(std::string_view prefix);
    DetectedFormat format;
};

class FormatClassifier {
public:
    static constexpr size_t DEFAULT_PREFIX_BYTES = 4096;

    explicit FormatClassifier(size_t prefix_bytes = DEFAULT_PREFIX_BYTES)
        : prefix_bytes_(prefix_bytes) {}

    // Ordered rule table
    static const std::vector<ClassificationRule>& rules();

    // Pure classification of an in-memory prefix
    static DetectedFormat classify_prefix(std::string_view prefix);

    // Reads at most prefix_bytes; unreadable files are UNKNOWN
    [[nodiscard]] DetectedFormat classify(const std::string& path) const;

    // Same, but reports why a file could not be read
    [[nodiscard]] ReadResult<DetectedFormat> classify_checked(const std::string& path) const;

    [[nodiscard]] size_t prefix_bytes() const { return prefix_bytes_; }

    static bool looks_like_instagram_json(std::string_view prefix);
    static bool looks_like_whatsapp_text(std::string_view prefix);

private:
    size_t prefix_bytes_;
};

} // namespace chatingest
