#pragma once
// =============================================================================
// Canonical conversation schema
//
// Every source (WhatsApp text, Instagram message_N.json, Discord channel
// exports) is normalized into Conversation. The on-disk JSON form is the
// Instagram layout, written with "participants" first so the classifier's
// bounded prefix always sees both structural markers.
// =============================================================================

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chatingest {

// ============================================================================
// Load outcome (distinguishes "nothing there" from "could not read/parse")
// ============================================================================

enum class ReadStatus {
    OK,          // Read and parsed, value carries data
    EMPTY,       // Read and parsed, definitively nothing in it
    UNREADABLE,  // Missing or unopenable
    MALFORMED    // Opened but not parseable / expected fields absent
};

inline const char* read_status_str(ReadStatus s) {
    switch (s) {
        case ReadStatus::OK:         return "ok";
        case ReadStatus::EMPTY:      return "empty";
        case ReadStatus::UNREADABLE: return "unreadable";
        case ReadStatus::MALFORMED:  return "malformed";
    }
    return "??";
}

template <typename T>
struct ReadResult {
    T value{};
    ReadStatus status = ReadStatus::OK;
    std::string error;   // Empty unless UNREADABLE / MALFORMED

    [[nodiscard]] bool ok() const { return status == ReadStatus::OK || status == ReadStatus::EMPTY; }

    static ReadResult success(T v, bool empty = false) {
        ReadResult r;
        r.value = std::move(v);
        r.status = empty ? ReadStatus::EMPTY : ReadStatus::OK;
        return r;
    }

    static ReadResult failure(ReadStatus status, std::string error) {
        ReadResult r;
        r.status = status;
        r.error = std::move(error);
        return r;
    }
};

// ============================================================================
// Canonical records
// ============================================================================

struct Participant {
    std::string name;
};

struct NormalizedMessage {
    std::string sender_name;
    std::string content;
    int64_t timestamp_ms = 0;
};

inline bool operator==(const NormalizedMessage& a, const NormalizedMessage& b) {
    return a.timestamp_ms == b.timestamp_ms && a.sender_name == b.sender_name &&
           a.content == b.content;
}

struct Conversation {
    std::vector<Participant> participants;
    std::vector<NormalizedMessage> messages;
    bool has_sender_info = true;
    std::optional<std::string> warning;

    // Appends unless a participant with the exact same name exists
    bool add_participant(const std::string& name);

    [[nodiscard]] std::vector<std::string> participant_names() const;

    // Canonical JSON, key order: participants, messages, has_sender_info, warning
    [[nodiscard]] nlohmann::ordered_json to_json() const;

    // Lenient: missing or mistyped fields become defaults, a non-object yields an empty record
    static Conversation from_json(const nlohmann::json& j);
};

// Candidate conversation found inside an extracted archive
struct ConversationUnit {
    std::string folder_name;
    std::string display_name;
    std::string path;
    std::vector<std::string> participant_preview;
    int64_t message_count = 0;
    std::string channel_id;   // Discord only

    [[nodiscard]] nlohmann::ordered_json to_json() const;
};

// Set of 12-hex-character message fingerprints
using FingerprintSet = std::set<std::string>;

} // namespace chatingest
