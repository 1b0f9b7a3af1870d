#include "conversation.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace chatingest {

namespace {

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// Epoch milliseconds; missing, negative and out-of-range values read as 0
int64_t timestamp_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return 0;
    if (it->is_number_unsigned()) {
        uint64_t v = it->get<uint64_t>();
        return v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ? 0 : static_cast<int64_t>(v);
    }
    if (it->is_number_float()) {
        double v = it->get<double>();
        // 2^63 is the first double past int64_t
        if (!(v >= 0.0) || v >= 9223372036854775808.0) return 0;
        return static_cast<int64_t>(v);
    }
    return std::max<int64_t>(it->get<int64_t>(), 0);
}

} // namespace

bool Conversation::add_participant(const std::string& name) {
    auto it = std::find_if(participants.begin(), participants.end(),
        [&](const Participant& p) { return p.name == name; });
    if (it != participants.end()) return false;
    participants.push_back({name});
    return true;
}

std::vector<std::string> Conversation::participant_names() const {
    std::vector<std::string> names;
    names.reserve(participants.size());
    for (const auto& p : participants) names.push_back(p.name);
    return names;
}

nlohmann::ordered_json Conversation::to_json() const {
    nlohmann::ordered_json j;

    auto parts = nlohmann::ordered_json::array();
    for (const auto& p : participants) {
        parts.push_back({{"name", p.name}});
    }
    j["participants"] = std::move(parts);

    auto msgs = nlohmann::ordered_json::array();
    for (const auto& m : messages) {
        nlohmann::ordered_json jm;
        jm["sender_name"] = m.sender_name;
        jm["content"] = m.content;
        jm["timestamp_ms"] = m.timestamp_ms;
        msgs.push_back(std::move(jm));
    }
    j["messages"] = std::move(msgs);

    j["has_sender_info"] = has_sender_info;
    if (warning) j["warning"] = *warning;
    return j;
}

Conversation Conversation::from_json(const nlohmann::json& j) {
    Conversation conv;
    if (!j.is_object()) return conv;

    if (auto it = j.find("participants"); it != j.end() && it->is_array()) {
        for (const auto& p : *it) {
            if (p.is_object() && p.contains("name") && p["name"].is_string()) {
                conv.add_participant(p["name"].get<std::string>());
            }
        }
    }

    if (auto it = j.find("messages"); it != j.end() && it->is_array()) {
        conv.messages.reserve(it->size());
        for (const auto& m : *it) {
            if (!m.is_object()) continue;
            NormalizedMessage msg;
            msg.sender_name = string_field(m, "sender_name");
            msg.content = string_field(m, "content");
            msg.timestamp_ms = timestamp_field(m, "timestamp_ms");
            conv.messages.push_back(std::move(msg));
        }
    }

    if (auto it = j.find("has_sender_info"); it != j.end() && it->is_boolean()) {
        conv.has_sender_info = it->get<bool>();
    }
    if (auto it = j.find("warning"); it != j.end() && it->is_string()) {
        conv.warning = it->get<std::string>();
    }
    return conv;
}

nlohmann::ordered_json ConversationUnit::to_json() const {
    nlohmann::ordered_json j;
    j["folder_name"] = folder_name;
    j["display_name"] = display_name;
    j["path"] = path;
    j["participants"] = participant_preview;
    j["message_count"] = message_count;
    if (!channel_id.empty()) j["channel_id"] = channel_id;
    return j;
}

} // namespace chatingest
