#include "fingerprint_engine.hpp"
#include "chat_parser.hpp"
#include "../utils/logger.hpp"
#include "../utils/sha256.hpp"

#include <algorithm>

namespace chatingest {

std::string FingerprintEngine::message_token(const NormalizedMessage& msg) {
    return SHA256::truncated_hex(msg.sender_name + ":" + msg.content, TOKEN_HEX_CHARS);
}

FingerprintSet FingerprintEngine::fingerprint(const Conversation& conv, size_t boundary) {
    FingerprintSet tokens;
    const auto& msgs = conv.messages;
    const size_t head = std::min(boundary, msgs.size());
    const size_t tail_start = msgs.size() > boundary ? msgs.size() - boundary : 0;

    auto add = [&tokens](const NormalizedMessage& m) {
        if (!m.content.empty()) tokens.insert(message_token(m));
    };
    for (size_t i = 0; i < head; ++i) add(msgs[i]);
    for (size_t i = tail_start; i < msgs.size(); ++i) add(msgs[i]);
    return tokens;
}

ReadResult<FingerprintSet> FingerprintEngine::fingerprint_checked(const std::string& path) const {
    auto format = classifier_.classify_checked(path);
    if (!format.ok()) return ReadResult<FingerprintSet>::failure(format.status, format.error);
    if (format.value == DetectedFormat::UNKNOWN) {
        return ReadResult<FingerprintSet>::failure(ReadStatus::MALFORMED,
            path + ": unrecognized chat format");
    }

    auto conv = ChatParser::load(path, format.value);
    if (!conv.ok()) return ReadResult<FingerprintSet>::failure(conv.status, conv.error);

    FingerprintSet tokens = fingerprint(conv.value, boundary_);
    bool empty = tokens.empty();
    return ReadResult<FingerprintSet>::success(std::move(tokens), empty);
}

FingerprintSet FingerprintEngine::fingerprint(const std::string& path) const {
    auto r = fingerprint_checked(path);
    if (!r.ok()) {
        LOG_WRN("[fingerprint] %s (%s), file is invisible to deduplication",
            r.error.c_str(), read_status_str(r.status));
        return {};
    }
    LOG_DBG("[fingerprint] %s: %zu tokens", path.c_str(), r.value.size());
    return std::move(r.value);
}

double FingerprintEngine::overlap_ratio(const FingerprintSet& a, const FingerprintSet& b) {
    if (a.empty() || b.empty()) return 0.0;

    // Both sets are ordered: linear merge count
    size_t common = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) ++ia;
        else if (*ib < *ia) ++ib;
        else { ++common; ++ia; ++ib; }
    }
    return static_cast<double>(common) / static_cast<double>(std::min(a.size(), b.size()));
}

OverlapVerdict FingerprintEngine::check_overlap(const FingerprintSet& new_set,
                                                const NamedFingerprints& candidates,
                                                double threshold) {
    OverlapVerdict verdict;
    if (new_set.empty()) return verdict;

    for (const auto& [name, existing] : candidates) {
        if (existing.empty()) continue;
        double ratio = overlap_ratio(new_set, existing);
        if (ratio >= threshold) {
            verdict.is_duplicate = true;
            verdict.matched = name;
            verdict.ratio = ratio;
            return verdict;
        }
    }
    return verdict;
}

} // namespace chatingest
