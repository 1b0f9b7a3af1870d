#pragma once
// =============================================================================
// Fingerprint Engine -- boundary-sample content fingerprints
//
// A conversation is represented by its first n and last n messages. Each one
// with non-empty content contributes the first 12 hex characters of
// SHA-256(sender_name + ":" + content). Overlapping boundaries (fewer than 2n
// messages) collapse through set semantics.
//
// Overlap between two sets is |A & B| / min(|A|, |B|), so a small set that is
// fully contained in a large one counts as a duplicate.
// =============================================================================

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "conversation.hpp"
#include "format_classifier.hpp"

namespace chatingest {

struct OverlapVerdict {
    bool is_duplicate = false;
    std::optional<std::string> matched;   // Name of the first candidate over the threshold
    double ratio = 0.0;                   // Ratio against the matched candidate
};

using NamedFingerprints = std::vector<std::pair<std::string, FingerprintSet>>;

class FingerprintEngine {
public:
    static constexpr size_t DEFAULT_BOUNDARY = 20;
    static constexpr size_t TOKEN_HEX_CHARS = 12;
    static constexpr double DEFAULT_THRESHOLD = 0.8;

    explicit FingerprintEngine(FormatClassifier classifier = FormatClassifier(),
                               size_t boundary = DEFAULT_BOUNDARY)
        : classifier_(classifier), boundary_(boundary) {}

    // Fail-open: anything that cannot be classified or parsed gives an empty set
    [[nodiscard]] FingerprintSet fingerprint(const std::string& path) const;

    [[nodiscard]] ReadResult<FingerprintSet> fingerprint_checked(const std::string& path) const;

    [[nodiscard]] FingerprintSet fingerprint(const Conversation& conv) const {
        return fingerprint(conv, boundary_);
    }

    static FingerprintSet fingerprint(const Conversation& conv, size_t boundary);

    static std::string message_token(const NormalizedMessage& msg);

    static double overlap_ratio(const FingerprintSet& a, const FingerprintSet& b);

    // First candidate (in the given order) at or above threshold wins.
    // An empty new set never matches; empty candidates are skipped.
    static OverlapVerdict check_overlap(const FingerprintSet& new_set,
                                        const NamedFingerprints& candidates,
                                        double threshold = DEFAULT_THRESHOLD);

    [[nodiscard]] size_t boundary() const { return boundary_; }
    [[nodiscard]] const FormatClassifier& classifier() const { return classifier_; }

private:
    FormatClassifier classifier_;
    size_t boundary_;
};

} // namespace chatingest
