#pragma once
// Two-stage duplicate check for one upload batch:
// first against the corpus as it was when the batch started, then against
// the files already accepted earlier in the same batch.
#include <string>

#include "fingerprint_engine.hpp"

namespace chatingest {

enum class DuplicateSource { NONE, CORPUS, BATCH };

struct GateVerdict {
    DuplicateSource source = DuplicateSource::NONE;
    std::string matched;
    double ratio = 0.0;

    [[nodiscard]] bool is_duplicate() const { return source != DuplicateSource::NONE; }

    // "Duplicate of <file>" / "Duplicate details in batch"; empty when accepted
    [[nodiscard]] std::string reason() const;
};

class DuplicateGate {
public:
    DuplicateGate(NamedFingerprints corpus, double threshold)
        : corpus_(std::move(corpus)), threshold_(threshold) {}

    [[nodiscard]] GateVerdict check(const FingerprintSet& fingerprints) const;

    // Registers an accepted file for the batch stage. Every call adds an entry,
    // so name it by something unique (the stored file name). Empty sets are not kept.
    void accept(const std::string& name, FingerprintSet fingerprints);

    [[nodiscard]] const NamedFingerprints& corpus() const { return corpus_; }
    [[nodiscard]] const NamedFingerprints& batch() const { return batch_; }
    [[nodiscard]] double threshold() const { return threshold_; }

private:
    NamedFingerprints corpus_;
    NamedFingerprints batch_;
    double threshold_;
};

} // namespace chatingest
