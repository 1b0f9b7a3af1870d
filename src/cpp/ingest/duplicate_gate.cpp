#include "duplicate_gate.hpp"
#include "../utils/logger.hpp"

#include <utility>

namespace chatingest {

std::string GateVerdict::reason() const {
    switch (source) {
        case DuplicateSource::CORPUS: return "Duplicate of " + matched;
        case DuplicateSource::BATCH:  return "Duplicate details in batch";
        case DuplicateSource::NONE:   break;
    }
    return "";
}

GateVerdict DuplicateGate::check(const FingerprintSet& fingerprints) const {
    GateVerdict verdict;

    auto corpus_hit = FingerprintEngine::check_overlap(fingerprints, corpus_, threshold_);
    if (corpus_hit.is_duplicate) {
        verdict.source = DuplicateSource::CORPUS;
        verdict.matched = *corpus_hit.matched;
        verdict.ratio = corpus_hit.ratio;
        LOG_INF("[gate] Corpus duplicate of %s (overlap %.2f)", verdict.matched.c_str(), verdict.ratio);
        return verdict;
    }

    auto batch_hit = FingerprintEngine::check_overlap(fingerprints, batch_, threshold_);
    if (batch_hit.is_duplicate) {
        verdict.source = DuplicateSource::BATCH;
        verdict.matched = *batch_hit.matched;
        verdict.ratio = batch_hit.ratio;
        LOG_INF("[gate] Batch duplicate of %s (overlap %.2f)", verdict.matched.c_str(), verdict.ratio);
    }
    return verdict;
}

void DuplicateGate::accept(const std::string& name, FingerprintSet fingerprints) {
    if (fingerprints.empty()) return;
    batch_.emplace_back(name, std::move(fingerprints));
}

} // namespace chatingest
