#include "geneprio/tiers.hpp"

#include <cmath>

namespace geneprio {

const char* tier_name(Tier tier) {
    switch (tier) {
        case Tier::HIGH: return "HIGH";
        case Tier::MEDIUM: return "MEDIUM";
        case Tier::LOW: return "LOW";
    }
    return "UNKNOWN";
}

namespace {

void check_score(const char* key, double v) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        throw ConfigurationError(std::string("tiers.") + key + " must be in [0,1], got " +
                                 std::to_string(v));
    }
}

void check_breadth(const char* key, uint32_t v) {
    if (v > NUM_LAYERS) {
        throw ConfigurationError(std::string("tiers.") + key + " must be in 0.." +
                                 std::to_string(NUM_LAYERS) + ", got " + std::to_string(v));
    }
}

}  // namespace

void TierThresholds::validate() const {
    check_score("high_score", high_score);
    check_score("medium_score", medium_score);
    check_score("candidate_min_score", candidate_min_score);
    check_breadth("high_min_evidence", high_min_evidence);
    check_breadth("medium_min_evidence", medium_min_evidence);
    if (medium_score > high_score) {
        throw ConfigurationError("tiers.medium_score cannot exceed tiers.high_score");
    }
    if (medium_min_evidence > high_min_evidence) {
        throw ConfigurationError(
            "tiers.medium_min_evidence cannot exceed tiers.high_min_evidence");
    }
}

Tier classify(const CompositeScoreRecord& record, const TierThresholds& t) {
    if (!record.composite_score) return Tier::LOW;
    const double s = *record.composite_score;
    if (s >= t.high_score && record.evidence_count >= t.high_min_evidence) return Tier::HIGH;
    if (s >= t.medium_score && record.evidence_count >= t.medium_min_evidence) return Tier::MEDIUM;
    return Tier::LOW;
}

bool is_candidate(const CompositeScoreRecord& record, const TierThresholds& t) {
    return record.composite_score && *record.composite_score >= t.candidate_min_score;
}

std::vector<Tier> classify_all(const std::vector<CompositeScoreRecord>& records,
                               const TierThresholds& t) {
    std::vector<Tier> tiers;
    tiers.reserve(records.size());
    for (const auto& r : records) tiers.push_back(classify(r, t));
    return tiers;
}

TierCounts count_tiers(const std::vector<CompositeScoreRecord>& records,
                       const TierThresholds& t) {
    TierCounts c;
    for (const auto& r : records) {
        switch (classify(r, t)) {
            case Tier::HIGH: ++c.high; break;
            case Tier::MEDIUM: ++c.medium; break;
            case Tier::LOW: ++c.low; break;
        }
        if (is_candidate(r, t)) ++c.candidates;
    }
    return c;
}

}  // namespace geneprio
