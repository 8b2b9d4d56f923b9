#pragma once
// Confidence tiers from (composite score, evidence breadth).
//
// HIGH needs both a high score and a minimum number of supporting layers, so
// a single lucky layer cannot reach the top tier. Genes without a composite
// score are always LOW.

#include "geneprio/scoring.hpp"

#include <cstdint>
#include <vector>

namespace geneprio {

enum class Tier : uint8_t { HIGH, MEDIUM, LOW };

const char* tier_name(Tier tier);

struct TierThresholds {
    double high_score = 0.70;
    uint32_t high_min_evidence = 3;
    double medium_score = 0.40;
    uint32_t medium_min_evidence = 2;
    double candidate_min_score = 0.20;  // floor for the candidate list

    // Throws ConfigurationError for scores outside [0,1], breadth outside
    // 0..6, or medium cutoffs stricter than high ones.
    void validate() const;
};

Tier classify(const CompositeScoreRecord& record, const TierThresholds& t);

// Candidate list membership: composite present and >= candidate_min_score
bool is_candidate(const CompositeScoreRecord& record, const TierThresholds& t);

struct TierCounts {
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
    size_t candidates = 0;

    size_t total() const { return high + medium + low; }
};

std::vector<Tier> classify_all(const std::vector<CompositeScoreRecord>& records,
                               const TierThresholds& t);

TierCounts count_tiers(const std::vector<CompositeScoreRecord>& records,
                       const TierThresholds& t);

}  // namespace geneprio
