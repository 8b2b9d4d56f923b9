// tests/test_tiers.cpp
//
// Confidence tiers:
//   T1: score and breadth cutoffs, boundaries inclusive
//   T2: absent composite is always LOW and never a candidate
//   T3: candidate floor and tier counts
//   T4: threshold validation

#include "geneprio/tiers.hpp"

#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using geneprio::Tier;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

geneprio::CompositeScoreRecord rec(std::optional<double> score, uint32_t evidence) {
    geneprio::CompositeScoreRecord r;
    r.gene_id = "ENSG";
    r.gene_symbol = "SYM";
    r.composite_score = score;
    r.evidence_count = evidence;
    return r;
}

int test_cutoffs() {
    std::cout << "[T1] score and breadth cutoffs\n";
    int failed = 0;
    const geneprio::TierThresholds t;

    expect(geneprio::classify(rec(0.75, 3), t) == Tier::HIGH, "0.75 / 3 -> HIGH", failed);
    expect(geneprio::classify(rec(0.70, 3), t) == Tier::HIGH, "0.70 / 3 -> HIGH (inclusive)",
           failed);
    expect(geneprio::classify(rec(0.95, 2), t) == Tier::MEDIUM,
           "high score with 2 layers -> MEDIUM", failed);
    expect(geneprio::classify(rec(0.40, 2), t) == Tier::MEDIUM, "0.40 / 2 -> MEDIUM (inclusive)",
           failed);
    expect(geneprio::classify(rec(0.39, 5), t) == Tier::LOW, "0.39 -> LOW", failed);
    expect(geneprio::classify(rec(0.99, 1), t) == Tier::LOW,
           "single strong layer cannot reach HIGH or MEDIUM", failed);

    expect(std::strcmp(geneprio::tier_name(Tier::HIGH), "HIGH") == 0, "tier name", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_absent_score() {
    std::cout << "[T2] absent composite\n";
    int failed = 0;
    const geneprio::TierThresholds t;

    expect(geneprio::classify(rec(std::nullopt, 0), t) == Tier::LOW, "absent -> LOW", failed);
    expect(!geneprio::is_candidate(rec(std::nullopt, 0), t), "absent never a candidate", failed);

    geneprio::TierThresholds lax;
    lax.high_score = 0.0;
    lax.high_min_evidence = 0;
    lax.medium_score = 0.0;
    lax.medium_min_evidence = 0;
    lax.candidate_min_score = 0.0;
    expect(geneprio::classify(rec(std::nullopt, 0), lax) == Tier::LOW,
           "absent stays LOW under zero cutoffs", failed);
    expect(!geneprio::is_candidate(rec(std::nullopt, 0), lax),
           "absent not a candidate under zero floor", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_candidates_and_counts() {
    std::cout << "[T3] candidate floor and counts\n";
    int failed = 0;
    const geneprio::TierThresholds t;

    expect(geneprio::is_candidate(rec(0.20, 1), t), "0.20 meets the floor", failed);
    expect(!geneprio::is_candidate(rec(0.19, 6), t), "0.19 below the floor", failed);

    const std::vector<geneprio::CompositeScoreRecord> recs = {
        rec(0.8, 4), rec(0.72, 3), rec(0.5, 2), rec(0.3, 1), rec(0.1, 1), rec(std::nullopt, 0)};
    const auto tiers = geneprio::classify_all(recs, t);
    expect(tiers.size() == 6 && tiers[0] == Tier::HIGH && tiers[2] == Tier::MEDIUM &&
               tiers[5] == Tier::LOW,
           "classify_all keeps input order", failed);

    const auto c = geneprio::count_tiers(recs, t);
    expect(c.high == 2 && c.medium == 1 && c.low == 3, "tier counts", failed);
    expect(c.candidates == 4, "candidates: got " + std::to_string(c.candidates), failed);
    expect(c.total() == recs.size(), "every gene in exactly one tier", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_validation() {
    std::cout << "[T4] threshold validation\n";
    int failed = 0;

    auto throws = [](const geneprio::TierThresholds& t) {
        try {
            t.validate();
        } catch (const geneprio::ConfigurationError&) {
            return true;
        }
        return false;
    };

    geneprio::TierThresholds t;
    expect(!throws(t), "defaults valid", failed);

    t.high_score = 1.2;
    expect(throws(t), "high_score above 1 rejected", failed);

    t = {};
    t.medium_score = 0.8;
    expect(throws(t), "medium above high rejected", failed);

    t = {};
    t.high_min_evidence = 7;
    expect(throws(t), "breadth above 6 rejected", failed);

    t = {};
    t.medium_min_evidence = 4;
    expect(throws(t), "medium breadth above high breadth rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_cutoffs();
    total += test_absent_score();
    total += test_candidates_and_counts();
    total += test_validation();

    if (total == 0) {
        std::cout << "\nAll tier tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
