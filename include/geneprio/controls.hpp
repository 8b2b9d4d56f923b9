#pragma once
// Positive and negative control validation.
//
// Both directions share one ranking primitive (PercentileRanking) built over
// the canonical per-symbol records that carry a composite score:
//
//   percentile(g) = average_rank(g) / n
//
// where average_rank is the 1-based ascending rank with ties sharing the
// mean position, so a percentile is the fraction of genes scoring equal or
// lower. Positive controls pass when their median percentile reaches
// positive_percentile; negative controls pass when theirs stays below
// negative_percentile.

#include "geneprio/scoring.hpp"
#include "geneprio/tiers.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace geneprio {

struct ControlSet {
    std::string name;
    std::string source;                 // provenance tag used for per-source breakdown
    std::vector<std::string> symbols;
};

// Reference sets compiled from static data
ControlSet omim_usher_genes();
ControlSet syscilia_core_genes();
ControlSet housekeeping_genes();

std::vector<ControlSet> builtin_positive_controls();
std::vector<ControlSet> builtin_negative_controls();

struct RankedGene {
    size_t record = 0;          // index into PercentileRanking::records()
    double composite_score = 0.0;
    double percentile = 0.0;    // (0, 1]
    size_t rank = 0;            // 1-based, highest score first, gene_id breaks ties
};

class PercentileRanking {
public:
    explicit PercentileRanking(const std::vector<CompositeScoreRecord>& records);

    size_t size() const { return ranked_.size(); }

    // Highest score first
    const std::vector<RankedGene>& ranked() const { return ranked_; }

    // Canonical records (one per symbol), including those without a score
    const std::vector<CompositeScoreRecord>& records() const { return canonical_; }

    // nullptr if the symbol has no scored record
    const RankedGene* find(const std::string& symbol) const;

private:
    std::vector<CompositeScoreRecord> canonical_;
    std::vector<RankedGene> ranked_;
    std::unordered_map<std::string, size_t> by_symbol_;
};

struct ControlParams {
    double positive_percentile = 0.75;
    double negative_percentile = 0.50;
    double top_quartile = 0.75;
    std::vector<size_t> recall_k = {100, 500, 1000, 2000};
    std::vector<double> recall_fractions = {0.05, 0.10, 0.20};
    size_t max_details = 20;

    // Throws ConfigurationError
    void validate() const;
};

enum class ValidationStatus : uint8_t { PASSED, FAILED, INDETERMINATE };

const char* validation_status_name(ValidationStatus status);

struct RecallAtK {
    std::string label;          // "100" or "5%"
    size_t k = 0;               // effective cutoff, clamped to the population
    size_t hits = 0;
    std::optional<double> recall;   // absent when no control is present
};

struct ControlGeneDetail {
    std::string gene_symbol;
    std::string gene_id;
    std::string sources;        // comma-separated when listed by several sets
    double composite_score = 0.0;
    double percentile = 0.0;
    size_t rank = 0;
    uint32_t evidence_count = 0;
    Tier tier = Tier::LOW;
};

struct SourceBreakdown {
    std::string source;
    size_t expected = 0;
    size_t found = 0;
    std::optional<double> median_percentile;
    size_t top_quartile_count = 0;
    std::vector<RecallAtK> recall;
};

// Mean present layer score of found controls minus the population mean
struct LayerElevation {
    EvidenceLayer layer = EvidenceLayer::GNOMAD;
    size_t controls_with_layer = 0;
    std::optional<double> control_mean;
    std::optional<double> population_mean;
    std::optional<double> elevation;
};

struct ControlValidationResult {
    bool positive = true;
    double threshold = 0.0;
    size_t total_expected = 0;           // unique symbols across all sets
    size_t total_found = 0;
    std::vector<std::string> missing_symbols;
    std::optional<double> median_percentile;
    size_t top_quartile_count = 0;
    std::optional<double> top_quartile_fraction;
    size_t high_tier_count = 0;
    ValidationStatus status = ValidationStatus::INDETERMINATE;
    std::vector<RecallAtK> recall;
    std::vector<SourceBreakdown> per_source;
    std::vector<ControlGeneDetail> details;  // best-ranked first for positive, worst first for negative
    std::vector<LayerElevation> elevation;
};

// |controls in top-k| / |controls present|; k is clamped to the population
RecallAtK recall_at_k(const PercentileRanking& ranking,
                      const std::vector<const RankedGene*>& controls,
                      size_t k, const std::string& label);

// Absolute cutoffs followed by population fractions
std::vector<RecallAtK> recall_table(const PercentileRanking& ranking,
                                    const std::vector<const RankedGene*>& controls,
                                    const ControlParams& params);

// Symbols that are absent from the ranking are recorded in `diagnostics`
// as CONTROL_GENE_MISSING.
ControlValidationResult validate_positive_controls(const PercentileRanking& ranking,
                                                   const std::vector<ControlSet>& sets,
                                                   const ControlParams& params,
                                                   const TierThresholds& tiers,
                                                   Diagnostics* diagnostics = nullptr);

ControlValidationResult validate_negative_controls(const PercentileRanking& ranking,
                                                   const std::vector<ControlSet>& sets,
                                                   const ControlParams& params,
                                                   const TierThresholds& tiers,
                                                   Diagnostics* diagnostics = nullptr);

}  // namespace geneprio
