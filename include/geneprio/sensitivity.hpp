#pragma once
// Weight-perturbation sensitivity sweep.
//
// For every (layer, delta) pair the baseline weights are perturbed and
// renormalized, genes are rescored and the perturbed top-N is compared with
// the baseline top-N. Spearman's rho is computed over the genes both lists
// share; below min_overlap the correlation is left absent instead of being
// reported from too few points. The p-value is advisory: its asymptotic
// approximation is unreliable for the few hundred genes a top-N holds.

#include "geneprio/scoring.hpp"

#include <optional>
#include <string>
#include <vector>

namespace geneprio {

struct SensitivityParams {
    std::vector<double> deltas = {-0.10, -0.05, 0.05, 0.10};
    size_t top_n = 100;
    size_t min_overlap = 10;
    double stability_threshold = 0.85;
    int threads = 0;                    // 0 = OpenMP default

    // Throws ConfigurationError
    void validate() const;
};

enum class Stability : uint8_t { STABLE, UNSTABLE, INDETERMINATE };

const char* stability_name(Stability s);

// Why a perturbation has no rho
enum class IndeterminateReason : uint8_t {
    NONE,
    INSUFFICIENT_OVERLAP,   // fewer shared top-N genes than min_overlap
    NO_RANK_VARIANCE,       // enough overlap, but one side's shared scores are all tied
};

const char* indeterminate_reason_name(IndeterminateReason r);

struct SensitivityResult {
    EvidenceLayer layer;
    double delta;
    ScoringWeights perturbed_weights;
    std::optional<double> spearman_rho;
    std::optional<double> spearman_pval;
    size_t overlap_count = 0;
    size_t top_n = 0;
    Stability stability = Stability::INDETERMINATE;
    IndeterminateReason reason = IndeterminateReason::NONE;
};

struct SensitivityAnalysis {
    ScoringWeights baseline_weights;
    size_t top_n = 0;
    std::vector<SensitivityResult> results;  // layer-major, deltas in configured order
};

// (gene_id, composite) for the n best-scoring genes, ties by gene_id
std::vector<std::pair<std::string, double>> top_n_scores(
    const std::vector<CompositeScoreRecord>& records, size_t n);

// Compare two top-N lists on their shared genes
SensitivityResult compare_rankings(const std::vector<std::pair<std::string, double>>& baseline,
                                   const std::vector<std::pair<std::string, double>>& perturbed,
                                   EvidenceLayer layer, double delta,
                                   const ScoringWeights& perturbed_weights,
                                   const SensitivityParams& params);

// Results do not depend on params.threads.
SensitivityAnalysis analyze(const std::vector<Gene>& genes,
                            const EvidenceMatrix& matrix,
                            const ScoringWeights& baseline,
                            const SensitivityParams& params);

SensitivityAnalysis analyze(const std::vector<Gene>& genes,
                            const EvidenceSet& evidence,
                            const ScoringWeights& baseline,
                            const SensitivityParams& params,
                            Diagnostics* diagnostics = nullptr);

struct LayerSensitivity {
    EvidenceLayer layer = EvidenceLayer::GNOMAD;
    size_t measured = 0;                // perturbations with a rho
    std::optional<double> mean_rho;
};

struct SensitivitySummary {
    double stability_threshold = 0.85;
    size_t total_perturbations = 0;
    size_t stable_count = 0;
    size_t unstable_count = 0;
    size_t indeterminate_count = 0;         // sum of the two counts below
    size_t insufficient_overlap_count = 0;
    size_t no_rank_variance_count = 0;
    std::optional<double> min_rho;
    std::optional<double> max_rho;
    std::optional<double> mean_rho;
    bool overall_stable = false;        // at least one rho and none below threshold
    std::optional<EvidenceLayer> most_sensitive_layer;  // lowest per-layer mean rho
    std::optional<EvidenceLayer> most_robust_layer;     // highest per-layer mean rho
    std::vector<LayerSensitivity> per_layer;
};

SensitivitySummary summarize(const SensitivityAnalysis& analysis, double stability_threshold);

}  // namespace geneprio
