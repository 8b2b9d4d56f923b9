#include "geneprio/sensitivity.hpp"
#include "geneprio/stats.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace geneprio {

void SensitivityParams::validate() const {
    if (deltas.empty()) {
        throw ConfigurationError("sensitivity.deltas must not be empty");
    }
    for (double d : deltas) {
        if (!std::isfinite(d) || d < -1.0 || d > 1.0) {
            throw ConfigurationError("sensitivity.deltas must be finite values in [-1,1]");
        }
    }
    if (top_n == 0) {
        throw ConfigurationError("sensitivity.top_n must be positive");
    }
    if (min_overlap < 3) {
        throw ConfigurationError("sensitivity.min_overlap must be at least 3");
    }
    if (!std::isfinite(stability_threshold) || stability_threshold < -1.0 ||
        stability_threshold > 1.0) {
        throw ConfigurationError("sensitivity.stability_threshold must be in [-1,1]");
    }
    if (threads < 0) {
        throw ConfigurationError("thread count cannot be negative");
    }
}

const char* stability_name(Stability s) {
    switch (s) {
        case Stability::STABLE: return "stable";
        case Stability::UNSTABLE: return "unstable";
        case Stability::INDETERMINATE: return "indeterminate";
    }
    return "unknown";
}

const char* indeterminate_reason_name(IndeterminateReason r) {
    switch (r) {
        case IndeterminateReason::NONE: return "none";
        case IndeterminateReason::INSUFFICIENT_OVERLAP: return "insufficient_overlap";
        case IndeterminateReason::NO_RANK_VARIANCE: return "no_rank_variance";
    }
    return "unknown";
}

std::vector<std::pair<std::string, double>> top_n_scores(
    const std::vector<CompositeScoreRecord>& records, size_t n) {
    const std::vector<size_t> order = rank_by_score(records);
    std::vector<std::pair<std::string, double>> top;
    top.reserve(std::min(n, order.size()));
    for (size_t i = 0; i < order.size() && i < n; ++i) {
        top.emplace_back(records[order[i]].gene_id, *records[order[i]].composite_score);
    }
    return top;
}

SensitivityResult compare_rankings(const std::vector<std::pair<std::string, double>>& baseline,
                                   const std::vector<std::pair<std::string, double>>& perturbed,
                                   EvidenceLayer layer, double delta,
                                   const ScoringWeights& perturbed_weights,
                                   const SensitivityParams& params) {
    SensitivityResult r{layer, delta, perturbed_weights, std::nullopt, std::nullopt, 0,
                        params.top_n, Stability::INDETERMINATE, IndeterminateReason::NONE};

    std::unordered_map<std::string, double> perturbed_by_id(perturbed.begin(), perturbed.end());
    std::vector<double> x;
    std::vector<double> y;
    // Baseline order keeps the paired series deterministic
    for (const auto& [gene_id, score] : baseline) {
        auto it = perturbed_by_id.find(gene_id);
        if (it == perturbed_by_id.end()) continue;
        x.push_back(score);
        y.push_back(it->second);
    }
    r.overlap_count = x.size();
    if (r.overlap_count < params.min_overlap) {
        r.reason = IndeterminateReason::INSUFFICIENT_OVERLAP;
        return r;
    }

    // min_overlap >= 3, so an absent result here means a constant series
    if (auto sp = stats::spearman(x, y)) {
        r.spearman_rho = sp->rho;
        r.spearman_pval = sp->p_value;
        r.stability = sp->rho >= params.stability_threshold ? Stability::STABLE
                                                            : Stability::UNSTABLE;
    } else {
        r.reason = IndeterminateReason::NO_RANK_VARIANCE;
    }
    return r;
}

SensitivityAnalysis analyze(const std::vector<Gene>& genes,
                            const EvidenceMatrix& matrix,
                            const ScoringWeights& baseline,
                            const SensitivityParams& params) {
    params.validate();

    const auto baseline_top = top_n_scores(score_genes(genes, matrix, baseline), params.top_n);

    const size_t n_deltas = params.deltas.size();
    const size_t n_jobs = NUM_LAYERS * n_deltas;

    // Weights are computed up front so invalid perturbations surface here
    std::vector<ScoringWeights> perturbed;
    perturbed.reserve(n_jobs);
    for (EvidenceLayer layer : ALL_LAYERS) {
        for (double delta : params.deltas) perturbed.push_back(perturb(baseline, layer, delta));
    }

    // One slot per job keeps output order independent of scheduling
    std::vector<std::optional<SensitivityResult>> slots(n_jobs);

    int runtime_threads = 1;
#ifdef _OPENMP
    runtime_threads = (params.threads > 0) ? params.threads : std::max(1, omp_get_max_threads());
#endif
    (void)runtime_threads;

    #pragma omp parallel for schedule(dynamic) num_threads(runtime_threads)
    for (size_t job = 0; job < n_jobs; ++job) {
        const EvidenceLayer layer = ALL_LAYERS[job / n_deltas];
        const double delta = params.deltas[job % n_deltas];
        const auto top = top_n_scores(score_genes(genes, matrix, perturbed[job]), params.top_n);
        slots[job] = compare_rankings(baseline_top, top, layer, delta, perturbed[job], params);
    }

    SensitivityAnalysis out{baseline, params.top_n, {}};
    out.results.reserve(n_jobs);
    for (auto& slot : slots) out.results.push_back(std::move(*slot));
    return out;
}

SensitivityAnalysis analyze(const std::vector<Gene>& genes,
                            const EvidenceSet& evidence,
                            const ScoringWeights& baseline,
                            const SensitivityParams& params,
                            Diagnostics* diagnostics) {
    return analyze(genes, build_evidence_matrix(genes, evidence, diagnostics), baseline, params);
}

SensitivitySummary summarize(const SensitivityAnalysis& analysis, double stability_threshold) {
    SensitivitySummary s;
    s.stability_threshold = stability_threshold;
    s.total_perturbations = analysis.results.size();

    double sum = 0.0;
    size_t measured = 0;
    bool all_stable = true;
    LayerArray<double> layer_sum{};
    LayerArray<size_t> layer_n{};

    for (const auto& r : analysis.results) {
        if (!r.spearman_rho) {
            ++s.indeterminate_count;
            if (r.reason == IndeterminateReason::NO_RANK_VARIANCE) {
                ++s.no_rank_variance_count;
            } else {
                ++s.insufficient_overlap_count;
            }
            continue;
        }
        const double rho = *r.spearman_rho;
        ++measured;
        sum += rho;
        s.min_rho = s.min_rho ? std::min(*s.min_rho, rho) : rho;
        s.max_rho = s.max_rho ? std::max(*s.max_rho, rho) : rho;
        if (rho >= stability_threshold) {
            ++s.stable_count;
        } else {
            ++s.unstable_count;
            all_stable = false;
        }
        layer_sum[layer_index(r.layer)] += rho;
        ++layer_n[layer_index(r.layer)];
    }
    if (measured > 0) s.mean_rho = sum / static_cast<double>(measured);
    s.overall_stable = measured > 0 && all_stable;

    for (EvidenceLayer layer : ALL_LAYERS) {
        const size_t li = layer_index(layer);
        LayerSensitivity ls;
        ls.layer = layer;
        ls.measured = layer_n[li];
        if (layer_n[li] > 0) ls.mean_rho = layer_sum[li] / static_cast<double>(layer_n[li]);
        s.per_layer.push_back(ls);

        if (!ls.mean_rho) continue;
        if (!s.most_sensitive_layer ||
            *ls.mean_rho < *s.per_layer[layer_index(*s.most_sensitive_layer)].mean_rho) {
            s.most_sensitive_layer = layer;
        }
        if (!s.most_robust_layer ||
            *ls.mean_rho > *s.per_layer[layer_index(*s.most_robust_layer)].mean_rho) {
            s.most_robust_layer = layer;
        }
    }
    return s;
}

}  // namespace geneprio
