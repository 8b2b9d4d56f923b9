#include "geneprio/pipeline.hpp"
#include "geneprio/evidence_io.hpp"

namespace geneprio {

ScoringRun run_scoring(const std::vector<Gene>& genes,
                       const EvidenceSet& evidence,
                       const PipelineConfig& config,
                       Diagnostics diagnostics) {
    ScoringRun run;
    run.diagnostics = std::move(diagnostics);
    run.matrix = build_evidence_matrix(genes, evidence, &run.diagnostics);
    run.records = score_genes(genes, run.matrix, config.weights, config.quality_flags);
    return run;
}

std::vector<ControlSet> resolve_control_sets(const std::vector<std::string>& paths,
                                             std::vector<ControlSet> builtin) {
    if (paths.empty()) return builtin;
    std::vector<ControlSet> sets;
    for (const auto& path : paths) {
        auto loaded = read_control_sets(path);
        sets.insert(sets.end(), loaded.begin(), loaded.end());
    }
    return sets;
}

ValidationReport run_validation(const std::vector<Gene>& genes,
                                const ScoringRun& run,
                                const PipelineConfig& config,
                                const std::vector<ControlSet>& positive_sets,
                                const std::vector<ControlSet>& negative_sets,
                                bool with_sensitivity) {
    Diagnostics diagnostics = run.diagnostics;

    const QCReport qc = run_qc(run.records, config.qc, diagnostics);

    // Tiers and ranks are reported on one canonical record per symbol
    const PercentileRanking ranking(run.records);
    const TierCounts tiers = count_tiers(ranking.records(), config.tiers);

    const auto positive = validate_positive_controls(ranking, positive_sets, config.controls,
                                                     config.tiers, &diagnostics);
    const auto negative = validate_negative_controls(ranking, negative_sets, config.controls,
                                                     config.tiers, &diagnostics);

    std::optional<SensitivitySection> sensitivity;
    if (with_sensitivity) {
        SensitivityAnalysis analysis = analyze(genes, run.matrix, config.weights,
                                               config.sensitivity);
        SensitivitySummary summary = summarize(analysis, config.sensitivity.stability_threshold);
        sensitivity = SensitivitySection{std::move(analysis), std::move(summary)};
    }

    return build_report(qc, tiers, positive, negative, std::move(sensitivity), diagnostics);
}

}  // namespace geneprio
