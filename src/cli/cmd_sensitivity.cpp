/**
 * @file cmd_sensitivity.cpp
 * @brief Weight-perturbation sweep: Spearman rank stability of the top-N
 *        under every (layer, delta) perturbation.
 */

#include "inputs.hpp"
#include "geneprio/evidence_io.hpp"
#include "geneprio/log_utils.hpp"
#include "geneprio/sensitivity.hpp"

#include <chrono>
#include <iostream>

namespace geneprio {
namespace cli {

namespace {

int run_sensitivity(const Options& opts) {
    const auto t0 = std::chrono::steady_clock::now();
    Inputs in = load_inputs(opts);

    const SensitivityAnalysis analysis = analyze(in.genes, in.evidence, in.config.weights,
                                                 in.config.sensitivity, &in.diagnostics);
    const SensitivitySummary summary =
        summarize(analysis, in.config.sensitivity.stability_threshold);

    const std::string path = opts.output_prefix + ".sensitivity.tsv";
    write_file(path, [&](std::ostream& out) { write_sensitivity_tsv(out, analysis); });

    std::cerr << "Perturbations: " << summary.total_perturbations << " (" << summary.stable_count
              << " stable, " << summary.unstable_count << " unstable, "
              << summary.insufficient_overlap_count << " insufficient overlap, "
              << summary.no_rank_variance_count << " tied top-N scores)\n";
    std::cerr << "Spearman rho: mean " << log_utils::format_optional(summary.mean_rho)
              << ", min " << log_utils::format_optional(summary.min_rho)
              << ", max " << log_utils::format_optional(summary.max_rho) << "\n";
    if (summary.most_sensitive_layer && summary.most_robust_layer) {
        std::cerr << "Most sensitive layer: " << layer_name(*summary.most_sensitive_layer)
                  << ", most robust: " << layer_name(*summary.most_robust_layer) << "\n";
    }
    for (const auto& issue : in.diagnostics) {
        std::cerr << "Warning: [" << data_issue_kind_name(issue.kind) << "] " << issue.context
                  << ": " << issue.message << "\n";
    }
    std::cerr << "Overall: " << (summary.overall_stable ? "STABLE" : "NOT STABLE") << "\n";
    std::cerr << "Wrote " << path << "\n";
    if (opts.verbose) {
        std::cerr << "Done in " << log_utils::format_elapsed(t0, std::chrono::steady_clock::now())
                  << "\n";
    }
    return 0;
}

}  // namespace

int cmd_sensitivity(int argc, char* argv[]) {
    return run_command(Command::SENSITIVITY, argc, argv, run_sensitivity);
}

}  // namespace cli
}  // namespace geneprio
