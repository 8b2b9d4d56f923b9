/**
 * @file cmd_validate.cpp
 * @brief Full validation: QC, tiering, positive/negative controls and the
 *        weight-perturbation sweep, rendered as a Markdown (and JSON) report.
 */

#include "inputs.hpp"
#include "geneprio/evidence_io.hpp"
#include "geneprio/log_utils.hpp"
#include "geneprio/pipeline.hpp"

#include <chrono>
#include <iostream>

namespace geneprio {
namespace cli {

namespace {

int run_validate(const Options& opts) {
    const auto t0 = std::chrono::steady_clock::now();
    Inputs in = load_inputs(opts);

    const auto positive_sets = resolve_control_sets(in.config.positive_sets,
                                                    builtin_positive_controls());
    const auto negative_sets = resolve_control_sets(in.config.negative_sets,
                                                    builtin_negative_controls());

    ScoringRun run = run_scoring(in.genes, in.evidence, in.config, std::move(in.diagnostics));
    if (opts.verbose) {
        std::cerr << "Scoring done in "
                  << log_utils::format_elapsed(t0, std::chrono::steady_clock::now()) << "\n";
        if (!opts.skip_sensitivity) {
            std::cerr << "Running " << NUM_LAYERS * in.config.sensitivity.deltas.size()
                      << " perturbations (top-N " << in.config.sensitivity.top_n << ")\n";
        }
    }

    const ValidationReport report = run_validation(in.genes, run, in.config, positive_sets,
                                                   negative_sets, !opts.skip_sensitivity);

    const std::string md_path = opts.output_prefix + ".validation.md";
    write_file(md_path, [&](std::ostream& out) { out << render_markdown(report); });
    if (opts.json) {
        write_file(opts.output_prefix + ".validation.json",
                   [&](std::ostream& out) { out << render_json(report) << "\n"; });
    }

    std::cerr << "Positive controls: " << validation_status_name(report.positive.status)
              << " (" << report.positive.total_found << "/" << report.positive.total_expected
              << " found, median percentile "
              << log_utils::format_optional(report.positive.median_percentile) << ")\n";
    std::cerr << "Negative controls: " << validation_status_name(report.negative.status)
              << " (" << report.negative.total_found << "/" << report.negative.total_expected
              << " found, median percentile "
              << log_utils::format_optional(report.negative.median_percentile) << ")\n";
    if (report.sensitivity) {
        const auto& s = report.sensitivity->summary;
        std::cerr << "Sensitivity: " << s.stable_count << " stable, " << s.unstable_count
                  << " unstable, " << s.insufficient_overlap_count << " insufficient overlap, "
                  << s.no_rank_variance_count << " tied top-N scores\n";
    }
    if (!report.qc.passed()) {
        std::cerr << "QC: " << report.qc.errors.size() << " error(s), "
                  << report.qc.warnings.size() << " warning(s) (advisory)\n";
    }
    if (!report.caveats.empty()) {
        std::cerr << report.caveats.size() << " data caveat(s) listed in the report\n";
    }
    std::cerr << "Verdict: " << verdict_name(report.verdict) << "\n";
    std::cerr << "Wrote " << md_path << "\n";
    if (opts.verbose) {
        std::cerr << "Done in " << log_utils::format_elapsed(t0, std::chrono::steady_clock::now())
                  << "\n";
    }
    return 0;
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {
    return run_command(Command::VALIDATE, argc, argv, run_validate);
}

}  // namespace cli
}  // namespace geneprio
