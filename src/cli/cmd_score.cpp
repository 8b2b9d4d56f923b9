/**
 * @file cmd_score.cpp
 * @brief Composite scoring: per-gene scores, quality flags, tiers and the
 *        ranked candidate list.
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

int run_score(const Options& opts) {
    const auto t0 = std::chrono::steady_clock::now();
    Inputs in = load_inputs(opts);

    ScoringRun run = run_scoring(in.genes, in.evidence, in.config, std::move(in.diagnostics));
    const ScoringSummary summary = summarize_scores(run.records);
    const TierCounts tiers = count_tiers(run.records, in.config.tiers);

    const std::string scores_path = opts.output_prefix + ".scores.tsv";
    const std::string candidates_path = opts.output_prefix + ".candidates.tsv";
    write_file(scores_path, [&](std::ostream& out) {
        write_scores_tsv(out, run.records, in.config.tiers);
    });
    write_file(candidates_path, [&](std::ostream& out) {
        write_candidates_tsv(out, run.records, in.config.tiers);
    });

    std::cerr << "Scored " << summary.scored_genes << " of " << summary.total_genes
              << " genes (mean " << log_utils::format_optional(summary.mean_score)
              << ", median " << log_utils::format_optional(summary.median_score) << ")\n";
    std::cerr << "Quality flags: sufficient=" << summary.sufficient
              << " moderate=" << summary.moderate << " sparse=" << summary.sparse
              << " none=" << summary.none << "\n";
    std::cerr << "Tiers: HIGH=" << tiers.high << " MEDIUM=" << tiers.medium
              << " LOW=" << tiers.low << " (" << tiers.candidates << " candidates >= "
              << log_utils::format_fixed(in.config.tiers.candidate_min_score, 2) << ")\n";
    for (const auto& issue : run.diagnostics) {
        std::cerr << "Warning: [" << data_issue_kind_name(issue.kind) << "] " << issue.context
                  << ": " << issue.message << "\n";
    }
    std::cerr << "Wrote " << scores_path << " and " << candidates_path << "\n";
    if (opts.verbose) {
        std::cerr << "Done in " << log_utils::format_elapsed(t0, std::chrono::steady_clock::now())
                  << "\n";
    }
    return 0;
}

}  // namespace

int cmd_score(int argc, char* argv[]) {
    return run_command(Command::SCORE, argc, argv, run_score);
}

}  // namespace cli
}  // namespace geneprio
