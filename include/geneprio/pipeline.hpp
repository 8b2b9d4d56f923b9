#pragma once
// End-to-end orchestration shared by the CLI subcommands and the
// integration tests: score once, then derive QC, tiers, control validation
// and the optional sensitivity sweep from the same baseline.

#include "geneprio/config.hpp"
#include "geneprio/validation_report.hpp"

#include <string>
#include <vector>

namespace geneprio {

struct ScoringRun {
    EvidenceMatrix matrix;
    std::vector<CompositeScoreRecord> records;  // universe order
    Diagnostics diagnostics;
};

// Diagnostics passed in (e.g. from the readers) are carried into the run.
ScoringRun run_scoring(const std::vector<Gene>& genes,
                       const EvidenceSet& evidence,
                       const PipelineConfig& config,
                       Diagnostics diagnostics = {});

// Control-set files from `paths`, or `builtin` when none are given
std::vector<ControlSet> resolve_control_sets(const std::vector<std::string>& paths,
                                             std::vector<ControlSet> builtin);

ValidationReport run_validation(const std::vector<Gene>& genes,
                                const ScoringRun& run,
                                const PipelineConfig& config,
                                const std::vector<ControlSet>& positive_sets,
                                const std::vector<ControlSet>& negative_sets,
                                bool with_sensitivity);

}  // namespace geneprio
