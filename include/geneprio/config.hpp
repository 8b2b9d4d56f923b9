#pragma once
// Run configuration: weights and every threshold, loaded from a JSON file.
// Every key is optional and falls back to the defaults of the parameter
// structs; unknown sections or keys are rejected.

#include "geneprio/controls.hpp"
#include "geneprio/quality_control.hpp"
#include "geneprio/scoring.hpp"
#include "geneprio/sensitivity.hpp"
#include "geneprio/tiers.hpp"
#include "geneprio/weights.hpp"

#include <string>
#include <vector>

namespace geneprio {

struct PipelineConfig {
    ScoringWeights weights = ScoringWeights::defaults();
    QualityFlagThresholds quality_flags;
    TierThresholds tiers;
    QCParams qc;
    ControlParams controls;
    std::vector<std::string> positive_sets;   // control-set TSV paths, empty = built-in
    std::vector<std::string> negative_sets;
    SensitivityParams sensitivity;

    // Validates every section; throws ConfigurationError
    void validate() const;
};

// Parse and validate JSON text. `origin` names the source in error messages.
PipelineConfig parse_config(const std::string& text, const std::string& origin = "<config>");

// Throws ConfigurationError if the file cannot be read or is invalid
PipelineConfig load_config(const std::string& path);

}  // namespace geneprio
