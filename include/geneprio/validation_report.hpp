#pragma once
// Aggregates QC, tiering, control validation and sensitivity results into an
// overall verdict plus non-binding weight-tuning guidance.
//
// Verdict table:
//   positive indeterminate                        -> INCONCLUSIVE
//   positive failed                               -> FAIL
//   positive + negative passed, sweep stable      -> PASS
//   positive passed, anything else short of that  -> PARTIAL
// QC findings and data issues are reported as caveats and never change the
// verdict.

#include "geneprio/controls.hpp"
#include "geneprio/quality_control.hpp"
#include "geneprio/sensitivity.hpp"
#include "geneprio/tiers.hpp"

#include <optional>
#include <string>
#include <vector>

namespace geneprio {

enum class Verdict : uint8_t { PASS, PARTIAL, FAIL, INCONCLUSIVE };

const char* verdict_name(Verdict v);

// Attached to every recommendation
extern const char* const CIRCULARITY_WARNING;

struct Recommendation {
    std::string title;
    std::string rationale;
    std::vector<std::string> actions;
    std::string warning = CIRCULARITY_WARNING;
};

struct SensitivitySection {
    SensitivityAnalysis analysis;
    SensitivitySummary summary;
};

struct ValidationReport {
    Verdict verdict = Verdict::INCONCLUSIVE;
    std::string verdict_reason;
    QCReport qc;
    TierCounts tiers;
    ControlValidationResult positive;
    ControlValidationResult negative;
    std::optional<SensitivitySection> sensitivity;  // absent when the sweep was skipped
    Diagnostics caveats;
    std::vector<Recommendation> recommendations;
};

Verdict decide_verdict(ValidationStatus positive, ValidationStatus negative,
                       const std::optional<SensitivitySummary>& sensitivity);

std::vector<Recommendation> recommend_weight_tuning(
    const ControlValidationResult& positive,
    const ControlValidationResult& negative,
    const std::optional<SensitivitySummary>& sensitivity);

ValidationReport build_report(const QCReport& qc,
                              const TierCounts& tiers,
                              const ControlValidationResult& positive,
                              const ControlValidationResult& negative,
                              std::optional<SensitivitySection> sensitivity,
                              const Diagnostics& diagnostics);

std::string render_markdown(const ValidationReport& report);

// Pretty-printed JSON with the same content; absent values are null
std::string render_json(const ValidationReport& report);

}  // namespace geneprio
