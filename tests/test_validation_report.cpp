// tests/test_validation_report.cpp
//
// Verdict aggregation and report rendering:
//   T1: verdict table over (positive, negative, sensitivity)
//   T2: weight-tuning recommendations follow the failing prong
//   T3: every recommendation carries the circular-validation warning
//   T4: markdown report sections, skipped sweep and caveats
//   T5: JSON report structure and null for absent values
//   T6: sweeps without a rho name why (tied scores vs. too little overlap)
//   T7: invalid UTF-8 in input symbols does not abort the JSON report

#include "geneprio/validation_report.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using geneprio::ValidationStatus;
using geneprio::Verdict;
using json = nlohmann::json;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

geneprio::SensitivitySummary summary(bool stable) {
    geneprio::SensitivitySummary s;
    s.total_perturbations = 24;
    s.stable_count = stable ? 24 : 20;
    s.unstable_count = stable ? 0 : 4;
    s.min_rho = stable ? 0.91 : 0.62;
    s.max_rho = 0.99;
    s.mean_rho = stable ? 0.95 : 0.90;
    s.overall_stable = stable;
    s.most_sensitive_layer = geneprio::EvidenceLayer::EXPRESSION;
    s.most_robust_layer = geneprio::EvidenceLayer::LITERATURE;
    return s;
}

geneprio::ControlValidationResult controls(bool positive, ValidationStatus status) {
    geneprio::ControlValidationResult c;
    c.positive = positive;
    c.threshold = positive ? 0.75 : 0.50;
    c.status = status;
    c.total_expected = 38;
    if (status != ValidationStatus::INDETERMINATE) {
        c.total_found = 30;
        c.median_percentile = positive ? (status == ValidationStatus::PASSED ? 0.88 : 0.41)
                                       : (status == ValidationStatus::PASSED ? 0.22 : 0.71);
    }
    const double elev[geneprio::NUM_LAYERS] = {0.20, 0.10, -0.05, 0.30, 0.0, -0.10};
    for (auto layer : geneprio::ALL_LAYERS) {
        geneprio::LayerElevation e;
        e.layer = layer;
        e.elevation = elev[geneprio::layer_index(layer)];
        c.elevation.push_back(e);
    }
    return c;
}

int test_verdict_table() {
    std::cout << "[T1] verdict table\n";
    int failed = 0;
    const auto P = ValidationStatus::PASSED;
    const auto F = ValidationStatus::FAILED;
    const auto I = ValidationStatus::INDETERMINATE;
    const std::optional<geneprio::SensitivitySummary> stable = summary(true);
    const std::optional<geneprio::SensitivitySummary> unstable = summary(false);
    const std::optional<geneprio::SensitivitySummary> skipped;

    expect(geneprio::decide_verdict(I, P, stable) == Verdict::INCONCLUSIVE,
           "no positives -> INCONCLUSIVE", failed);
    expect(geneprio::decide_verdict(I, F, unstable) == Verdict::INCONCLUSIVE,
           "no positives beats everything", failed);
    expect(geneprio::decide_verdict(F, P, stable) == Verdict::FAIL, "positives failed -> FAIL",
           failed);
    expect(geneprio::decide_verdict(P, P, stable) == Verdict::PASS, "all pass -> PASS", failed);
    expect(geneprio::decide_verdict(P, P, unstable) == Verdict::PARTIAL,
           "unstable sweep -> PARTIAL", failed);
    expect(geneprio::decide_verdict(P, P, skipped) == Verdict::PARTIAL,
           "skipped sweep -> PARTIAL", failed);
    expect(geneprio::decide_verdict(P, F, stable) == Verdict::PARTIAL,
           "negatives failed -> PARTIAL", failed);
    expect(geneprio::decide_verdict(P, I, stable) == Verdict::PARTIAL,
           "negatives missing -> PARTIAL", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_recommendations() {
    std::cout << "[T2] weight-tuning recommendations\n";
    int failed = 0;

    const auto ok = geneprio::recommend_weight_tuning(controls(true, ValidationStatus::PASSED),
                                                      controls(false, ValidationStatus::PASSED),
                                                      summary(true));
    expect(ok.size() == 1 && ok[0].title == "Current weights validated",
           "all-pass gives a single no-tuning recommendation", failed);

    const auto pos_fail = geneprio::recommend_weight_tuning(
        controls(true, ValidationStatus::FAILED), controls(false, ValidationStatus::PASSED),
        summary(true));
    expect(pos_fail.size() == 1, "one recommendation for failed positives", failed);
    if (!pos_fail.empty()) {
        const auto& a = pos_fail[0].actions;
        // localization (+0.30) then gnomad (+0.20); capped at two layer suggestions
        expect(a.size() == 3 && has(a[1], "localization") && has(a[2], "gnomad"),
               "increase the most elevated layers", failed);
    }

    const auto neg_fail = geneprio::recommend_weight_tuning(
        controls(true, ValidationStatus::PASSED), controls(false, ValidationStatus::FAILED),
        summary(false));
    expect(neg_fail.size() == 2, "negative and stability recommendations", failed);
    if (neg_fail.size() == 2) {
        expect(!neg_fail[0].actions.empty() &&
                   has(neg_fail[0].actions[0], "reducing the localization"),
               "reduce the layer elevating negatives", failed);
        expect(!neg_fail[1].actions.empty() &&
                   has(neg_fail[1].actions[0], "reducing the expression"),
               "reduce the most sensitive layer", failed);
    }

    const auto missing = geneprio::recommend_weight_tuning(
        controls(true, ValidationStatus::INDETERMINATE), controls(false, ValidationStatus::PASSED),
        std::nullopt);
    expect(!missing.empty() && missing[0].title == "Positive controls not found",
           "symbol-mapping advice when positives are absent", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_warning_everywhere() {
    std::cout << "[T3] circular-validation warning on every recommendation\n";
    int failed = 0;

    const ValidationStatus all[] = {ValidationStatus::PASSED, ValidationStatus::FAILED,
                                    ValidationStatus::INDETERMINATE};
    for (auto p : all) {
        for (auto n : all) {
            for (int s = 0; s < 3; ++s) {
                std::optional<geneprio::SensitivitySummary> sens;
                if (s > 0) sens = summary(s == 1);
                const auto recs = geneprio::recommend_weight_tuning(controls(true, p),
                                                                    controls(false, n), sens);
                for (const auto& r : recs) {
                    expect(r.warning == geneprio::CIRCULARITY_WARNING &&
                               has(r.warning, "CRITICAL: Circular Validation Risk"),
                           "warning missing on '" + r.title + "'", failed);
                }
            }
        }
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

geneprio::ValidationReport sample_report(bool with_sensitivity) {
    geneprio::QCReport qc;
    qc.warnings.push_back("expression: 60.0% of genes missing (above 50.0%)");
    geneprio::TierCounts tiers{12, 40, 300, 120};

    std::optional<geneprio::SensitivitySection> sens;
    if (with_sensitivity) {
        geneprio::SensitivitySection section{
            {geneprio::ScoringWeights::defaults(), 100, {}}, summary(true)};
        section.analysis.results.push_back({geneprio::EvidenceLayer::GNOMAD, 0.05,
                                            geneprio::ScoringWeights::defaults(), 0.97, 1e-40, 96,
                                            100, geneprio::Stability::STABLE});
        sens = section;
    }

    geneprio::Diagnostics diag;
    diag.push_back({geneprio::DataIssueKind::CONTROL_GENE_MISSING, "positive controls",
                    "8 of 38 control symbols absent", 8});

    return geneprio::build_report(qc, tiers, controls(true, ValidationStatus::PASSED),
                                  controls(false, ValidationStatus::PASSED), sens, diag);
}

int test_markdown() {
    std::cout << "[T4] markdown report\n";
    int failed = 0;

    const auto report = sample_report(true);
    expect(report.verdict == Verdict::PASS, "sample verdict PASS", failed);
    const std::string md = geneprio::render_markdown(report);
    for (const char* section :
         {"# Comprehensive Validation Report", "## 1. Positive Control Validation",
          "## 2. Negative Control Validation", "## 3. Sensitivity Analysis",
          "## 4. Overall Validation Summary", "## 5. Weight Tuning Recommendations",
          "## 6. Quality Control", "## 7. Tiering", "## 8. Data Caveats"}) {
        expect(has(md, section), std::string("missing section: ") + section, failed);
    }
    expect(has(md, "**Verdict:** PASS"), "verdict line", failed);
    expect(has(md, "Current weights validated"), "recommendation rendered", failed);
    expect(has(md, "> CRITICAL: Circular Validation Risk"), "warning rendered", failed);
    expect(has(md, "| gnomad | +0.05 | 96/100 |"), "perturbation row", failed);
    expect(has(md, "[control_gene_missing] positive controls"), "caveat rendered", failed);
    expect(has(md, "- HIGH: 12"), "tier counts rendered", failed);

    const auto skipped = sample_report(false);
    expect(skipped.verdict == Verdict::PARTIAL, "skipped sweep -> PARTIAL", failed);
    const std::string md2 = geneprio::render_markdown(skipped);
    expect(has(md2, "**Status:** NOT RUN"), "skipped sweep marked NOT RUN", failed);
    expect(has(md2, "| Sensitivity Analysis | NOT RUN |"), "summary row NOT RUN", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_json() {
    std::cout << "[T5] JSON report\n";
    int failed = 0;

    json j;
    try {
        j = json::parse(geneprio::render_json(sample_report(true)));
    } catch (const json::exception& e) {
        expect(false, std::string("JSON does not parse: ") + e.what(), failed);
        return failed;
    }
    expect(j.value("verdict", "") == "PASS", "verdict", failed);
    expect(j.contains("positive_controls") && j["positive_controls"]["status"] == "PASSED",
           "positive controls", failed);
    expect(j["positive_controls"].contains("recall_at_k"), "positive recall table", failed);
    expect(!j["negative_controls"].contains("recall_at_k"), "no negative recall table", failed);
    expect(j["sensitivity"].is_object() && j["sensitivity"]["results"].size() == 1,
           "sensitivity results", failed);
    expect(j["recommendations"].is_array() && !j["recommendations"].empty() &&
               j["recommendations"][0]["warning"] == geneprio::CIRCULARITY_WARNING,
           "recommendation warning", failed);
    expect(j["caveats"].size() == 1 && j["caveats"][0]["kind"] == "control_gene_missing",
           "caveats", failed);
    expect(j["tiers"]["HIGH"] == 12, "tiers", failed);

    const json k = json::parse(geneprio::render_json(sample_report(false)));
    expect(k["sensitivity"].is_null(), "skipped sweep is null", failed);
    expect(k["positive_controls"]["top_quartile_fraction"].is_null(), "absent value is null",
           failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_indeterminate_reasons() {
    std::cout << "[T6] indeterminate sweep reasons\n";
    int failed = 0;

    // Every gene tied at 1.0: full overlap, but no rank variance
    geneprio::SensitivitySummary tied;
    tied.total_perturbations = 24;
    tied.indeterminate_count = 24;
    tied.no_rank_variance_count = 24;
    geneprio::SensitivitySection section{{geneprio::ScoringWeights::defaults(), 20, {}}, tied};
    section.analysis.results.push_back(
        {geneprio::EvidenceLayer::LITERATURE, -0.10, geneprio::ScoringWeights::defaults(),
         std::nullopt, std::nullopt, 20, 20, geneprio::Stability::INDETERMINATE,
         geneprio::IndeterminateReason::NO_RANK_VARIANCE});

    const auto report = geneprio::build_report(
        {}, {}, controls(true, ValidationStatus::PASSED), controls(false, ValidationStatus::PASSED),
        section, {});
    expect(report.verdict == Verdict::PARTIAL, "unmeasured sweep -> PARTIAL", failed);
    expect(has(report.verdict_reason, "tied") && !has(report.verdict_reason, "overlap"),
           "reason names tied scores, not overlap: " + report.verdict_reason, failed);

    const std::string md = geneprio::render_markdown(report);
    expect(has(md, "- Insufficient overlap: 0"), "no overlap shortfall reported", failed);
    expect(has(md, "- Tied top-N scores (no rank variance): 24"), "tied count reported", failed);
    expect(has(md, "| 20/20 |") && has(md, "indeterminate (no_rank_variance)"),
           "row labelled with its reason", failed);

    const json j = json::parse(geneprio::render_json(report));
    expect(j["sensitivity"]["summary"]["no_rank_variance_count"] == 24 &&
               j["sensitivity"]["summary"]["insufficient_overlap_count"] == 0,
           "JSON reason counts", failed);
    expect(j["sensitivity"]["results"][0]["indeterminate_reason"] == "no_rank_variance",
           "JSON per-result reason", failed);

    // Overlap shortfall keeps its own wording
    geneprio::SensitivitySummary sparse;
    sparse.total_perturbations = 24;
    sparse.indeterminate_count = 24;
    sparse.insufficient_overlap_count = 24;
    const auto sparse_report = geneprio::build_report(
        {}, {}, controls(true, ValidationStatus::PASSED), controls(false, ValidationStatus::PASSED),
        geneprio::SensitivitySection{{geneprio::ScoringWeights::defaults(), 20, {}}, sparse}, {});
    expect(has(sparse_report.verdict_reason, "overlap") &&
               !has(sparse_report.verdict_reason, "tied"),
           "overlap shortfall reason", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_invalid_utf8() {
    std::cout << "[T7] invalid UTF-8 symbols in JSON\n";
    int failed = 0;

    auto negative = controls(false, ValidationStatus::PASSED);
    negative.missing_symbols.push_back("BAD\xff");
    const auto report = geneprio::build_report({}, {}, controls(true, ValidationStatus::PASSED),
                                               negative, std::nullopt, {});
    std::string text;
    try {
        text = geneprio::render_json(report);
    } catch (const json::exception& e) {
        expect(false, std::string("render_json threw: ") + e.what(), failed);
        return failed;
    }
    const json j = json::parse(text);
    // U+FFFD replaces the invalid byte
    expect(j["negative_controls"]["missing_symbols"].back() == "BAD\xEF\xBF\xBD",
           "invalid byte replaced", failed);
    expect(has(geneprio::render_markdown(report), "BAD"), "markdown still rendered", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_verdict_table();
    total += test_recommendations();
    total += test_warning_everywhere();
    total += test_markdown();
    total += test_json();
    total += test_indeterminate_reasons();
    total += test_invalid_utf8();

    if (total == 0) {
        std::cout << "\nAll validation report tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
