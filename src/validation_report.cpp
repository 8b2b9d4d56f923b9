#include "geneprio/validation_report.hpp"
#include "geneprio/log_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace geneprio {

using json = nlohmann::ordered_json;
using log_utils::format_fixed;
using log_utils::format_optional;
using log_utils::format_percent;

const char* const CIRCULARITY_WARNING =
    "CRITICAL: Circular Validation Risk. These controls were used to judge the current "
    "weights; tuning weights against the same controls invalidates that judgement. Any "
    "adjusted weights require independent re-validation on held-out genes before use.";

const char* verdict_name(Verdict v) {
    switch (v) {
        case Verdict::PASS: return "PASS";
        case Verdict::PARTIAL: return "PARTIAL";
        case Verdict::FAIL: return "FAIL";
        case Verdict::INCONCLUSIVE: return "INCONCLUSIVE";
    }
    return "UNKNOWN";
}

Verdict decide_verdict(ValidationStatus positive, ValidationStatus negative,
                       const std::optional<SensitivitySummary>& sensitivity) {
    if (positive == ValidationStatus::INDETERMINATE) return Verdict::INCONCLUSIVE;
    if (positive == ValidationStatus::FAILED) return Verdict::FAIL;
    const bool stable = sensitivity && sensitivity->overall_stable;
    if (negative == ValidationStatus::PASSED && stable) return Verdict::PASS;
    return Verdict::PARTIAL;
}

namespace {

std::string verdict_reason(const ValidationReport& r) {
    switch (r.verdict) {
        case Verdict::INCONCLUSIVE:
            return "No positive-control gene is present in the scored population, so ranking "
                   "sensitivity cannot be assessed.";
        case Verdict::FAIL:
            return "Known genes do not rank highly; evidence weights or data quality need "
                   "investigation.";
        case Verdict::PASS:
            return "Known genes rank high, housekeeping genes rank low and rankings are stable "
                   "under weight perturbation.";
        case Verdict::PARTIAL:
            break;
    }
    if (r.negative.status == ValidationStatus::FAILED) {
        return "Known genes rank high but housekeeping genes also rank higher than expected "
               "(specificity issue).";
    }
    if (r.negative.status == ValidationStatus::INDETERMINATE) {
        return "Known genes rank high but no negative-control gene was found, so specificity "
               "is unassessed.";
    }
    if (!r.sensitivity) {
        return "Control validations passed; the sensitivity sweep was not run.";
    }
    if (!r.sensitivity->summary.min_rho) {
        const auto& s = r.sensitivity->summary;
        if (s.no_rank_variance_count == 0) {
            return "Control validations passed; no perturbation had enough top-N overlap to "
                   "measure stability.";
        }
        if (s.insufficient_overlap_count == 0) {
            return "Control validations passed; the shared top-N scores were tied in every "
                   "perturbation, so rank correlation is undefined.";
        }
        return "Control validations passed; no perturbation could be measured (" +
               std::to_string(s.insufficient_overlap_count) + " with insufficient top-N "
               "overlap, " + std::to_string(s.no_rank_variance_count) +
               " with tied top-N scores).";
    }
    return "Control validations passed but rankings are sensitive to weight perturbations.";
}

// Layers sorted by elevation, largest first; layers without a value last
std::vector<LayerElevation> by_elevation(const std::vector<LayerElevation>& elev) {
    std::vector<LayerElevation> sorted;
    for (const auto& e : elev) {
        if (e.elevation) sorted.push_back(e);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const LayerElevation& a,
                                                      const LayerElevation& b) {
        return *a.elevation > *b.elevation;
    });
    return sorted;
}

}  // namespace

std::vector<Recommendation> recommend_weight_tuning(
    const ControlValidationResult& positive,
    const ControlValidationResult& negative,
    const std::optional<SensitivitySummary>& sensitivity) {
    std::vector<Recommendation> recs;

    const bool stable = sensitivity && sensitivity->overall_stable;
    if (positive.status == ValidationStatus::PASSED &&
        negative.status == ValidationStatus::PASSED && stable) {
        Recommendation r;
        r.title = "Current weights validated";
        r.rationale = "All validation checks passed. No tuning is recommended.";
        recs.push_back(std::move(r));
        return recs;
    }

    if (positive.status == ValidationStatus::INDETERMINATE) {
        Recommendation r;
        r.title = "Positive controls not found";
        r.rationale = "None of the " + std::to_string(positive.total_expected) +
                      " positive-control symbols has a composite score.";
        r.actions.push_back("Check gene symbol mapping between the control sets and the universe");
        r.actions.push_back("Confirm evidence tables were loaded for the control genes");
        recs.push_back(std::move(r));
    } else if (positive.status == ValidationStatus::FAILED) {
        Recommendation r;
        r.title = "Known gene ranking (positive controls)";
        r.rationale = "Known genes have median percentile " +
                      format_optional(positive.median_percentile) + ", below the " +
                      format_fixed(positive.threshold, 2) + " threshold.";
        r.actions.push_back("Review the per-source breakdown for gene sets that validate poorly");
        for (const auto& e : by_elevation(positive.elevation)) {
            if (*e.elevation <= 0.0 || r.actions.size() >= 3) break;
            r.actions.push_back("Consider increasing the " + std::string(layer_name(e.layer)) +
                                " weight (controls score " + format_fixed(*e.elevation) +
                                " above the population mean)");
        }
        recs.push_back(std::move(r));
    }

    if (negative.status == ValidationStatus::FAILED) {
        Recommendation r;
        r.title = "Housekeeping gene ranking (negative controls)";
        r.rationale = "Negative controls have median percentile " +
                      format_optional(negative.median_percentile) + ", at or above the " +
                      format_fixed(negative.threshold, 2) + " threshold.";
        const auto elevated = by_elevation(negative.elevation);
        if (!elevated.empty() && *elevated.front().elevation > 0.0) {
            r.actions.push_back("Consider reducing the " +
                                std::string(layer_name(elevated.front().layer)) +
                                " weight, the layer that most elevates negative controls (" +
                                format_fixed(*elevated.front().elevation) +
                                " above the population mean)");
        } else {
            r.actions.push_back("No single layer elevates negative controls; review layer "
                                "normalization");
        }
        recs.push_back(std::move(r));
    }

    if (sensitivity && !sensitivity->overall_stable && sensitivity->unstable_count > 0) {
        Recommendation r;
        r.title = "Weight sensitivity (stability)";
        r.rationale = std::to_string(sensitivity->unstable_count) + " of " +
                      std::to_string(sensitivity->total_perturbations) +
                      " perturbations fall below rho " +
                      format_fixed(sensitivity->stability_threshold, 2) + ".";
        if (sensitivity->most_sensitive_layer) {
            r.actions.push_back("Consider reducing the " +
                                std::string(layer_name(*sensitivity->most_sensitive_layer)) +
                                " weight, the most sensitive layer");
        }
        recs.push_back(std::move(r));
    }

    return recs;
}

ValidationReport build_report(const QCReport& qc,
                              const TierCounts& tiers,
                              const ControlValidationResult& positive,
                              const ControlValidationResult& negative,
                              std::optional<SensitivitySection> sensitivity,
                              const Diagnostics& diagnostics) {
    ValidationReport r;
    r.qc = qc;
    r.tiers = tiers;
    r.positive = positive;
    r.negative = negative;
    r.sensitivity = std::move(sensitivity);
    r.caveats = diagnostics;

    std::optional<SensitivitySummary> summary;
    if (r.sensitivity) summary = r.sensitivity->summary;
    r.verdict = decide_verdict(positive.status, negative.status, summary);
    r.verdict_reason = verdict_reason(r);
    r.recommendations = recommend_weight_tuning(positive, negative, summary);
    return r;
}

namespace {

std::string status_label(ValidationStatus s) {
    switch (s) {
        case ValidationStatus::PASSED: return "PASSED";
        case ValidationStatus::FAILED: return "FAILED";
        case ValidationStatus::INDETERMINATE: return "INDETERMINATE (no control genes found)";
    }
    return "UNKNOWN";
}

std::string optional_percent(const std::optional<double>& v) {
    return v ? format_percent(*v) : "N/A";
}

void write_control_section(std::ostringstream& md, const ControlValidationResult& c,
                           const char* noun) {
    md << "**Status:** " << status_label(c.status) << "\n\n";
    md << "### Summary\n";
    md << "- " << noun << " expected: " << c.total_expected << "\n";
    md << "- " << noun << " found: " << c.total_found << "\n";
    md << "- Median percentile: " << optional_percent(c.median_percentile) << " (threshold "
       << (c.positive ? ">= " : "< ") << format_percent(c.threshold) << ")\n";
    md << "- Top quartile count: " << c.top_quartile_count << "\n";
    md << "- Top quartile fraction: " << optional_percent(c.top_quartile_fraction) << "\n";
    md << "- HIGH tier count: " << c.high_tier_count << "\n";
    if (!c.missing_symbols.empty()) {
        md << "- Not in scored population: ";
        for (size_t i = 0; i < c.missing_symbols.size(); ++i) {
            md << (i ? ", " : "") << c.missing_symbols[i];
        }
        md << "\n";
    }
    md << "\n";

    if (!c.recall.empty()) {
        md << "### Recall@k\n\n";
        md << "| Threshold | k | Hits | Recall |\n";
        md << "|-----------|---|------|--------|\n";
        for (const auto& r : c.recall) {
            md << "| Top " << r.label << " | " << r.k << " | " << r.hits << " | "
               << optional_percent(r.recall) << " |\n";
        }
        md << "\n";
    }

    if (!c.per_source.empty()) {
        md << "### Per-Source Breakdown\n\n";
        md << "| Source | Expected | Found | Median Percentile | Top Quartile |";
        const bool with_recall = !c.per_source.front().recall.empty();
        if (with_recall) {
            for (const auto& r : c.per_source.front().recall) md << " Recall@" << r.label << " |";
        }
        md << "\n|--------|----------|-------|-------------------|--------------|";
        if (with_recall) {
            for (size_t i = 0; i < c.per_source.front().recall.size(); ++i) md << "------|";
        }
        md << "\n";
        for (const auto& s : c.per_source) {
            md << "| " << s.source << " | " << s.expected << " | " << s.found << " | "
               << optional_percent(s.median_percentile) << " | " << s.top_quartile_count << " |";
            for (const auto& r : s.recall) md << " " << optional_percent(r.recall) << " |";
            md << "\n";
        }
        md << "\n";
    }

    if (!c.details.empty()) {
        md << (c.positive ? "### Top-Ranked Control Genes\n\n" : "### Lowest-Ranked Control Genes\n\n");
        md << "| Gene | Gene ID | Score | Percentile | Rank | Evidence | Tier | Source |\n";
        md << "|------|---------|-------|------------|------|----------|------|--------|\n";
        for (const auto& d : c.details) {
            md << "| " << d.gene_symbol << " | " << d.gene_id << " | "
               << format_fixed(d.composite_score) << " | " << format_percent(d.percentile)
               << " | " << d.rank << " | " << d.evidence_count << " | " << tier_name(d.tier)
               << " | " << d.sources << " |\n";
        }
        md << "\n";
    }
}

}  // namespace

std::string render_markdown(const ValidationReport& r) {
    std::ostringstream md;
    md << "# Comprehensive Validation Report\n\n";
    md << "**Overall verdict:** " << verdict_name(r.verdict) << "\n\n";
    md << r.verdict_reason << "\n\n";

    md << "## 1. Positive Control Validation\n\n";
    write_control_section(md, r.positive, "Known genes");

    md << "## 2. Negative Control Validation\n\n";
    write_control_section(md, r.negative, "Negative-control genes");

    md << "## 3. Sensitivity Analysis\n\n";
    if (!r.sensitivity) {
        md << "**Status:** NOT RUN\n\n";
    } else {
        const auto& s = r.sensitivity->summary;
        md << "**Status:** " << (s.overall_stable ? "STABLE" : (s.min_rho ? "UNSTABLE" : "INDETERMINATE"))
           << "\n\n";
        md << "### Summary\n";
        md << "- Baseline weights: " << r.sensitivity->analysis.baseline_weights.to_string() << "\n";
        md << "- Top-N compared: " << r.sensitivity->analysis.top_n << "\n";
        md << "- Total perturbations: " << s.total_perturbations << "\n";
        md << "- Stable perturbations (rho >= " << format_fixed(s.stability_threshold, 2)
           << "): " << s.stable_count << "\n";
        md << "- Unstable perturbations: " << s.unstable_count << "\n";
        md << "- Insufficient overlap: " << s.insufficient_overlap_count << "\n";
        md << "- Tied top-N scores (no rank variance): " << s.no_rank_variance_count << "\n";
        md << "- Mean Spearman rho: " << format_optional(s.mean_rho) << "\n";
        if (s.min_rho && s.max_rho) {
            md << "- Range: [" << format_fixed(*s.min_rho) << ", " << format_fixed(*s.max_rho)
               << "]\n";
        }
        if (s.most_sensitive_layer && s.most_robust_layer) {
            md << "- Most sensitive layer: " << layer_name(*s.most_sensitive_layer) << "\n";
            md << "- Most robust layer: " << layer_name(*s.most_robust_layer) << "\n";
        }
        md << "\n### Spearman Correlation by Perturbation\n\n";
        md << "| Layer | Delta | Overlap | Spearman rho | p-value | Stability |\n";
        md << "|-------|-------|---------|--------------|---------|-----------|\n";
        for (const auto& res : r.sensitivity->analysis.results) {
            std::ostringstream delta;
            delta << std::showpos << std::fixed << std::setprecision(2) << res.delta;
            std::ostringstream pval;
            if (res.spearman_pval) {
                pval << std::scientific << std::setprecision(2) << *res.spearman_pval;
            } else {
                pval << "N/A";
            }
            md << "| " << layer_name(res.layer) << " | " << delta.str() << " | "
               << res.overlap_count << "/" << res.top_n << " | "
               << format_optional(res.spearman_rho) << " | " << pval.str() << " | "
               << stability_name(res.stability);
            if (res.reason != IndeterminateReason::NONE) {
                md << " (" << indeterminate_reason_name(res.reason) << ")";
            }
            md << " |\n";
        }
        md << "\np-values are advisory; the asymptotic approximation is unreliable for "
              "small overlaps.\n\n";
    }

    md << "## 4. Overall Validation Summary\n\n";
    md << "| Validation Prong | Status |\n";
    md << "|------------------|--------|\n";
    md << "| Positive Controls | " << validation_status_name(r.positive.status) << " |\n";
    md << "| Negative Controls | " << validation_status_name(r.negative.status) << " |\n";
    md << "| Sensitivity Analysis | ";
    if (!r.sensitivity) {
        md << "NOT RUN";
    } else if (r.sensitivity->summary.overall_stable) {
        md << "STABLE";
    } else {
        md << (r.sensitivity->summary.min_rho ? "UNSTABLE" : "INDETERMINATE");
    }
    md << " |\n";
    md << "| Quality Control (advisory) | " << (r.qc.passed() ? "PASSED" : "ISSUES") << " |\n\n";
    md << "**Verdict:** " << verdict_name(r.verdict) << "\n\n";

    md << "## 5. Weight Tuning Recommendations\n\n";
    for (const auto& rec : r.recommendations) {
        md << "### " << rec.title << "\n\n" << rec.rationale << "\n\n";
        for (const auto& a : rec.actions) md << "- " << a << "\n";
        if (!rec.actions.empty()) md << "\n";
        md << "> " << rec.warning << "\n\n";
    }

    md << "## 6. Quality Control\n\n";
    md << "| Layer | Missing | Mean | Median | Std | Outliers |\n";
    md << "|-------|---------|------|--------|-----|----------|\n";
    for (size_t i = 0; i < r.qc.layers.size() && i < r.qc.missing.size(); ++i) {
        const auto& m = r.qc.missing[i];
        const auto& d = r.qc.layers[i];
        md << "| " << layer_name(d.layer) << " | " << format_percent(m.missing_rate) << " | ";
        if (d.stats) {
            md << format_fixed(d.stats->mean) << " | " << format_fixed(d.stats->median) << " | "
               << format_fixed(d.stats->std) << " | ";
        } else {
            md << "N/A | N/A | N/A | ";
        }
        md << (d.outliers && !d.outliers->skipped ? std::to_string(d.outliers->count) : "N/A")
           << " |\n";
    }
    md << "\n";
    const auto& comp = r.qc.composite;
    md << "- Composite scores: " << comp.non_null << " of " << comp.total << " genes\n";
    if (comp.stats) {
        md << "- Composite mean " << format_fixed(comp.stats->mean) << ", median "
           << format_fixed(comp.stats->median) << ", std " << format_fixed(comp.stats->std)
           << ", range [" << format_fixed(comp.stats->min) << ", " << format_fixed(comp.stats->max)
           << "]\n";
        md << "- Percentiles p10/p25/p50/p75/p90: " << format_fixed(comp.p10) << " / "
           << format_fixed(comp.p25) << " / " << format_fixed(comp.p50) << " / "
           << format_fixed(comp.p75) << " / " << format_fixed(comp.p90) << "\n";
    }
    for (const auto& w : r.qc.warnings) md << "- Warning: " << w << "\n";
    for (const auto& e : r.qc.errors) md << "- Error: " << e << "\n";
    md << "\n";

    md << "## 7. Tiering\n\n";
    md << "- HIGH: " << r.tiers.high << "\n";
    md << "- MEDIUM: " << r.tiers.medium << "\n";
    md << "- LOW: " << r.tiers.low << "\n";
    md << "- Candidates above score floor: " << r.tiers.candidates << "\n\n";

    md << "## 8. Data Caveats\n\n";
    if (r.caveats.empty()) {
        md << "None recorded.\n";
    } else {
        for (const auto& c : r.caveats) {
            md << "- [" << data_issue_kind_name(c.kind) << "] " << c.context << ": " << c.message
               << "\n";
        }
    }
    return md.str();
}

namespace {

json optional_json(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

json weights_json(const ScoringWeights& w) {
    json j = json::object();
    for (EvidenceLayer layer : ALL_LAYERS) j[layer_name(layer)] = w[layer];
    return j;
}

json recall_json(const std::vector<RecallAtK>& recall) {
    json arr = json::array();
    for (const auto& r : recall) {
        arr.push_back({{"label", r.label}, {"k", r.k}, {"hits", r.hits},
                       {"recall", optional_json(r.recall)}});
    }
    return arr;
}

json control_json(const ControlValidationResult& c) {
    json j;
    j["status"] = validation_status_name(c.status);
    j["threshold"] = c.threshold;
    j["total_expected"] = c.total_expected;
    j["total_found"] = c.total_found;
    j["missing_symbols"] = c.missing_symbols;
    j["median_percentile"] = optional_json(c.median_percentile);
    j["top_quartile_count"] = c.top_quartile_count;
    j["top_quartile_fraction"] = optional_json(c.top_quartile_fraction);
    j["high_tier_count"] = c.high_tier_count;
    if (c.positive) j["recall_at_k"] = recall_json(c.recall);

    json sources = json::array();
    for (const auto& s : c.per_source) {
        json sj = {{"source", s.source}, {"expected", s.expected}, {"found", s.found},
                   {"median_percentile", optional_json(s.median_percentile)},
                   {"top_quartile_count", s.top_quartile_count}};
        if (c.positive) sj["recall_at_k"] = recall_json(s.recall);
        sources.push_back(std::move(sj));
    }
    j["per_source"] = std::move(sources);

    json details = json::array();
    for (const auto& d : c.details) {
        details.push_back({{"gene_symbol", d.gene_symbol}, {"gene_id", d.gene_id},
                           {"composite_score", d.composite_score},
                           {"percentile", d.percentile}, {"rank", d.rank},
                           {"evidence_count", d.evidence_count}, {"tier", tier_name(d.tier)},
                           {"sources", d.sources}});
    }
    j["details"] = std::move(details);

    json elevation = json::object();
    for (const auto& e : c.elevation) elevation[layer_name(e.layer)] = optional_json(e.elevation);
    j["layer_elevation"] = std::move(elevation);
    return j;
}

}  // namespace

std::string render_json(const ValidationReport& r) {
    json j;
    j["verdict"] = verdict_name(r.verdict);
    j["verdict_reason"] = r.verdict_reason;
    j["positive_controls"] = control_json(r.positive);
    j["negative_controls"] = control_json(r.negative);

    if (r.sensitivity) {
        const auto& s = r.sensitivity->summary;
        json sj;
        sj["baseline_weights"] = weights_json(r.sensitivity->analysis.baseline_weights);
        sj["top_n"] = r.sensitivity->analysis.top_n;
        json results = json::array();
        for (const auto& res : r.sensitivity->analysis.results) {
            results.push_back({{"layer", layer_name(res.layer)}, {"delta", res.delta},
                               {"perturbed_weights", weights_json(res.perturbed_weights)},
                               {"spearman_rho", optional_json(res.spearman_rho)},
                               {"spearman_pval", optional_json(res.spearman_pval)},
                               {"overlap_count", res.overlap_count},
                               {"stability", stability_name(res.stability)},
                               {"indeterminate_reason",
                                res.reason == IndeterminateReason::NONE
                                    ? json(nullptr)
                                    : json(indeterminate_reason_name(res.reason))}});
        }
        sj["results"] = std::move(results);
        sj["summary"] = {
            {"total_perturbations", s.total_perturbations},
            {"stable_count", s.stable_count},
            {"unstable_count", s.unstable_count},
            {"indeterminate_count", s.indeterminate_count},
            {"insufficient_overlap_count", s.insufficient_overlap_count},
            {"no_rank_variance_count", s.no_rank_variance_count},
            {"min_rho", optional_json(s.min_rho)},
            {"max_rho", optional_json(s.max_rho)},
            {"mean_rho", optional_json(s.mean_rho)},
            {"overall_stable", s.overall_stable},
            {"most_sensitive_layer", s.most_sensitive_layer
                                         ? json(layer_name(*s.most_sensitive_layer))
                                         : json(nullptr)},
            {"most_robust_layer", s.most_robust_layer ? json(layer_name(*s.most_robust_layer))
                                                      : json(nullptr)},
        };
        j["sensitivity"] = std::move(sj);
    } else {
        j["sensitivity"] = nullptr;
    }

    json qc;
    qc["passed"] = r.qc.passed();
    json layers = json::array();
    for (size_t i = 0; i < r.qc.missing.size(); ++i) {
        const auto& m = r.qc.missing[i];
        json lj = {{"layer", layer_name(m.layer)}, {"missing_rate", m.missing_rate},
                   {"missing_severity", qc_severity_name(m.severity)}};
        if (i < r.qc.layers.size() && r.qc.layers[i].outliers) {
            lj["outlier_count"] = r.qc.layers[i].outliers->count;
            lj["outlier_examples"] = r.qc.layers[i].outliers->examples;
        }
        layers.push_back(std::move(lj));
    }
    qc["layers"] = std::move(layers);
    const auto& comp = r.qc.composite;
    qc["composite"] = {{"total", comp.total}, {"non_null", comp.non_null},
                       {"mean", comp.stats ? json(comp.stats->mean) : json(nullptr)},
                       {"median", comp.stats ? json(comp.stats->median) : json(nullptr)},
                       {"std", comp.stats ? json(comp.stats->std) : json(nullptr)},
                       {"p10", comp.p10}, {"p25", comp.p25}, {"p50", comp.p50},
                       {"p75", comp.p75}, {"p90", comp.p90}};
    qc["warnings"] = r.qc.warnings;
    qc["errors"] = r.qc.errors;
    j["quality_control"] = std::move(qc);

    j["tiers"] = {{"HIGH", r.tiers.high}, {"MEDIUM", r.tiers.medium}, {"LOW", r.tiers.low},
                  {"candidates", r.tiers.candidates}};

    json recs = json::array();
    for (const auto& rec : r.recommendations) {
        recs.push_back({{"title", rec.title}, {"rationale", rec.rationale},
                        {"actions", rec.actions}, {"warning", rec.warning}});
    }
    j["recommendations"] = std::move(recs);

    json caveats = json::array();
    for (const auto& c : r.caveats) {
        caveats.push_back({{"kind", data_issue_kind_name(c.kind)}, {"context", c.context},
                           {"message", c.message}, {"count", c.count}});
    }
    j["caveats"] = std::move(caveats);
    // Symbols come from input files; invalid UTF-8 is replaced, not fatal
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace geneprio
