// tests/test_quality_control.cpp
//
// QC diagnostics:
//   T1: missing-rate warning / error thresholds per layer
//   T2: layers with no variation are flagged, MAD detection skipped
//   T3: MAD outliers (scaled 1.4826) with largest-deviation examples
//   T4: out-of-range diagnostics and an all-absent composite are errors
//   T5: composite percentiles and parameter validation

#include "geneprio/quality_control.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

using geneprio::EvidenceLayer;
using geneprio::layer_index;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

geneprio::CompositeScoreRecord make_record(int i) {
    geneprio::CompositeScoreRecord r;
    r.gene_id = "ENSG" + std::to_string(i);
    r.gene_symbol = "G" + std::to_string(i);
    return r;
}

// Ten genes: gnomad on all (one outlier), expression on 4, annotation on 1,
// localization on none, animal_model constant, literature spread.
std::vector<geneprio::CompositeScoreRecord> make_panel() {
    const double gnomad[10] = {0.40, 0.42, 0.44, 0.46, 0.48, 0.50, 0.52, 0.54, 0.56, 0.99};
    std::vector<geneprio::CompositeScoreRecord> recs;
    for (int i = 0; i < 10; ++i) {
        auto r = make_record(i);
        r.layer_scores[layer_index(EvidenceLayer::GNOMAD)] = gnomad[i];
        if (i < 4) r.layer_scores[layer_index(EvidenceLayer::EXPRESSION)] = 0.1 * (i + 1);
        if (i == 0) r.layer_scores[layer_index(EvidenceLayer::ANNOTATION)] = 0.7;
        r.layer_scores[layer_index(EvidenceLayer::ANIMAL_MODEL)] = 0.5;
        r.layer_scores[layer_index(EvidenceLayer::LITERATURE)] = 0.05 + 0.1 * i;
        r.composite_score = 0.1 * i;
        recs.push_back(r);
    }
    return recs;
}

bool contains(const std::vector<std::string>& v, const std::string& needle) {
    for (const auto& s : v) {
        if (s.find(needle) != std::string::npos) return true;
    }
    return false;
}

int test_missingness() {
    std::cout << "[T1] missing-rate thresholds\n";
    int failed = 0;

    const auto report = geneprio::run_qc(make_panel());
    expect(report.missing.size() == geneprio::NUM_LAYERS, "one missingness entry per layer",
           failed);

    const auto& gnomad = report.missing[layer_index(EvidenceLayer::GNOMAD)];
    expect(gnomad.missing == 0 && gnomad.severity == geneprio::QCSeverity::OK, "gnomad complete",
           failed);

    const auto& expr = report.missing[layer_index(EvidenceLayer::EXPRESSION)];
    expect(expr.missing == 6 && near(expr.missing_rate, 0.6), "expression 60% missing", failed);
    expect(expr.severity == geneprio::QCSeverity::WARNING, "60% missing is a warning", failed);

    const auto& annot = report.missing[layer_index(EvidenceLayer::ANNOTATION)];
    expect(annot.severity == geneprio::QCSeverity::ERROR, "90% missing is an error", failed);

    const auto& loc = report.missing[layer_index(EvidenceLayer::LOCALIZATION)];
    expect(loc.missing == 10 && loc.severity == geneprio::QCSeverity::ERROR,
           "fully missing layer is an error", failed);
    expect(!report.layers[layer_index(EvidenceLayer::LOCALIZATION)].stats,
           "no distribution for a layer nobody has", failed);

    expect(contains(report.warnings, "expression"), "expression warning listed", failed);
    expect(contains(report.errors, "annotation") && contains(report.errors, "localization"),
           "missingness errors listed", failed);
    expect(!report.passed(), "errors fail QC", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_no_variation() {
    std::cout << "[T2] no-variation layers\n";
    int failed = 0;

    const auto report = geneprio::run_qc(make_panel());
    const auto& animal = report.layers[layer_index(EvidenceLayer::ANIMAL_MODEL)];
    expect(animal.stats && animal.stats->count == 10, "animal_model summarised", failed);
    expect(animal.no_variation, "constant layer flagged", failed);
    expect(animal.outliers && animal.outliers->skipped, "MAD == 0 skips detection", failed);
    expect(contains(report.warnings, "animal_model: no variation"), "warning text", failed);

    const auto& lit = report.layers[layer_index(EvidenceLayer::LITERATURE)];
    expect(!lit.no_variation, "spread layer not flagged", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_mad_outliers() {
    std::cout << "[T3] MAD outliers\n";
    int failed = 0;

    const auto report = geneprio::run_qc(make_panel());
    const auto& gnomad = report.layers[layer_index(EvidenceLayer::GNOMAD)];
    expect(gnomad.outliers.has_value(), "gnomad outlier report", failed);
    if (gnomad.outliers) {
        const auto& o = *gnomad.outliers;
        expect(!o.skipped, "detection ran", failed);
        expect(near(o.median, 0.49), "median 0.49", failed);
        expect(near(o.mad, 0.05 * geneprio::stats::MAD_NORMAL_SCALE), "scaled MAD", failed);
        expect(o.count == 1, "exactly one outlier, got " + std::to_string(o.count), failed);
        expect(o.examples.size() == 1 && o.examples[0] == "G9", "G9 listed", failed);
    }

    // Example ordering and cap
    const std::vector<std::string> syms = {"a", "b", "c", "d", "e", "f", "g"};
    const std::vector<double> vals = {0.5, 0.5, 0.51, 0.49, 0.9, 0.0, 0.95};
    const auto o = geneprio::detect_mad_outliers(syms, vals, 3.0, 2);
    expect(o.count == 3, "three outliers, got " + std::to_string(o.count), failed);
    expect(o.examples.size() == 2 && o.examples[0] == "f" && o.examples[1] == "g",
           "largest deviations first, capped", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_errors() {
    std::cout << "[T4] out-of-range and empty composite errors\n";
    int failed = 0;

    auto recs = make_panel();
    for (auto& r : recs) r.composite_score.reset();

    geneprio::Diagnostics diag;
    diag.push_back({geneprio::DataIssueKind::OUT_OF_RANGE_SCORE, "expression", "2 values", 2});
    diag.push_back({geneprio::DataIssueKind::UNKNOWN_GENE_ID, "expression", "ignored", 7});

    const auto report = geneprio::run_qc(recs, {}, diag);
    expect(report.layers[layer_index(EvidenceLayer::EXPRESSION)].out_of_range == 2,
           "out-of-range count from diagnostics", failed);
    expect(report.layers[layer_index(EvidenceLayer::GNOMAD)].out_of_range == 0,
           "other layers unaffected", failed);
    expect(contains(report.errors, "expression: 2 value(s) outside [0,1]"),
           "out-of-range error listed", failed);
    expect(report.composite.non_null == 0 && !report.composite.stats, "no composite scores",
           failed);
    expect(contains(report.errors, "composite"), "empty composite is an error", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_composite_and_params() {
    std::cout << "[T5] composite distribution and parameter validation\n";
    int failed = 0;

    std::vector<geneprio::CompositeScoreRecord> recs;
    for (int i = 0; i <= 10; ++i) {
        auto r = make_record(i);
        r.layer_scores[0] = 0.1 * i;
        r.composite_score = 0.1 * i;
        r.evidence_count = 1;
        recs.push_back(r);
    }
    recs.push_back(make_record(99));  // no evidence at all

    const auto report = geneprio::run_qc(recs);
    const auto& c = report.composite;
    expect(c.total == 12 && c.non_null == 11, "composite counts", failed);
    expect(near(c.p10, 0.1) && near(c.p50, 0.5) && near(c.p90, 0.9), "composite percentiles",
           failed);
    expect(near(c.p25, 0.25) && near(c.p75, 0.75), "quartiles", failed);
    expect(c.stats && near(c.stats->mean, 0.5), "composite mean", failed);

    auto throws = [](const geneprio::QCParams& p) {
        try {
            p.validate();
        } catch (const geneprio::ConfigurationError&) {
            return true;
        }
        return false;
    };
    geneprio::QCParams p;
    expect(!throws(p), "defaults valid", failed);
    p.missing_warn = 0.9;
    expect(throws(p), "warn above error rejected", failed);
    p = {};
    p.mad_multiplier = 0.0;
    expect(throws(p), "zero multiplier rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_missingness();
    total += test_no_variation();
    total += test_mad_outliers();
    total += test_errors();
    total += test_composite_and_params();

    if (total == 0) {
        std::cout << "\nAll quality-control tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
