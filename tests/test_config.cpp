// tests/test_config.cpp
//
// JSON run configuration:
//   T1: empty object gives the defaults
//   T2: overrides merge over defaults, weights renormalization is not implied
//   T3: unknown sections, unknown keys and unknown layers are rejected
//   T4: invalid values fail validation with the origin in the message,
//       including counts that do not fit their field
//   T5: load_config reads a file and reports unreadable paths

#include "geneprio/config.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

using geneprio::EvidenceLayer;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

// Empty string when parsing succeeds, otherwise the ConfigurationError text
std::string config_error(const std::string& text) {
    try {
        (void)geneprio::parse_config(text, "test.json");
    } catch (const geneprio::ConfigurationError& e) {
        return e.what();
    }
    return "";
}

int test_defaults() {
    std::cout << "[T1] defaults\n";
    int failed = 0;

    const auto cfg = geneprio::parse_config("{}");
    expect(cfg.weights == geneprio::ScoringWeights::defaults(), "default weights", failed);
    expect(cfg.tiers.high_score == 0.70 && cfg.tiers.high_min_evidence == 3, "default tiers",
           failed);
    expect(cfg.controls.positive_percentile == 0.75 && cfg.controls.recall_k.size() == 4,
           "default control params", failed);
    expect(cfg.sensitivity.top_n == 100 && cfg.sensitivity.deltas.size() == 4,
           "default sensitivity params", failed);
    expect(cfg.positive_sets.empty() && cfg.negative_sets.empty(), "built-in controls", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_overrides() {
    std::cout << "[T2] overrides\n";
    int failed = 0;

    const auto cfg = geneprio::parse_config(R"({
        "weights": {"gnomad": 0.30, "expression": 0.10},
        "tiers": {"high_score": 0.8, "candidate_min_score": 0.1},
        "qc": {"mad_multiplier": 2.5},
        "controls": {"recall_k": [50, 250], "recall_fractions": [0.01],
                     "positive_sets": ["known.tsv"], "max_details": 5},
        "sensitivity": {"deltas": [-0.2, 0.2], "top_n": 250, "min_overlap": 20},
        "quality_flags": {"sufficient_min": 5}
    })");

    expect(near(cfg.weights[EvidenceLayer::GNOMAD], 0.30) &&
               near(cfg.weights[EvidenceLayer::EXPRESSION], 0.10) &&
               near(cfg.weights[EvidenceLayer::LITERATURE], 0.15),
           "weights merged over defaults", failed);
    expect(cfg.tiers.high_score == 0.8 && cfg.tiers.medium_score == 0.40 &&
               cfg.tiers.candidate_min_score == 0.1,
           "tier overrides", failed);
    expect(cfg.qc.mad_multiplier == 2.5 && cfg.qc.missing_warn == 0.50, "qc overrides", failed);
    expect(cfg.controls.recall_k.size() == 2 && cfg.controls.recall_k[1] == 250 &&
               cfg.controls.recall_fractions.size() == 1 && cfg.controls.max_details == 5,
           "control overrides", failed);
    expect(cfg.positive_sets.size() == 1 && cfg.positive_sets[0] == "known.tsv",
           "control set paths", failed);
    expect(cfg.sensitivity.deltas.size() == 2 && cfg.sensitivity.top_n == 250 &&
               cfg.sensitivity.min_overlap == 20,
           "sensitivity overrides", failed);
    expect(cfg.quality_flags.sufficient_min == 5 && cfg.quality_flags.moderate_min == 2,
           "quality flag overrides", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_unknown_keys() {
    std::cout << "[T3] unknown sections, keys and layers\n";
    int failed = 0;

    expect(config_error(R"({"scoring": {}})").find("Unknown key 'scoring'") != std::string::npos,
           "unknown section rejected", failed);
    expect(config_error(R"({"tiers": {"high": 0.8}})").find("'high'") != std::string::npos,
           "unknown tier key rejected", failed);
    expect(config_error(R"({"weights": {"gwas": 0.1}})").find("gwas") != std::string::npos,
           "unknown layer rejected", failed);
    expect(config_error(R"({"tiers": [1, 2]})").find("must be an object") != std::string::npos,
           "non-object section rejected", failed);
    expect(config_error("{not json").find("test.json") == 0, "parse errors name the origin",
           failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_invalid_values() {
    std::cout << "[T4] invalid values\n";
    int failed = 0;

    // Merged weights no longer sum to one
    expect(config_error(R"({"weights": {"gnomad": 0.5}})").find("sum to 1.0") !=
               std::string::npos,
           "weight sum enforced", failed);
    expect(config_error(R"({"weights": {"gnomad": -0.1, "expression": 0.5}})")
                   .find("must be in [0, 1]") != std::string::npos,
           "negative weight rejected", failed);
    expect(!config_error(R"({"tiers": {"medium_score": 0.9}})").empty(),
           "medium above high rejected", failed);
    expect(!config_error(R"({"controls": {"recall_k": [100, 0]}})").empty(),
           "zero recall k rejected", failed);
    expect(!config_error(R"({"sensitivity": {"top_n": -5}})").empty(), "negative top_n rejected",
           failed);
    expect(!config_error(R"({"sensitivity": {"deltas": []}})").empty(), "empty deltas rejected",
           failed);
    expect(!config_error(R"({"qc": {"missing_warn": "high"}})").empty(),
           "type errors reported", failed);

    // 2^32 + 1 must not wrap to 1 in a 32-bit count
    expect(config_error(R"({"tiers": {"high_min_evidence": 4294967297}})").find("too large") !=
               std::string::npos,
           "count above uint32 range rejected", failed);
    expect(config_error(R"({"quality_flags": {"sparse_min": 1.5}})").find("must be an integer") !=
               std::string::npos,
           "fractional count rejected", failed);
    expect(config_error(R"({"tiers": {"high_min_evidence": 4294967295, "medium_min_evidence": 1}})")
               .find("got 4294967295") != std::string::npos,
           "uint32 maximum reaches tier validation unwrapped", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_load_file() {
    std::cout << "[T5] load_config\n";
    int failed = 0;

    const auto path = std::filesystem::temp_directory_path() / "geneprio_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"sensitivity": {"top_n": 42}})";
    }
    try {
        const auto cfg = geneprio::load_config(path.string());
        expect(cfg.sensitivity.top_n == 42, "value read from file", failed);
    } catch (const geneprio::ConfigurationError& e) {
        expect(false, std::string("unexpected error: ") + e.what(), failed);
    }
    std::remove(path.string().c_str());

    bool threw = false;
    try {
        (void)geneprio::load_config("/nonexistent/geneprio.json");
    } catch (const geneprio::ConfigurationError& e) {
        threw = std::string(e.what()).find("/nonexistent/geneprio.json") != std::string::npos;
    }
    expect(threw, "missing file reported", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_defaults();
    total += test_overrides();
    total += test_unknown_keys();
    total += test_invalid_values();
    total += test_load_file();

    if (total == 0) {
        std::cout << "\nAll config tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
