#pragma once
// Advisory diagnostics over a scoring run: per-layer missingness and
// distribution shape, MAD outliers and the composite score distribution.
// QC findings never stop the pipeline; they are carried into the report.

#include "geneprio/scoring.hpp"
#include "geneprio/stats.hpp"

#include <optional>
#include <string>
#include <vector>

namespace geneprio {

struct QCParams {
    double mad_multiplier = 3.0;   // outlier if |x - median| > k * MAD
    double missing_warn = 0.50;    // missing rate above this is a warning
    double missing_error = 0.80;   // missing rate above this is an error
    double min_std = 0.01;         // std below this flags a layer with no variation
    size_t max_examples = 5;       // outlier symbols listed per series

    // Throws ConfigurationError
    void validate() const;
};

enum class QCSeverity : uint8_t { OK, WARNING, ERROR };

const char* qc_severity_name(QCSeverity severity);

struct LayerMissingness {
    EvidenceLayer layer = EvidenceLayer::GNOMAD;
    size_t total = 0;
    size_t missing = 0;
    double missing_rate = 0.0;
    QCSeverity severity = QCSeverity::OK;
};

struct OutlierReport {
    bool skipped = false;          // MAD == 0, detection not meaningful
    double median = 0.0;
    double mad = 0.0;              // scaled by MAD_NORMAL_SCALE
    double lower = 0.0;
    double upper = 0.0;
    size_t count = 0;
    std::vector<std::string> examples;  // gene symbols, largest deviation first
};

struct LayerDistribution {
    EvidenceLayer layer = EvidenceLayer::GNOMAD;
    std::optional<stats::SummaryStats> stats;  // absent when no gene has the layer
    bool no_variation = false;
    size_t out_of_range = 0;       // values dropped upstream as outside [0,1]
    std::optional<OutlierReport> outliers;
};

struct CompositeDistribution {
    size_t total = 0;
    size_t non_null = 0;
    std::optional<stats::SummaryStats> stats;
    double p10 = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    std::optional<OutlierReport> outliers;
};

struct QCReport {
    std::vector<LayerMissingness> missing;
    std::vector<LayerDistribution> layers;
    CompositeDistribution composite;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    bool passed() const { return errors.empty(); }
};

// MAD outlier detection over (symbol, value) pairs
OutlierReport detect_mad_outliers(const std::vector<std::string>& symbols,
                                  const std::vector<double>& values,
                                  double multiplier, size_t max_examples);

// Out-of-range values are taken from OUT_OF_RANGE_SCORE entries in
// `diagnostics`, since the engine has already dropped them.
QCReport run_qc(const std::vector<CompositeScoreRecord>& records,
                const QCParams& params = {},
                const Diagnostics& diagnostics = {});

}  // namespace geneprio
