#include "geneprio/quality_control.hpp"
#include "geneprio/log_utils.hpp"

#include <algorithm>
#include <cmath>

namespace geneprio {

void QCParams::validate() const {
    if (!std::isfinite(mad_multiplier) || mad_multiplier <= 0.0) {
        throw ConfigurationError("qc.mad_multiplier must be positive");
    }
    for (double v : {missing_warn, missing_error}) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            throw ConfigurationError("qc missing-rate thresholds must be in [0,1]");
        }
    }
    if (missing_warn > missing_error) {
        throw ConfigurationError("qc.missing_warn cannot exceed qc.missing_error");
    }
    if (!std::isfinite(min_std) || min_std < 0.0) {
        throw ConfigurationError("qc.min_std must be non-negative");
    }
}

const char* qc_severity_name(QCSeverity severity) {
    switch (severity) {
        case QCSeverity::OK: return "ok";
        case QCSeverity::WARNING: return "warning";
        case QCSeverity::ERROR: return "error";
    }
    return "unknown";
}

OutlierReport detect_mad_outliers(const std::vector<std::string>& symbols,
                                  const std::vector<double>& values,
                                  double multiplier, size_t max_examples) {
    OutlierReport out;
    const auto med = stats::median(values);
    if (!med) {
        out.skipped = true;
        return out;
    }
    out.median = *med;
    out.mad = stats::mad(values, out.median).value_or(0.0);
    if (out.mad == 0.0) {
        out.skipped = true;
        return out;
    }
    out.lower = out.median - multiplier * out.mad;
    out.upper = out.median + multiplier * out.mad;

    std::vector<size_t> flagged;
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::abs(values[i] - out.median) > multiplier * out.mad) flagged.push_back(i);
    }
    out.count = flagged.size();

    std::stable_sort(flagged.begin(), flagged.end(), [&](size_t a, size_t b) {
        return std::abs(values[a] - out.median) > std::abs(values[b] - out.median);
    });
    for (size_t i = 0; i < flagged.size() && i < max_examples; ++i) {
        out.examples.push_back(symbols[flagged[i]]);
    }
    return out;
}

QCReport run_qc(const std::vector<CompositeScoreRecord>& records,
                const QCParams& params,
                const Diagnostics& diagnostics) {
    QCReport report;
    const size_t total = records.size();
    if (total == 0) {
        report.warnings.push_back("No genes were scored; QC has nothing to check");
    }

    for (EvidenceLayer layer : ALL_LAYERS) {
        const size_t li = layer_index(layer);
        const std::string name = layer_name(layer);

        std::vector<std::string> symbols;
        std::vector<double> values;
        for (const auto& r : records) {
            if (!r.layer_scores[li]) continue;
            symbols.push_back(r.gene_symbol);
            values.push_back(*r.layer_scores[li]);
        }

        LayerMissingness miss;
        miss.layer = layer;
        miss.total = total;
        miss.missing = total - values.size();
        miss.missing_rate = total > 0 ? static_cast<double>(miss.missing) / total : 0.0;
        if (miss.missing_rate > params.missing_error) {
            miss.severity = QCSeverity::ERROR;
            report.errors.push_back(name + ": " + log_utils::format_percent(miss.missing_rate) +
                                    " of genes missing (above " +
                                    log_utils::format_percent(params.missing_error) + ")");
        } else if (miss.missing_rate > params.missing_warn) {
            miss.severity = QCSeverity::WARNING;
            report.warnings.push_back(name + ": " + log_utils::format_percent(miss.missing_rate) +
                                      " of genes missing (above " +
                                      log_utils::format_percent(params.missing_warn) + ")");
        }
        report.missing.push_back(miss);

        LayerDistribution dist;
        dist.layer = layer;
        for (const auto& issue : diagnostics) {
            if (issue.kind == DataIssueKind::OUT_OF_RANGE_SCORE && issue.context == name) {
                dist.out_of_range += issue.count;
            }
        }
        if (dist.out_of_range > 0) {
            report.errors.push_back(name + ": " + std::to_string(dist.out_of_range) +
                                    " value(s) outside [0,1]");
        }

        dist.stats = stats::summarize(values);
        if (dist.stats) {
            if (dist.stats->count > 1 && dist.stats->std < params.min_std) {
                dist.no_variation = true;
                report.warnings.push_back(name + ": no variation (std " +
                                          log_utils::format_fixed(dist.stats->std) + ")");
            }
            dist.outliers = detect_mad_outliers(symbols, values, params.mad_multiplier,
                                                params.max_examples);
            if (dist.outliers->count > 0) {
                report.warnings.push_back(name + ": " + std::to_string(dist.outliers->count) +
                                          " MAD outlier(s)");
            }
        }
        report.layers.push_back(std::move(dist));
    }

    CompositeDistribution& comp = report.composite;
    comp.total = total;
    std::vector<std::string> symbols;
    std::vector<double> values;
    for (const auto& r : records) {
        if (!r.composite_score) continue;
        symbols.push_back(r.gene_symbol);
        values.push_back(*r.composite_score);
    }
    comp.non_null = values.size();
    comp.stats = stats::summarize(values);
    if (comp.stats) {
        std::vector<double> sorted = values;
        std::sort(sorted.begin(), sorted.end());
        comp.p10 = stats::quantile_sorted(sorted, 0.10);
        comp.p25 = stats::quantile_sorted(sorted, 0.25);
        comp.p50 = stats::quantile_sorted(sorted, 0.50);
        comp.p75 = stats::quantile_sorted(sorted, 0.75);
        comp.p90 = stats::quantile_sorted(sorted, 0.90);
        comp.outliers = detect_mad_outliers(symbols, values, params.mad_multiplier,
                                            params.max_examples);
        if (comp.outliers->count > 0) {
            report.warnings.push_back("composite: " + std::to_string(comp.outliers->count) +
                                      " MAD outlier(s)");
        }
    } else if (total > 0) {
        report.errors.push_back("composite: no gene has a composite score");
    }

    return report;
}

}  // namespace geneprio
