#include "geneprio/scoring.hpp"
#include "geneprio/stats.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_set>

namespace geneprio {

void EvidenceSet::set_layer(EvidenceLayer layer, EvidenceTable table) {
    const size_t li = layer_index(layer);
    tables_[li] = std::move(table);
    loaded_[li] = true;
}

void EvidenceSet::set_layer(const std::string& name, EvidenceTable table) {
    set_layer(parse_layer(name), std::move(table));
}

EvidenceMatrix build_evidence_matrix(const std::vector<Gene>& genes,
                                     const EvidenceSet& evidence,
                                     Diagnostics* diagnostics) {
    EvidenceMatrix matrix;
    matrix.rows.resize(genes.size());

    std::unordered_set<std::string> universe;
    universe.reserve(genes.size());
    for (const auto& g : genes) universe.insert(g.gene_id);

    for (EvidenceLayer layer : ALL_LAYERS) {
        if (!evidence.has_layer(layer)) continue;
        const size_t li = layer_index(layer);
        const EvidenceTable& table = evidence.table(layer);

        size_t out_of_range = 0;
        std::string first_bad;
        for (size_t i = 0; i < genes.size(); ++i) {
            auto it = table.find(genes[i].gene_id);
            if (it == table.end() || !it->second) continue;
            const double v = *it->second;
            if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
                if (out_of_range == 0) first_bad = genes[i].gene_id;
                ++out_of_range;
                continue;
            }
            matrix.rows[i][li] = v;
        }

        size_t unknown = 0;
        for (const auto& [gene_id, value] : table) {
            if (!universe.count(gene_id)) ++unknown;
        }

        if (diagnostics && out_of_range > 0) {
            diagnostics->push_back({DataIssueKind::OUT_OF_RANGE_SCORE, layer_name(layer),
                                    std::to_string(out_of_range) +
                                        " score(s) outside [0,1] treated as absent (first: " +
                                        first_bad + ")",
                                    out_of_range});
        }
        if (diagnostics && unknown > 0) {
            diagnostics->push_back({DataIssueKind::UNKNOWN_GENE_ID, layer_name(layer),
                                    std::to_string(unknown) +
                                        " evidence row(s) for gene IDs outside the universe ignored",
                                    unknown});
        }
    }
    return matrix;
}

const char* quality_flag_name(QualityFlag flag) {
    switch (flag) {
        case QualityFlag::SUFFICIENT: return "sufficient";
        case QualityFlag::MODERATE: return "moderate";
        case QualityFlag::SPARSE: return "sparse";
        case QualityFlag::NONE: return "none";
    }
    return "unknown";
}

void QualityFlagThresholds::validate() const {
    if (sparse_min < 1) {
        throw ConfigurationError("quality_flags.sparse_min must be >= 1");
    }
    if (moderate_min < sparse_min || sufficient_min < moderate_min) {
        throw ConfigurationError(
            "quality_flags must satisfy sparse_min <= moderate_min <= sufficient_min");
    }
    if (sufficient_min > NUM_LAYERS) {
        throw ConfigurationError("quality_flags.sufficient_min cannot exceed " +
                                 std::to_string(NUM_LAYERS));
    }
}

QualityFlag classify_quality(uint32_t evidence_count, const QualityFlagThresholds& t) {
    if (evidence_count == 0) return QualityFlag::NONE;
    if (evidence_count >= t.sufficient_min) return QualityFlag::SUFFICIENT;
    if (evidence_count >= t.moderate_min) return QualityFlag::MODERATE;
    if (evidence_count >= t.sparse_min) return QualityFlag::SPARSE;
    return QualityFlag::NONE;
}

std::vector<CompositeScoreRecord> score_genes(const std::vector<Gene>& genes,
                                              const EvidenceMatrix& matrix,
                                              const ScoringWeights& weights,
                                              const QualityFlagThresholds& flags) {
    if (matrix.rows.size() != genes.size()) {
        throw InputError("Evidence matrix has " + std::to_string(matrix.rows.size()) +
                         " rows for " + std::to_string(genes.size()) + " genes");
    }

    std::vector<CompositeScoreRecord> records(genes.size());
    for (size_t i = 0; i < genes.size(); ++i) {
        CompositeScoreRecord& rec = records[i];
        rec.gene_id = genes[i].gene_id;
        rec.gene_symbol = genes[i].gene_symbol;
        rec.layer_scores = matrix.rows[i];

        double available_weight = 0.0;
        double weighted_sum = 0.0;
        for (EvidenceLayer layer : ALL_LAYERS) {
            const size_t li = layer_index(layer);
            if (!rec.layer_scores[li]) continue;
            const double w = weights[layer];
            const double c = w * *rec.layer_scores[li];
            rec.contributions[li] = c;
            available_weight += w;
            weighted_sum += c;
            ++rec.evidence_count;
        }

        // Present layers that all carry zero weight leave nothing to average
        if (available_weight > 0.0) {
            rec.composite_score = std::clamp(weighted_sum / available_weight, 0.0, 1.0);
        }
        rec.quality_flag = classify_quality(rec.evidence_count, flags);
    }
    return records;
}

std::vector<CompositeScoreRecord> score_genes(const std::vector<Gene>& genes,
                                              const EvidenceSet& evidence,
                                              const ScoringWeights& weights,
                                              const QualityFlagThresholds& flags,
                                              Diagnostics* diagnostics) {
    return score_genes(genes, build_evidence_matrix(genes, evidence, diagnostics),
                       weights, flags);
}

std::vector<size_t> rank_by_score(const std::vector<CompositeScoreRecord>& records) {
    std::vector<size_t> order;
    order.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].composite_score) order.push_back(i);
    }
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const double sa = *records[a].composite_score;
        const double sb = *records[b].composite_score;
        if (sa != sb) return sa > sb;
        return records[a].gene_id < records[b].gene_id;
    });
    return order;
}

namespace {

// True if `a` should replace `b` as the canonical record for a symbol
bool preferred_over(const CompositeScoreRecord& a, const CompositeScoreRecord& b) {
    if (a.evidence_count != b.evidence_count) return a.evidence_count > b.evidence_count;
    if (a.composite_score.has_value() != b.composite_score.has_value()) {
        return a.composite_score.has_value();
    }
    if (a.composite_score && *a.composite_score != *b.composite_score) {
        return *a.composite_score > *b.composite_score;
    }
    return a.gene_id < b.gene_id;
}

std::string join_layers(const CompositeScoreRecord& record, bool present) {
    std::string out;
    for (EvidenceLayer layer : ALL_LAYERS) {
        if (record.layer_scores[layer_index(layer)].has_value() != present) continue;
        if (!out.empty()) out += ',';
        out += layer_name(layer);
    }
    return out;
}

}  // namespace

std::vector<CompositeScoreRecord> collapse_by_symbol(
    const std::vector<CompositeScoreRecord>& records) {
    std::map<std::string, size_t> best;
    for (size_t i = 0; i < records.size(); ++i) {
        auto [it, inserted] = best.emplace(records[i].gene_symbol, i);
        if (!inserted && preferred_over(records[i], records[it->second])) {
            it->second = i;
        }
    }

    std::vector<CompositeScoreRecord> out;
    out.reserve(best.size());
    for (const auto& [symbol, idx] : best) out.push_back(records[idx]);
    return out;
}

std::string supporting_layers(const CompositeScoreRecord& record) {
    return join_layers(record, true);
}

std::string evidence_gaps(const CompositeScoreRecord& record) {
    return join_layers(record, false);
}

ScoringSummary summarize_scores(const std::vector<CompositeScoreRecord>& records) {
    ScoringSummary s;
    s.total_genes = records.size();

    std::vector<double> scores;
    scores.reserve(records.size());
    for (const auto& r : records) {
        if (r.composite_score) scores.push_back(*r.composite_score);
        switch (r.quality_flag) {
            case QualityFlag::SUFFICIENT: ++s.sufficient; break;
            case QualityFlag::MODERATE: ++s.moderate; break;
            case QualityFlag::SPARSE: ++s.sparse; break;
            case QualityFlag::NONE: ++s.none; break;
        }
    }
    s.scored_genes = scores.size();
    if (auto st = stats::summarize(scores)) {
        s.mean_score = st->mean;
        s.median_score = st->median;
    }
    return s;
}

}  // namespace geneprio
