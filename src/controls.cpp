#include "geneprio/controls.hpp"
#include "geneprio/stats.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <sstream>

namespace geneprio {

ControlSet omim_usher_genes() {
    return {"OMIM_USHER", "omim_usher",
            {"MYO7A", "USH1C", "CDH23", "PCDH15", "USH1G", "CIB2",
             "USH2A", "ADGRV1", "WHRN", "CLRN1"}};
}

ControlSet syscilia_core_genes() {
    return {"SYSCILIA_SCGS_V2_CORE", "syscilia_scgs_v2",
            {"IFT88", "IFT140", "IFT172", "BBS1", "BBS2", "BBS4", "BBS5",
             "BBS7", "BBS9", "BBS10", "RPGRIP1L", "CEP290", "ARL13B", "INPP5E",
             "TMEM67", "CC2D2A", "NPHP1", "NPHP3", "NPHP4", "RPGR", "CEP164",
             "OFD1", "MKS1", "TCTN1", "TCTN2", "TMEM216", "TMEM231", "TMEM138"}};
}

ControlSet housekeeping_genes() {
    return {"HOUSEKEEPING_CORE", "literature_validated",
            {"RPL13A", "RPL32", "RPLP0", "GAPDH", "ACTB", "PGK1", "SDHA",
             "B2M", "HPRT1", "TBP", "PPIA", "UBC", "YWHAZ"}};
}

std::vector<ControlSet> builtin_positive_controls() {
    return {omim_usher_genes(), syscilia_core_genes()};
}

std::vector<ControlSet> builtin_negative_controls() {
    return {housekeeping_genes()};
}

PercentileRanking::PercentileRanking(const std::vector<CompositeScoreRecord>& records)
    : canonical_(collapse_by_symbol(records)) {
    std::vector<size_t> scored;
    std::vector<double> scores;
    for (size_t i = 0; i < canonical_.size(); ++i) {
        if (!canonical_[i].composite_score) continue;
        scored.push_back(i);
        scores.push_back(*canonical_[i].composite_score);
    }

    const std::vector<double> avg = stats::average_ranks(scores);
    const double n = static_cast<double>(scores.size());
    ranked_.resize(scores.size());
    for (size_t j = 0; j < scored.size(); ++j) {
        ranked_[j].record = scored[j];
        ranked_[j].composite_score = scores[j];
        ranked_[j].percentile = avg[j] / n;
    }

    std::sort(ranked_.begin(), ranked_.end(), [&](const RankedGene& a, const RankedGene& b) {
        if (a.composite_score != b.composite_score) return a.composite_score > b.composite_score;
        return canonical_[a.record].gene_id < canonical_[b.record].gene_id;
    });
    for (size_t r = 0; r < ranked_.size(); ++r) {
        ranked_[r].rank = r + 1;
        by_symbol_.emplace(canonical_[ranked_[r].record].gene_symbol, r);
    }
}

const RankedGene* PercentileRanking::find(const std::string& symbol) const {
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) return nullptr;
    return &ranked_[it->second];
}

void ControlParams::validate() const {
    for (double v : {positive_percentile, negative_percentile, top_quartile}) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            throw ConfigurationError("controls percentile thresholds must be in [0,1]");
        }
    }
    for (size_t k : recall_k) {
        if (k == 0) throw ConfigurationError("controls.recall_k values must be positive");
    }
    for (double f : recall_fractions) {
        if (!std::isfinite(f) || f <= 0.0 || f > 1.0) {
            throw ConfigurationError("controls.recall_fractions must be in (0,1]");
        }
    }
}

const char* validation_status_name(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::PASSED: return "PASSED";
        case ValidationStatus::FAILED: return "FAILED";
        case ValidationStatus::INDETERMINATE: return "INDETERMINATE";
    }
    return "UNKNOWN";
}

RecallAtK recall_at_k(const PercentileRanking& ranking,
                      const std::vector<const RankedGene*>& controls,
                      size_t k, const std::string& label) {
    RecallAtK r;
    r.label = label;
    r.k = std::min(k, ranking.size());
    for (const RankedGene* g : controls) {
        if (g->rank <= r.k) ++r.hits;
    }
    if (!controls.empty()) {
        r.recall = static_cast<double>(r.hits) / static_cast<double>(controls.size());
    }
    return r;
}

std::vector<RecallAtK> recall_table(const PercentileRanking& ranking,
                                    const std::vector<const RankedGene*>& controls,
                                    const ControlParams& params) {
    std::vector<RecallAtK> out;
    for (size_t k : params.recall_k) {
        out.push_back(recall_at_k(ranking, controls, k, std::to_string(k)));
    }
    for (double f : params.recall_fractions) {
        const size_t k = static_cast<size_t>(std::floor(f * static_cast<double>(ranking.size())));
        std::ostringstream label;
        label << (f * 100.0) << "%";
        out.push_back(recall_at_k(ranking, controls, k, label.str()));
    }
    return out;
}

namespace {

struct ControlIndex {
    std::vector<std::string> symbols;                       // unique, first-seen order
    std::vector<std::string> sources;                       // unique, first-seen order
    std::vector<std::vector<std::string>> source_symbols;   // parallel to sources
    std::unordered_map<std::string, std::string> symbol_sources;
};

ControlIndex index_controls(const std::vector<ControlSet>& sets) {
    ControlIndex idx;
    std::set<std::string> seen;
    std::map<std::string, size_t> source_pos;
    std::vector<std::set<std::string>> source_seen;
    for (const auto& set : sets) {
        auto [it, inserted] = source_pos.emplace(set.source, idx.sources.size());
        if (inserted) {
            idx.sources.push_back(set.source);
            idx.source_symbols.emplace_back();
            source_seen.emplace_back();
        }
        const size_t sp = it->second;
        for (const auto& sym : set.symbols) {
            if (seen.insert(sym).second) idx.symbols.push_back(sym);
            if (source_seen[sp].insert(sym).second) {
                idx.source_symbols[sp].push_back(sym);
                std::string& tag = idx.symbol_sources[sym];
                if (!tag.empty()) tag += ',';
                tag += set.source;
            }
        }
    }
    return idx;
}

std::optional<double> median_percentile(const std::vector<const RankedGene*>& genes) {
    std::vector<double> p;
    p.reserve(genes.size());
    for (const RankedGene* g : genes) p.push_back(g->percentile);
    return stats::median(std::move(p));
}

size_t count_top_quartile(const std::vector<const RankedGene*>& genes, double cutoff) {
    size_t n = 0;
    for (const RankedGene* g : genes) {
        if (g->percentile >= cutoff) ++n;
    }
    return n;
}

std::vector<LayerElevation> layer_elevation(const PercentileRanking& ranking,
                                            const std::vector<const RankedGene*>& found) {
    const auto& records = ranking.records();
    std::vector<LayerElevation> out;
    for (EvidenceLayer layer : ALL_LAYERS) {
        const size_t li = layer_index(layer);
        LayerElevation e;
        e.layer = layer;

        double pop_sum = 0.0;
        size_t pop_n = 0;
        for (const auto& r : records) {
            if (!r.layer_scores[li]) continue;
            pop_sum += *r.layer_scores[li];
            ++pop_n;
        }
        double ctl_sum = 0.0;
        for (const RankedGene* g : found) {
            const auto& s = records[g->record].layer_scores[li];
            if (!s) continue;
            ctl_sum += *s;
            ++e.controls_with_layer;
        }

        if (pop_n > 0) e.population_mean = pop_sum / static_cast<double>(pop_n);
        if (e.controls_with_layer > 0) {
            e.control_mean = ctl_sum / static_cast<double>(e.controls_with_layer);
        }
        if (e.population_mean && e.control_mean) {
            e.elevation = *e.control_mean - *e.population_mean;
        }
        out.push_back(e);
    }
    return out;
}

ControlValidationResult validate_controls(const PercentileRanking& ranking,
                                          const std::vector<ControlSet>& sets,
                                          const ControlParams& params,
                                          const TierThresholds& tiers,
                                          bool positive,
                                          Diagnostics* diagnostics) {
    ControlValidationResult res;
    res.positive = positive;
    res.threshold = positive ? params.positive_percentile : params.negative_percentile;

    const ControlIndex idx = index_controls(sets);
    res.total_expected = idx.symbols.size();

    std::vector<const RankedGene*> found;
    for (const auto& sym : idx.symbols) {
        const RankedGene* g = ranking.find(sym);
        if (g) {
            found.push_back(g);
        } else {
            res.missing_symbols.push_back(sym);
        }
    }
    res.total_found = found.size();

    if (diagnostics && !res.missing_symbols.empty()) {
        std::string list;
        for (const auto& sym : res.missing_symbols) {
            if (!list.empty()) list += ", ";
            list += sym;
        }
        diagnostics->push_back({DataIssueKind::CONTROL_GENE_MISSING,
                                positive ? "positive controls" : "negative controls",
                                std::to_string(res.missing_symbols.size()) + " of " +
                                    std::to_string(res.total_expected) +
                                    " control symbols absent from the scored population: " + list,
                                res.missing_symbols.size()});
    }

    res.median_percentile = median_percentile(found);
    res.top_quartile_count = count_top_quartile(found, params.top_quartile);
    if (!found.empty()) {
        res.top_quartile_fraction =
            static_cast<double>(res.top_quartile_count) / static_cast<double>(found.size());
    }
    for (const RankedGene* g : found) {
        if (classify(ranking.records()[g->record], tiers) == Tier::HIGH) ++res.high_tier_count;
    }

    if (!res.median_percentile) {
        res.status = ValidationStatus::INDETERMINATE;
    } else if (positive) {
        res.status = *res.median_percentile >= res.threshold ? ValidationStatus::PASSED
                                                             : ValidationStatus::FAILED;
    } else {
        res.status = *res.median_percentile < res.threshold ? ValidationStatus::PASSED
                                                            : ValidationStatus::FAILED;
    }

    if (positive) res.recall = recall_table(ranking, found, params);

    for (size_t s = 0; s < idx.sources.size(); ++s) {
        SourceBreakdown b;
        b.source = idx.sources[s];
        b.expected = idx.source_symbols[s].size();
        std::vector<const RankedGene*> src_found;
        for (const auto& sym : idx.source_symbols[s]) {
            if (const RankedGene* g = ranking.find(sym)) src_found.push_back(g);
        }
        b.found = src_found.size();
        b.median_percentile = median_percentile(src_found);
        b.top_quartile_count = count_top_quartile(src_found, params.top_quartile);
        if (positive) b.recall = recall_table(ranking, src_found, params);
        res.per_source.push_back(std::move(b));
    }

    std::vector<const RankedGene*> ordered = found;
    std::sort(ordered.begin(), ordered.end(), [positive](const RankedGene* a, const RankedGene* b) {
        return positive ? a->rank < b->rank : a->rank > b->rank;
    });
    for (size_t i = 0; i < ordered.size() && i < params.max_details; ++i) {
        const CompositeScoreRecord& rec = ranking.records()[ordered[i]->record];
        ControlGeneDetail d;
        d.gene_symbol = rec.gene_symbol;
        d.gene_id = rec.gene_id;
        d.sources = idx.symbol_sources.at(rec.gene_symbol);
        d.composite_score = ordered[i]->composite_score;
        d.percentile = ordered[i]->percentile;
        d.rank = ordered[i]->rank;
        d.evidence_count = rec.evidence_count;
        d.tier = classify(rec, tiers);
        res.details.push_back(std::move(d));
    }

    res.elevation = layer_elevation(ranking, found);
    return res;
}

}  // namespace

ControlValidationResult validate_positive_controls(const PercentileRanking& ranking,
                                                   const std::vector<ControlSet>& sets,
                                                   const ControlParams& params,
                                                   const TierThresholds& tiers,
                                                   Diagnostics* diagnostics) {
    return validate_controls(ranking, sets, params, tiers, true, diagnostics);
}

ControlValidationResult validate_negative_controls(const PercentileRanking& ranking,
                                                   const std::vector<ControlSet>& sets,
                                                   const ControlParams& params,
                                                   const TierThresholds& tiers,
                                                   Diagnostics* diagnostics) {
    return validate_controls(ranking, sets, params, tiers, false, diagnostics);
}

}  // namespace geneprio
