#pragma once
// Composite scoring engine
//
// Combines per-layer evidence into one NULL-preserving weighted score per
// gene:
//
//   available_weight = sum_{l present} w_l
//   composite        = sum_{l present} w_l * s_l / available_weight
//
// Dividing by the available (not total) weight keeps sparse genes from
// being penalised for missing layers, which also lets a gene with one
// strong layer outrank a gene with six moderate ones. evidence_count is
// exposed with every record so consumers can apply a breadth floor.
//
// Summation always runs in EvidenceLayer order, so repeated calls with
// identical inputs return bit-identical scores.

#include "geneprio/types.hpp"
#include "geneprio/weights.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace geneprio {

// gene_id -> score (absent = not measured) for one layer
using EvidenceTable = std::unordered_map<std::string, OptionalScore>;

// Evidence tables keyed by layer. A layer with no table is absent for
// every gene.
class EvidenceSet {
public:
    void set_layer(EvidenceLayer layer, EvidenceTable table);

    // Throws ConfigurationError if `name` is not an evidence layer
    void set_layer(const std::string& name, EvidenceTable table);

    bool has_layer(EvidenceLayer layer) const noexcept {
        return loaded_[layer_index(layer)];
    }
    const EvidenceTable& table(EvidenceLayer layer) const noexcept {
        return tables_[layer_index(layer)];
    }

private:
    LayerArray<EvidenceTable> tables_{};
    LayerArray<bool> loaded_{};
};

// Dense per-gene evidence aligned with the gene universe order
struct EvidenceMatrix {
    std::vector<LayerArray<OptionalScore>> rows;
};

// Align evidence with the universe. Values outside [0,1] or non-finite are
// dropped (treated as absent) and recorded; rows for IDs outside the
// universe are counted and ignored. `diagnostics` may be null.
EvidenceMatrix build_evidence_matrix(const std::vector<Gene>& genes,
                                     const EvidenceSet& evidence,
                                     Diagnostics* diagnostics = nullptr);

enum class QualityFlag : uint8_t {
    SUFFICIENT,
    MODERATE,
    SPARSE,
    NONE
};

const char* quality_flag_name(QualityFlag flag);

// Minimum evidence_count for each quality bucket
struct QualityFlagThresholds {
    uint32_t sufficient_min = 4;
    uint32_t moderate_min = 2;
    uint32_t sparse_min = 1;

    // Throws ConfigurationError unless 1 <= sparse <= moderate <= sufficient <= 6
    void validate() const;
};

QualityFlag classify_quality(uint32_t evidence_count, const QualityFlagThresholds& t);

struct CompositeScoreRecord {
    std::string gene_id;
    std::string gene_symbol;
    LayerArray<OptionalScore> layer_scores{};
    LayerArray<OptionalScore> contributions{};  // score * weight, present layers only
    OptionalScore composite_score;               // absent when no weighted evidence
    uint32_t evidence_count = 0;
    QualityFlag quality_flag = QualityFlag::NONE;
};

// Score every gene in universe order.
std::vector<CompositeScoreRecord> score_genes(const std::vector<Gene>& genes,
                                              const EvidenceMatrix& matrix,
                                              const ScoringWeights& weights,
                                              const QualityFlagThresholds& flags = {});

// Convenience overload that aligns `evidence` first.
std::vector<CompositeScoreRecord> score_genes(const std::vector<Gene>& genes,
                                              const EvidenceSet& evidence,
                                              const ScoringWeights& weights,
                                              const QualityFlagThresholds& flags = {},
                                              Diagnostics* diagnostics = nullptr);

// Indices of records with a composite score, ordered by score descending
// then gene_id ascending.
std::vector<size_t> rank_by_score(const std::vector<CompositeScoreRecord>& records);

// One canonical record per gene symbol: most evidence, then highest composite
// (absent lowest), then smallest gene_id. Output is ordered by symbol.
std::vector<CompositeScoreRecord> collapse_by_symbol(
    const std::vector<CompositeScoreRecord>& records);

// Comma-separated present / absent layer names, in layer order
std::string supporting_layers(const CompositeScoreRecord& record);
std::string evidence_gaps(const CompositeScoreRecord& record);

struct ScoringSummary {
    size_t total_genes = 0;
    size_t scored_genes = 0;
    std::optional<double> mean_score;
    std::optional<double> median_score;
    size_t sufficient = 0;
    size_t moderate = 0;
    size_t sparse = 0;
    size_t none = 0;
};

ScoringSummary summarize_scores(const std::vector<CompositeScoreRecord>& records);

}  // namespace geneprio
