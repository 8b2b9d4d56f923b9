#include "geneprio/types.hpp"

namespace geneprio {

const char* layer_name(EvidenceLayer layer) {
    switch (layer) {
        case EvidenceLayer::GNOMAD: return "gnomad";
        case EvidenceLayer::EXPRESSION: return "expression";
        case EvidenceLayer::ANNOTATION: return "annotation";
        case EvidenceLayer::LOCALIZATION: return "localization";
        case EvidenceLayer::ANIMAL_MODEL: return "animal_model";
        case EvidenceLayer::LITERATURE: return "literature";
    }
    return "unknown";
}

EvidenceLayer parse_layer(const std::string& name) {
    for (EvidenceLayer layer : ALL_LAYERS) {
        if (name == layer_name(layer)) return layer;
    }
    std::string valid;
    for (EvidenceLayer layer : ALL_LAYERS) {
        if (!valid.empty()) valid += ", ";
        valid += layer_name(layer);
    }
    throw ConfigurationError("Unknown evidence layer '" + name +
                             "' (expected one of: " + valid + ")");
}

const char* data_issue_kind_name(DataIssueKind kind) {
    switch (kind) {
        case DataIssueKind::OUT_OF_RANGE_SCORE: return "out_of_range_score";
        case DataIssueKind::UNPARSEABLE_SCORE: return "unparseable_score";
        case DataIssueKind::UNKNOWN_GENE_ID: return "unknown_gene_id";
        case DataIssueKind::DUPLICATE_GENE_ID: return "duplicate_gene_id";
        case DataIssueKind::DUPLICATE_EVIDENCE_ROW: return "duplicate_evidence_row";
        case DataIssueKind::CONTROL_GENE_MISSING: return "control_gene_missing";
    }
    return "unknown";
}

}  // namespace geneprio
