#pragma once
// Core vocabulary shared by every stage: the closed set of evidence layers,
// gene identity, nullable scores and the error taxonomy.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace geneprio {

// Evidence layers, in the fixed order used for summation and reporting.
enum class EvidenceLayer : uint8_t {
    GNOMAD = 0,        // genetic constraint (LOEUF)
    EXPRESSION = 1,    // tissue expression specificity
    ANNOTATION = 2,    // annotation depth / protein features
    LOCALIZATION = 3,  // subcellular localization
    ANIMAL_MODEL = 4,  // animal-model phenotypes
    LITERATURE = 5     // literature evidence
};

constexpr size_t NUM_LAYERS = 6;

constexpr std::array<EvidenceLayer, NUM_LAYERS> ALL_LAYERS = {
    EvidenceLayer::GNOMAD,
    EvidenceLayer::EXPRESSION,
    EvidenceLayer::ANNOTATION,
    EvidenceLayer::LOCALIZATION,
    EvidenceLayer::ANIMAL_MODEL,
    EvidenceLayer::LITERATURE,
};

constexpr size_t layer_index(EvidenceLayer layer) {
    return static_cast<size_t>(layer);
}

// Per-layer storage indexed by layer_index()
template <typename T>
using LayerArray = std::array<T, NUM_LAYERS>;

// Nullable numeric value: absent means "not measured", never zero.
using OptionalScore = std::optional<double>;

const char* layer_name(EvidenceLayer layer);

// Parse a layer name ("gnomad", "animal_model", ...).
// Throws ConfigurationError for anything outside the enumeration.
EvidenceLayer parse_layer(const std::string& name);

struct Gene {
    std::string gene_id;      // primary identifier (e.g. ENSG...)
    std::string gene_symbol;  // human-readable, many-to-one
};

// Invalid weights, thresholds, layer names or config files.
// Always fatal and raised before any scoring happens.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Unreadable or structurally malformed input tables.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Recoverable data problems. Recorded, excluded from the affected
// computation and surfaced as caveats in the validation report.
enum class DataIssueKind : uint8_t {
    OUT_OF_RANGE_SCORE,
    UNPARSEABLE_SCORE,
    UNKNOWN_GENE_ID,
    DUPLICATE_GENE_ID,
    DUPLICATE_EVIDENCE_ROW,
    CONTROL_GENE_MISSING
};

const char* data_issue_kind_name(DataIssueKind kind);

struct DataIssue {
    DataIssueKind kind;
    std::string context;   // file, layer or control set the issue came from
    std::string message;
    size_t count = 1;      // number of affected rows/genes
};

using Diagnostics = std::vector<DataIssue>;

}  // namespace geneprio
