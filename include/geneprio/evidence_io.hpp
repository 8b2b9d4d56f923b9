#pragma once
// Tabular I/O at the boundary with the evidence store: gene universe,
// per-layer evidence tables and control sets in, score tables out.
// Inputs may be plain or gzip-compressed; zlib reads both transparently.

#include "geneprio/controls.hpp"
#include "geneprio/scoring.hpp"
#include "geneprio/sensitivity.hpp"
#include "geneprio/tiers.hpp"

#include <zlib.h>

#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace geneprio {

// Line reader over gzopen(); plain files pass through unchanged.
class TsvReader {
public:
    static constexpr unsigned GZBUF_SIZE = 1024 * 1024;

    // Throws InputError if the file cannot be opened
    explicit TsvReader(const std::string& path);
    ~TsvReader();

    TsvReader(const TsvReader&) = delete;
    TsvReader& operator=(const TsvReader&) = delete;

    // Read one line without trailing newline/CR. Returns false on EOF.
    bool readline(std::string& line);

    const std::string& path() const { return path_; }
    size_t line_number() const { return line_no_; }

private:
    std::string path_;
    gzFile file_ = nullptr;
    size_t line_no_ = 0;
};

std::vector<std::string> split_tsv(const std::string& line);

// NA, NaN, NULL, null, None and empty fields
bool is_missing_token(const std::string& field);

// Requires gene_id and gene_symbol columns. Duplicate IDs keep the first row.
std::vector<Gene> read_gene_universe(const std::string& path,
                                     Diagnostics* diagnostics = nullptr);

// Requires gene_id and score columns. Missing tokens are absent; non-numeric
// values are recorded and treated as absent. Range checks happen when the
// table is aligned with the universe.
EvidenceTable read_evidence_table(const std::string& path, const std::string& context,
                                  Diagnostics* diagnostics = nullptr);

// "layer=path"; throws ConfigurationError for a bad layer or missing '='
std::pair<EvidenceLayer, std::string> parse_evidence_arg(const std::string& arg);

// gene_symbol and source columns; one ControlSet per source, in file order
std::vector<ControlSet> read_control_sets(const std::string& path);

// Every record in input order
void write_scores_tsv(std::ostream& out, const std::vector<CompositeScoreRecord>& records,
                      const TierThresholds& tiers);

// Records above the candidate floor, highest composite first
void write_candidates_tsv(std::ostream& out, const std::vector<CompositeScoreRecord>& records,
                          const TierThresholds& tiers);

void write_sensitivity_tsv(std::ostream& out, const SensitivityAnalysis& analysis);

// Opens `path` for writing and calls `fn` with the stream; throws on failure
template <typename Fn>
void write_file(const std::string& path, Fn&& fn) {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot open output file: " + path);
    fn(out);
    out.flush();
    if (!out) throw std::runtime_error("Failed writing output file: " + path);
}

}  // namespace geneprio
