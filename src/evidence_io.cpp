#include "geneprio/evidence_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <map>
#include <sstream>
#include <unordered_set>

namespace geneprio {

TsvReader::TsvReader(const std::string& path) : path_(path) {
    file_ = gzopen(path.c_str(), "rb");
    if (!file_) throw InputError("Cannot open " + path);
    gzbuffer(file_, GZBUF_SIZE);
}

TsvReader::~TsvReader() {
    if (file_) gzclose(file_);
}

bool TsvReader::readline(std::string& line) {
    line.clear();
    char buffer[65536];
    bool got = false;
    while (gzgets(file_, buffer, sizeof(buffer)) != nullptr) {
        got = true;
        line += buffer;
        if (!line.empty() && line.back() == '\n') break;
    }
    if (!got) {
        int errnum = 0;
        const char* msg = gzerror(file_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw InputError(path_ + ": read error: " + (msg ? msg : "unknown"));
        }
        return false;
    }
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    ++line_no_;
    return true;
}

std::vector<std::string> split_tsv(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        const size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

bool is_missing_token(const std::string& field) {
    return field.empty() || field == "NA" || field == "NaN" || field == "nan" ||
           field == "NULL" || field == "null" || field == "None";
}

namespace {

// Column index for `name`; throws InputError when absent
size_t require_column(const std::vector<std::string>& header, const std::string& name,
                      const std::string& path) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        throw InputError(path + ": missing required column '" + name + "'");
    }
    return static_cast<size_t>(it - header.begin());
}

// Blank lines and '#' comments are skipped anywhere in an input file
bool skip_line(const std::string& line) {
    return line.empty() || line[0] == '#';
}

std::vector<std::string> read_header(TsvReader& reader) {
    std::string line;
    while (reader.readline(line)) {
        if (skip_line(line)) continue;
        return split_tsv(line);
    }
    throw InputError(reader.path() + ": file is empty");
}

bool parse_double(const std::string& s, double& out) {
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    out = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end == ' ') ++end;
    return *end == '\0' && errno != ERANGE;
}

}  // namespace

std::vector<Gene> read_gene_universe(const std::string& path, Diagnostics* diagnostics) {
    TsvReader reader(path);
    const auto header = read_header(reader);
    const size_t id_col = require_column(header, "gene_id", path);
    const size_t sym_col = require_column(header, "gene_symbol", path);
    const size_t need = std::max(id_col, sym_col);

    std::vector<Gene> genes;
    std::unordered_set<std::string> seen;
    size_t duplicates = 0;
    std::string line;
    while (reader.readline(line)) {
        if (skip_line(line)) continue;
        auto fields = split_tsv(line);
        if (fields.size() <= need) {
            throw InputError(path + ":" + std::to_string(reader.line_number()) +
                             ": expected at least " + std::to_string(need + 1) + " columns");
        }
        if (fields[id_col].empty()) continue;
        if (!seen.insert(fields[id_col]).second) {
            ++duplicates;
            continue;
        }
        genes.push_back({std::move(fields[id_col]), std::move(fields[sym_col])});
    }

    if (genes.empty()) throw InputError(path + ": gene universe has no genes");
    if (diagnostics && duplicates > 0) {
        diagnostics->push_back({DataIssueKind::DUPLICATE_GENE_ID, path,
                                std::to_string(duplicates) +
                                    " duplicate gene_id row(s); first occurrence kept",
                                duplicates});
    }
    return genes;
}

EvidenceTable read_evidence_table(const std::string& path, const std::string& context,
                                  Diagnostics* diagnostics) {
    TsvReader reader(path);
    const auto header = read_header(reader);
    const size_t id_col = require_column(header, "gene_id", path);
    const size_t score_col = require_column(header, "score", path);
    const size_t need = std::max(id_col, score_col);

    EvidenceTable table;
    size_t unparseable = 0;
    size_t duplicates = 0;
    std::string first_bad;
    std::string line;
    while (reader.readline(line)) {
        if (skip_line(line)) continue;
        const auto fields = split_tsv(line);
        if (fields.size() <= need) {
            throw InputError(path + ":" + std::to_string(reader.line_number()) +
                             ": expected at least " + std::to_string(need + 1) + " columns");
        }
        const std::string& id = fields[id_col];
        if (id.empty()) continue;

        OptionalScore score;
        const std::string& raw = fields[score_col];
        if (!is_missing_token(raw)) {
            double v = 0.0;
            if (parse_double(raw, v)) {
                score = v;
            } else {
                if (unparseable == 0) first_bad = raw;
                ++unparseable;
            }
        }
        if (!table.emplace(id, score).second) ++duplicates;
    }

    if (diagnostics && unparseable > 0) {
        diagnostics->push_back({DataIssueKind::UNPARSEABLE_SCORE, context,
                                std::to_string(unparseable) +
                                    " non-numeric score(s) treated as absent (first: '" +
                                    first_bad + "')",
                                unparseable});
    }
    if (diagnostics && duplicates > 0) {
        diagnostics->push_back({DataIssueKind::DUPLICATE_EVIDENCE_ROW, context,
                                std::to_string(duplicates) +
                                    " duplicate evidence row(s); first occurrence kept",
                                duplicates});
    }
    return table;
}

std::pair<EvidenceLayer, std::string> parse_evidence_arg(const std::string& arg) {
    const size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
        throw ConfigurationError("Evidence must be given as <layer>=<path>, got '" + arg + "'");
    }
    return {parse_layer(arg.substr(0, eq)), arg.substr(eq + 1)};
}

std::vector<ControlSet> read_control_sets(const std::string& path) {
    TsvReader reader(path);
    const auto header = read_header(reader);
    const size_t sym_col = require_column(header, "gene_symbol", path);
    const size_t src_col = require_column(header, "source", path);
    const size_t need = std::max(sym_col, src_col);

    std::vector<ControlSet> sets;
    std::map<std::string, size_t> by_source;
    std::string line;
    while (reader.readline(line)) {
        if (skip_line(line)) continue;
        auto fields = split_tsv(line);
        if (fields.size() <= need) {
            throw InputError(path + ":" + std::to_string(reader.line_number()) +
                             ": expected at least " + std::to_string(need + 1) + " columns");
        }
        if (fields[sym_col].empty()) continue;
        auto [it, inserted] = by_source.emplace(fields[src_col], sets.size());
        if (inserted) sets.push_back({fields[src_col], fields[src_col], {}});
        sets[it->second].symbols.push_back(std::move(fields[sym_col]));
    }
    if (sets.empty()) throw InputError(path + ": control set file has no genes");
    return sets;
}

namespace {

void write_optional(std::ostream& out, const OptionalScore& v) {
    if (v) {
        out << *v;
    } else {
        out << "NA";
    }
}

void write_header(std::ostream& out) {
    out << "gene_id\tgene_symbol\tcomposite_score\tevidence_count\tquality_flag\ttier";
    for (EvidenceLayer layer : ALL_LAYERS) out << '\t' << layer_name(layer) << "_score";
    for (EvidenceLayer layer : ALL_LAYERS) out << '\t' << layer_name(layer) << "_contribution";
    out << "\tsupporting_layers\tevidence_gaps\n";
}

void write_record(std::ostream& out, const CompositeScoreRecord& r, const TierThresholds& tiers) {
    out << r.gene_id << '\t' << r.gene_symbol << '\t';
    write_optional(out, r.composite_score);
    out << '\t' << r.evidence_count << '\t' << quality_flag_name(r.quality_flag) << '\t'
        << tier_name(classify(r, tiers));
    for (const auto& s : r.layer_scores) {
        out << '\t';
        write_optional(out, s);
    }
    for (const auto& c : r.contributions) {
        out << '\t';
        write_optional(out, c);
    }
    const std::string supporting = supporting_layers(r);
    const std::string gaps = evidence_gaps(r);
    out << '\t' << (supporting.empty() ? "NA" : supporting)
        << '\t' << (gaps.empty() ? "NA" : gaps) << '\n';
}

}  // namespace

void write_scores_tsv(std::ostream& out, const std::vector<CompositeScoreRecord>& records,
                      const TierThresholds& tiers) {
    out << std::fixed << std::setprecision(6);
    write_header(out);
    for (const auto& r : records) write_record(out, r, tiers);
}

void write_candidates_tsv(std::ostream& out, const std::vector<CompositeScoreRecord>& records,
                          const TierThresholds& tiers) {
    out << std::fixed << std::setprecision(6);
    write_header(out);
    for (size_t idx : rank_by_score(records)) {
        if (!is_candidate(records[idx], tiers)) continue;
        write_record(out, records[idx], tiers);
    }
}

void write_sensitivity_tsv(std::ostream& out, const SensitivityAnalysis& analysis) {
    out << "layer\tdelta\toverlap_count\ttop_n\tspearman_rho\tspearman_pval\tstability"
           "\tindeterminate_reason";
    for (EvidenceLayer layer : ALL_LAYERS) out << "\tw_" << layer_name(layer);
    out << '\n';
    for (const auto& r : analysis.results) {
        out << layer_name(r.layer) << '\t' << std::showpos << std::fixed << std::setprecision(2)
            << r.delta << std::noshowpos << '\t' << r.overlap_count << '\t' << r.top_n << '\t';
        out << std::setprecision(6);
        write_optional(out, r.spearman_rho);
        out << '\t';
        if (r.spearman_pval) {
            out << std::scientific << std::setprecision(4) << *r.spearman_pval << std::fixed;
        } else {
            out << "NA";
        }
        out << '\t' << stability_name(r.stability) << '\t'
            << (r.reason == IndeterminateReason::NONE ? "NA"
                                                      : indeterminate_reason_name(r.reason));
        out << std::setprecision(6);
        for (double w : r.perturbed_weights.values()) out << '\t' << w;
        out << '\n';
    }
}

}  // namespace geneprio
