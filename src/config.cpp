#include "geneprio/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace geneprio {

using json = nlohmann::json;

void PipelineConfig::validate() const {
    quality_flags.validate();
    tiers.validate();
    qc.validate();
    controls.validate();
    sensitivity.validate();
}

namespace {

void reject_unknown(const json& obj, const std::string& section,
                    const std::set<std::string>& allowed) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!allowed.count(it.key())) {
            throw ConfigurationError("Unknown key '" + it.key() + "' in section '" + section + "'");
        }
    }
}

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
        throw ConfigurationError(std::string("Section '") + name + "' must be an object");
    }
    return &*it;
}

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end()) out = it->get<T>();
}

// Counts must be whole, non-negative and fit the destination field
template <typename T>
void read_count(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number_integer()) {
        throw ConfigurationError(std::string(key) + " must be an integer");
    }
    if (!it->is_number_unsigned()) {
        throw ConfigurationError(std::string(key) + " must be non-negative");
    }
    const uint64_t v = it->get<uint64_t>();
    if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw ConfigurationError(std::string(key) + " is too large (maximum " +
                                 std::to_string(std::numeric_limits<T>::max()) + ")");
    }
    out = static_cast<T>(v);
}

void apply_config(const json& root, PipelineConfig& cfg) {
    if (!root.is_object()) throw ConfigurationError("Configuration root must be an object");
    reject_unknown(root, "<root>",
                   {"weights", "quality_flags", "tiers", "qc", "controls", "sensitivity"});

    if (const json* w = section(root, "weights")) {
        LayerArray<double> values = cfg.weights.values();
        for (auto it = w->begin(); it != w->end(); ++it) {
            values[layer_index(parse_layer(it.key()))] = it.value().get<double>();
        }
        cfg.weights = ScoringWeights::create(values);
    }

    if (const json* q = section(root, "quality_flags")) {
        reject_unknown(*q, "quality_flags", {"sufficient_min", "moderate_min", "sparse_min"});
        read_count(*q, "sufficient_min", cfg.quality_flags.sufficient_min);
        read_count(*q, "moderate_min", cfg.quality_flags.moderate_min);
        read_count(*q, "sparse_min", cfg.quality_flags.sparse_min);
    }

    if (const json* t = section(root, "tiers")) {
        reject_unknown(*t, "tiers", {"high_score", "high_min_evidence", "medium_score",
                                     "medium_min_evidence", "candidate_min_score"});
        read_key(*t, "high_score", cfg.tiers.high_score);
        read_count(*t, "high_min_evidence", cfg.tiers.high_min_evidence);
        read_key(*t, "medium_score", cfg.tiers.medium_score);
        read_count(*t, "medium_min_evidence", cfg.tiers.medium_min_evidence);
        read_key(*t, "candidate_min_score", cfg.tiers.candidate_min_score);
    }

    if (const json* q = section(root, "qc")) {
        reject_unknown(*q, "qc", {"mad_multiplier", "missing_warn", "missing_error",
                                  "min_std", "max_examples"});
        read_key(*q, "mad_multiplier", cfg.qc.mad_multiplier);
        read_key(*q, "missing_warn", cfg.qc.missing_warn);
        read_key(*q, "missing_error", cfg.qc.missing_error);
        read_key(*q, "min_std", cfg.qc.min_std);
        read_count(*q, "max_examples", cfg.qc.max_examples);
    }

    if (const json* c = section(root, "controls")) {
        reject_unknown(*c, "controls", {"positive_percentile", "negative_percentile",
                                        "top_quartile", "recall_k", "recall_fractions",
                                        "max_details", "positive_sets", "negative_sets"});
        read_key(*c, "positive_percentile", cfg.controls.positive_percentile);
        read_key(*c, "negative_percentile", cfg.controls.negative_percentile);
        read_key(*c, "top_quartile", cfg.controls.top_quartile);
        if (auto it = c->find("recall_k"); it != c->end()) {
            cfg.controls.recall_k.clear();
            for (const auto& v : *it) {
                if (!v.is_number_unsigned() || v.get<uint64_t>() == 0) {
                    throw ConfigurationError("controls.recall_k values must be positive integers");
                }
                cfg.controls.recall_k.push_back(static_cast<size_t>(v.get<uint64_t>()));
            }
        }
        read_key(*c, "recall_fractions", cfg.controls.recall_fractions);
        read_count(*c, "max_details", cfg.controls.max_details);
        read_key(*c, "positive_sets", cfg.positive_sets);
        read_key(*c, "negative_sets", cfg.negative_sets);
    }

    if (const json* s = section(root, "sensitivity")) {
        reject_unknown(*s, "sensitivity", {"deltas", "top_n", "min_overlap",
                                           "stability_threshold"});
        read_key(*s, "deltas", cfg.sensitivity.deltas);
        read_count(*s, "top_n", cfg.sensitivity.top_n);
        read_count(*s, "min_overlap", cfg.sensitivity.min_overlap);
        read_key(*s, "stability_threshold", cfg.sensitivity.stability_threshold);
    }
}

}  // namespace

PipelineConfig parse_config(const std::string& text, const std::string& origin) {
    PipelineConfig cfg;
    try {
        apply_config(json::parse(text), cfg);
    } catch (const json::exception& e) {
        throw ConfigurationError(origin + ": " + e.what());
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(origin + ": " + e.what());
    }
    cfg.validate();
    return cfg;
}

PipelineConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("Cannot open config file: " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_config(buf.str(), path);
}

}  // namespace geneprio
