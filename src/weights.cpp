#include "geneprio/weights.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace geneprio {

ScoringWeights ScoringWeights::create(const LayerArray<double>& values) {
    double total = 0.0;
    for (EvidenceLayer layer : ALL_LAYERS) {
        const double w = values[layer_index(layer)];
        if (!std::isfinite(w)) {
            throw ConfigurationError(std::string("Weight for '") + layer_name(layer) +
                                     "' is not a finite number");
        }
        if (w < 0.0 || w > 1.0) {
            std::ostringstream oss;
            oss << "Weight for '" << layer_name(layer) << "' must be in [0, 1], got " << w;
            throw ConfigurationError(oss.str());
        }
        total += w;
    }
    if (std::abs(total - 1.0) > WEIGHT_SUM_TOLERANCE) {
        std::ostringstream oss;
        oss << "Scoring weights must sum to 1.0, got " << std::fixed
            << std::setprecision(6) << total;
        throw ConfigurationError(oss.str());
    }
    return ScoringWeights(values);
}

ScoringWeights ScoringWeights::defaults() {
    return create({0.20, 0.20, 0.15, 0.15, 0.15, 0.15});
}

double ScoringWeights::total() const noexcept {
    double sum = 0.0;
    for (double w : values_) sum += w;
    return sum;
}

std::string ScoringWeights::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    for (EvidenceLayer layer : ALL_LAYERS) {
        if (layer != EvidenceLayer::GNOMAD) oss << ' ';
        oss << layer_name(layer) << '=' << values_[layer_index(layer)];
    }
    return oss.str();
}

ScoringWeights perturb(const ScoringWeights& baseline, EvidenceLayer layer, double delta) {
    if (!std::isfinite(delta)) {
        throw ConfigurationError("Perturbation delta must be finite");
    }
    if (delta == 0.0) return baseline;

    LayerArray<double> w = baseline.values();
    const size_t idx = layer_index(layer);
    w[idx] = std::clamp(w[idx] + delta, 0.0, 1.0);

    double total = 0.0;
    for (double v : w) total += v;

    if (total > 0.0) {
        for (double& v : w) v /= total;
    } else {
        w.fill(1.0 / static_cast<double>(NUM_LAYERS));
    }
    return ScoringWeights::create(w);
}

}  // namespace geneprio
