#pragma once
// Scoring weights: an immutable distribution over the six evidence layers.
//
// Instances can only be obtained through ScoringWeights::create(), which
// enforces the invariants (finite, each in [0,1], sum == 1 within
// WEIGHT_SUM_TOLERANCE). perturb() always yields a new valid instance.

#include "geneprio/types.hpp"

#include <string>

namespace geneprio {

constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

class ScoringWeights {
public:
    // Throws ConfigurationError naming the offending layer or the bad sum.
    static ScoringWeights create(const LayerArray<double>& values);

    // gnomad 0.20, expression 0.20, annotation/localization/animal_model/
    // literature 0.15 each.
    static ScoringWeights defaults();

    double operator[](EvidenceLayer layer) const noexcept {
        return values_[layer_index(layer)];
    }
    const LayerArray<double>& values() const noexcept { return values_; }

    // Sum in layer order
    double total() const noexcept;

    std::string to_string() const;

    bool operator==(const ScoringWeights& other) const noexcept {
        return values_ == other.values_;
    }

private:
    explicit ScoringWeights(const LayerArray<double>& values) : values_(values) {}

    LayerArray<double> values_{};
};

// Add delta to one layer, clamp it to [0,1] and divide every weight by the
// new total. delta == 0 returns the baseline unchanged. If every weight ends
// at zero the result is the uniform distribution.
ScoringWeights perturb(const ScoringWeights& baseline, EvidenceLayer layer, double delta);

}  // namespace geneprio
