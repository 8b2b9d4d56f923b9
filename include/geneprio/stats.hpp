#pragma once
// Robust and rank-based statistics used by QC, control validation and the
// sensitivity sweep. Functions that have no defined value for their input
// (empty series, zero variance) return std::nullopt instead of a sentinel.

#include <cstddef>
#include <optional>
#include <vector>

namespace geneprio {
namespace stats {

// Normal-consistency constant: MAD * 1.4826 estimates sigma for Gaussian data
constexpr double MAD_NORMAL_SCALE = 1.4826;

struct SummaryStats {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double std = 0.0;     // population standard deviation (ddof = 0)
    double min = 0.0;
    double max = 0.0;
};

std::optional<SummaryStats> summarize(const std::vector<double>& values);

// Median (mean of the two middle values for even n)
std::optional<double> median(std::vector<double> values);

// Linear-interpolated quantile of an ascending-sorted series, q in [0,1]
double quantile_sorted(const std::vector<double>& sorted, double q);

// Median absolute deviation around `center`, scaled by MAD_NORMAL_SCALE
// when scale_normal is set.
std::optional<double> mad(const std::vector<double>& values, double center,
                          bool scale_normal = true);

// 1-based ranks in input order; tied values share the mean of their positions
std::vector<double> average_ranks(const std::vector<double>& values);

struct SpearmanResult {
    double rho = 0.0;
    double p_value = 1.0;   // two-sided, t approximation with n-2 d.f.
    size_t n = 0;
};

// Spearman rank correlation of paired series (x[i], y[i]).
// nullopt when n < 3, sizes differ, or either series is constant.
std::optional<SpearmanResult> spearman(const std::vector<double>& x,
                                       const std::vector<double>& y);

}  // namespace stats
}  // namespace geneprio
