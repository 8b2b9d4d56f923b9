#include "geneprio/stats.hpp"

#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace geneprio {
namespace stats {

std::optional<SummaryStats> summarize(const std::vector<double>& values) {
    if (values.empty()) return std::nullopt;

    SummaryStats s;
    s.count = values.size();
    double sum = 0.0;
    s.min = values[0];
    s.max = values[0];
    for (double v : values) {
        sum += v;
        if (v < s.min) s.min = v;
        if (v > s.max) s.max = v;
    }
    s.mean = sum / static_cast<double>(s.count);

    double ss = 0.0;
    for (double v : values) {
        const double d = v - s.mean;
        ss += d * d;
    }
    s.std = std::sqrt(ss / static_cast<double>(s.count));
    s.median = *median(values);
    return s;
}

std::optional<double> median(std::vector<double> values) {
    if (values.empty()) return std::nullopt;
    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    if (n % 2 == 1) return values[n / 2];
    return 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

double quantile_sorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted[0];
    q = std::clamp(q, 0.0, 1.0);
    const double pos = q * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

std::optional<double> mad(const std::vector<double>& values, double center,
                          bool scale_normal) {
    if (values.empty()) return std::nullopt;
    std::vector<double> abs_devs;
    abs_devs.reserve(values.size());
    for (double v : values) abs_devs.push_back(std::abs(v - center));
    const double raw = *median(std::move(abs_devs));
    return scale_normal ? raw * MAD_NORMAL_SCALE : raw;
}

std::vector<double> average_ranks(const std::vector<double>& values) {
    const size_t n = values.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(n, 0.0);
    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n && values[order[j]] == values[order[i]]) ++j;
        // positions i..j-1 (0-based) share rank mean((i+1)..j)
        const double shared = 0.5 * static_cast<double>(i + 1 + j);
        for (size_t k = i; k < j; ++k) ranks[order[k]] = shared;
        i = j;
    }
    return ranks;
}

std::optional<SpearmanResult> spearman(const std::vector<double>& x,
                                       const std::vector<double>& y) {
    const size_t n = x.size();
    if (n != y.size() || n < 3) return std::nullopt;

    const std::vector<double> rx = average_ranks(x);
    const std::vector<double> ry = average_ranks(y);

    // Pearson correlation of the ranks (exact under ties)
    const double mean_rank = 0.5 * static_cast<double>(n + 1);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = rx[i] - mean_rank;
        const double dy = ry[i] - mean_rank;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;

    SpearmanResult result;
    result.n = n;
    result.rho = std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);

    const double df = static_cast<double>(n - 2);
    const double denom = 1.0 - result.rho * result.rho;
    if (denom <= 0.0 || df <= 0.0) {
        result.p_value = 0.0;
    } else {
        const double t = result.rho * std::sqrt(df / denom);
        boost::math::students_t dist(df);
        result.p_value = 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t)));
        result.p_value = std::clamp(result.p_value, 0.0, 1.0);
    }
    return result;
}

}  // namespace stats
}  // namespace geneprio
