#pragma once

#include "analysis/statistical_tests.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// Storey q-values and density-based local FDR.
//
// pi0 uses the bootstrap-MSE choice over lambda = 0.05, 0.10, ..., 0.95.
// Local FDR follows the probit / kernel density construction:
//   x = qnorm(p), lfdr = pi0 * dnorm(x) / f(x)
// truncated at 1 and made non-decreasing in p.
// ---------------------------------------------------------------------------
namespace qvalue {

struct LfdrConfig {
    double adjust = 1.5;     // bandwidth multiplier on nrd0
    double eps = 1e-8;       // p-values clamped to [eps, 1 - eps] before probit
    int grid_points = 512;
    double cut = 3.0;        // grid extends cut * bandwidth past the data
    bool truncate = true;
    bool monotone = true;
};

inline std::vector<double> default_lambda() {
    std::vector<double> lambda;
    for (int k = 1; k <= 19; ++k) lambda.push_back(0.05 * k);
    return lambda;
}

// Proportion of true nulls. Returns 1 when the estimate is degenerate.
inline double estimate_pi0(const std::vector<double>& pvals,
                           const std::vector<double>& lambda_grid = default_lambda()) {
    std::vector<double> p;
    p.reserve(pvals.size());
    for (double v : pvals) {
        if (!std::isnan(v)) p.push_back(v);
    }
    if (p.empty()) return 1.0;

    double max_p = *std::max_element(p.begin(), p.end());
    std::vector<double> lambda;
    for (double l : lambda_grid) {
        if (l <= max_p) lambda.push_back(l);
    }
    if (lambda.empty()) return 1.0;

    double m = static_cast<double>(p.size());
    std::vector<double> W(lambda.size(), 0.0);
    std::vector<double> pi0(lambda.size(), 0.0);
    for (size_t k = 0; k < lambda.size(); ++k) {
        for (double v : p) {
            if (v >= lambda[k]) W[k] += 1.0;
        }
        pi0[k] = W[k] / (m * (1.0 - lambda[k]));
    }
    if (lambda.size() == 1) {
        double est = std::min(pi0[0], 1.0);
        return est > 0.0 ? est : 1.0;
    }

    std::vector<double> sorted = pi0;
    std::sort(sorted.begin(), sorted.end());
    double min_pi0 = detail::quantile_sorted(sorted, 0.1);

    double best_mse = std::numeric_limits<double>::infinity();
    for (size_t k = 0; k < lambda.size(); ++k) {
        double one_minus = 1.0 - lambda[k];
        double mse = (W[k] / (m * m * one_minus * one_minus)) * (1.0 - W[k] / m) +
                     (pi0[k] - min_pi0) * (pi0[k] - min_pi0);
        best_mse = std::min(best_mse, mse);
    }
    double est = std::numeric_limits<double>::infinity();
    for (size_t k = 0; k < lambda.size(); ++k) {
        double one_minus = 1.0 - lambda[k];
        double mse = (W[k] / (m * m * one_minus * one_minus)) * (1.0 - W[k] / m) +
                     (pi0[k] - min_pi0) * (pi0[k] - min_pi0);
        if (mse == best_mse) est = std::min(est, pi0[k]);
    }
    est = std::min(est, 1.0);
    if (!(est > 0.0)) return 1.0;
    return est;
}

// q-values in input order; NaN p-values map to NaN.
inline std::vector<double> compute_qvalues(const std::vector<double>& pvals) {
    std::vector<size_t> idx;
    std::vector<double> p;
    for (size_t i = 0; i < pvals.size(); ++i) {
        if (!std::isnan(pvals[i])) {
            idx.push_back(i);
            p.push_back(pvals[i]);
        }
    }
    std::vector<double> out(pvals.size(), std::numeric_limits<double>::quiet_NaN());
    if (p.empty()) return out;

    double pi0 = estimate_pi0(p);
    size_t m = p.size();
    std::vector<size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return p[a] > p[b]; });

    double running_min = std::numeric_limits<double>::infinity();
    for (size_t pos = 0; pos < m; ++pos) {
        size_t k = order[pos];
        double rank = static_cast<double>(m - pos);
        running_min = std::min(running_min, p[k] * static_cast<double>(m) / rank);
        out[idx[k]] = pi0 * std::min(1.0, running_min);
    }
    return out;
}

// Silverman's rule of thumb (R's bw.nrd0).
inline double bandwidth_nrd0(const std::vector<double>& x) {
    double hi = std::sqrt(detail::variance(x));
    std::vector<double> sorted = x;
    std::sort(sorted.begin(), sorted.end());
    double iqr = detail::quantile_sorted(sorted, 0.75) - detail::quantile_sorted(sorted, 0.25);
    double lo = std::min(hi, iqr / 1.34);
    if (!(lo > 0.0)) {
        lo = hi;
        if (!(lo > 0.0)) lo = std::abs(x.front());
        if (!(lo > 0.0)) lo = 1.0;
    }
    return 0.9 * lo * std::pow(static_cast<double>(x.size()), -0.2);
}

// Gaussian kernel density of `x`, evaluated at each element of `x`.
// Data are linearly binned onto an evenly spaced grid, the grid density is
// a direct kernel sum, and values at x are linear interpolations.
inline std::vector<double> kernel_density_at(const std::vector<double>& x,
                                             double bandwidth, int grid_points,
                                             double cut) {
    size_t n = x.size();
    auto [min_it, max_it] = std::minmax_element(x.begin(), x.end());
    double lo = *min_it - cut * bandwidth;
    double hi = *max_it + cut * bandwidth;
    size_t G = static_cast<size_t>(std::max(grid_points, 2));
    double step = (hi - lo) / static_cast<double>(G - 1);

    std::vector<double> weight(G, 0.0);
    double w = 1.0 / static_cast<double>(n);
    for (double v : x) {
        double pos = (v - lo) / step;
        size_t left = std::min(static_cast<size_t>(std::floor(pos)), G - 2);
        double frac = pos - static_cast<double>(left);
        weight[left] += w * (1.0 - frac);
        weight[left + 1] += w * frac;
    }

    std::vector<double> grid_density(G, 0.0);
    for (size_t i = 0; i < G; ++i) {
        double gi = lo + step * static_cast<double>(i);
        double sum = 0.0;
        for (size_t j = 0; j < G; ++j) {
            if (weight[j] == 0.0) continue;
            double gj = lo + step * static_cast<double>(j);
            sum += weight[j] * detail::normal_pdf((gi - gj) / bandwidth);
        }
        grid_density[i] = sum / bandwidth;
    }

    std::vector<double> out(n);
    for (size_t k = 0; k < n; ++k) {
        double pos = (x[k] - lo) / step;
        size_t left = std::min(static_cast<size_t>(std::floor(pos)), G - 2);
        double frac = pos - static_cast<double>(left);
        out[k] = grid_density[left] * (1.0 - frac) + grid_density[left + 1] * frac;
    }
    return out;
}

// Local FDR per p-value, input order. `pvals` must not contain NaN.
inline std::vector<double> local_fdr(const std::vector<double>& pvals,
                                     const LfdrConfig& config = {}) {
    size_t n = pvals.size();
    if (n == 0) return {};
    if (n < 2) return std::vector<double>(n, 1.0);

    double pi0 = estimate_pi0(pvals);

    std::vector<double> x(n);
    for (size_t i = 0; i < n; ++i) {
        double p = std::min(std::max(pvals[i], config.eps), 1.0 - config.eps);
        x[i] = detail::normal_quantile(p);
    }

    double bw = bandwidth_nrd0(x) * config.adjust;
    auto density = kernel_density_at(x, bw, config.grid_points, config.cut);

    std::vector<double> lfdr(n);
    for (size_t i = 0; i < n; ++i) {
        double f = density[i];
        lfdr[i] = (f > 0.0) ? pi0 * detail::normal_pdf(x[i]) / f
                            : std::numeric_limits<double>::infinity();
        if (config.truncate && lfdr[i] > 1.0) lfdr[i] = 1.0;
    }

    if (config.monotone) {
        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](size_t a, size_t b) { return pvals[a] < pvals[b]; });
        double running_max = -std::numeric_limits<double>::infinity();
        for (size_t k : order) {
            running_max = std::max(running_max, lfdr[k]);
            lfdr[k] = running_max;
        }
    }
    return lfdr;
}

}  // namespace qvalue
