#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

// Multiple-comparison corrections over one family of p-values. Every function
// returns adjusted p-values in the SAME order as the input. NaN p-values are
// left NaN and do not count toward the family size.

namespace padjust {

// Indices of the non-NaN entries, plus their values.
inline std::vector<size_t> present(const std::vector<double>& p, std::vector<double>& values) {
    std::vector<size_t> idx;
    values.clear();
    for (size_t i = 0; i < p.size(); ++i) {
        if (!std::isnan(p[i])) {
            idx.push_back(i);
            values.push_back(p[i]);
        }
    }
    return idx;
}

inline std::vector<double> scatter(const std::vector<double>& adjusted,
                                   const std::vector<size_t>& idx, size_t n) {
    std::vector<double> out(n, std::numeric_limits<double>::quiet_NaN());
    for (size_t k = 0; k < idx.size(); ++k) out[idx[k]] = adjusted[k];
    return out;
}

inline std::vector<size_t> ascending_order(const std::vector<double>& p) {
    std::vector<size_t> order(p.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return p[a] < p[b]; });
    return order;
}

inline std::vector<size_t> descending_order(const std::vector<double>& p) {
    std::vector<size_t> order(p.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return p[a] > p[b]; });
    return order;
}

// Step-down: running max over ascending p, multiplier (m - rank).
inline std::vector<double> holm(const std::vector<double>& p) {
    size_t m = p.size();
    auto order = ascending_order(p);
    std::vector<double> corrected(m);
    double running_max = 0.0;
    for (size_t rank = 0; rank < m; ++rank) {
        size_t idx = order[rank];
        double adjusted = std::min(1.0, p[idx] * static_cast<double>(m - rank));
        running_max = std::max(running_max, adjusted);
        corrected[idx] = running_max;
    }
    return corrected;
}

// Step-up: running min over descending p, multiplier (m - i + 1) for
// Hochberg, m / i for BH, scaled by sum(1/k) for BY.
inline std::vector<double> step_up(const std::vector<double>& p, int kind) {
    size_t m = p.size();
    double mf = static_cast<double>(m);
    double harmonic = 0.0;
    for (size_t k = 1; k <= m; ++k) harmonic += 1.0 / static_cast<double>(k);

    auto order = descending_order(p);
    std::vector<double> corrected(m);
    double running_min = std::numeric_limits<double>::infinity();
    for (size_t pos = 0; pos < m; ++pos) {
        size_t idx = order[pos];
        double i = static_cast<double>(m - pos);  // 1-based rank from the bottom
        double adjusted = 0.0;
        switch (kind) {
            case 0: adjusted = (mf - i + 1.0) * p[idx]; break;     // hochberg
            case 1: adjusted = mf / i * p[idx]; break;             // BH
            default: adjusted = harmonic * mf / i * p[idx]; break; // BY
        }
        running_min = std::min(running_min, adjusted);
        corrected[idx] = std::min(1.0, running_min);
    }
    return corrected;
}

inline std::vector<double> hommel(const std::vector<double>& raw) {
    size_t n = raw.size();
    if (n == 0) return {};
    auto order = ascending_order(raw);
    std::vector<double> p(n);
    for (size_t k = 0; k < n; ++k) p[k] = raw[order[k]];

    double init = std::numeric_limits<double>::infinity();
    for (size_t k = 0; k < n; ++k) {
        init = std::min(init, static_cast<double>(n) * p[k] / static_cast<double>(k + 1));
    }
    std::vector<double> q(n, init);
    std::vector<double> pa(n, init);

    for (size_t m = n - 1; m >= 2; --m) {
        // i1 = first n-m+1 sorted p-values, i2 = the remaining m-1
        size_t n_i1 = n - m + 1;
        double q1 = std::numeric_limits<double>::infinity();
        for (size_t k = n_i1; k < n; ++k) {
            double denom = static_cast<double>(k - n_i1 + 2);
            q1 = std::min(q1, static_cast<double>(m) * p[k] / denom);
        }
        for (size_t k = 0; k < n_i1; ++k) {
            q[k] = std::min(static_cast<double>(m) * p[k], q1);
        }
        for (size_t k = n_i1; k < n; ++k) q[k] = q[n_i1 - 1];
        for (size_t k = 0; k < n; ++k) pa[k] = std::max(pa[k], q[k]);
    }

    std::vector<double> out(n);
    for (size_t k = 0; k < n; ++k) out[order[k]] = std::max(pa[k], p[k]);
    return out;
}

}  // namespace padjust

// Holm-Bonferroni step-down correction for multiple comparisons.
inline std::vector<double> holm_bonferroni_correct(const std::vector<double>& raw_pvals) {
    std::vector<double> values;
    auto idx = padjust::present(raw_pvals, values);
    if (values.size() <= 1) return raw_pvals;
    return padjust::scatter(padjust::holm(values), idx, raw_pvals.size());
}

inline bool is_p_adjust_method(const std::string& method) {
    return method == "holm" || method == "hochberg" || method == "hommel" ||
           method == "bonferroni" || method == "BH" || method == "BY" ||
           method == "fdr" || method == "none";
}

// p.adjust-compatible entry point: holm, hochberg, hommel, bonferroni, BH,
// BY, fdr (alias of BH) and none.
inline std::vector<double> p_adjust(const std::vector<double>& raw_pvals,
                                    const std::string& method) {
    if (!is_p_adjust_method(method)) {
        throw std::invalid_argument("Unknown p-value adjustment method: " + method);
    }

    std::vector<double> values;
    auto idx = padjust::present(raw_pvals, values);
    if (values.size() <= 1 || method == "none") return raw_pvals;

    std::vector<double> adjusted;
    if (method == "holm") {
        adjusted = padjust::holm(values);
    } else if (method == "hochberg") {
        adjusted = padjust::step_up(values, 0);
    } else if (method == "BH" || method == "fdr") {
        adjusted = padjust::step_up(values, 1);
    } else if (method == "BY") {
        adjusted = padjust::step_up(values, 2);
    } else if (method == "hommel") {
        adjusted = padjust::hommel(values);
    } else {
        adjusted = values;
        double m = static_cast<double>(values.size());
        for (auto& v : adjusted) v = std::min(1.0, v * m);
    }
    return padjust::scatter(adjusted, idx, raw_pvals.size());
}
