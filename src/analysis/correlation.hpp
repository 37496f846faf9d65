#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// Agreement statistics between an estimate vector and a reference vector.
// All functions take paired vectors that have already been restricted to
// valid pairs (see valid_pairs) and return NaN when the statistic is
// undefined: fewer than 2 pairs, or zero variance where it is divided by.
// ---------------------------------------------------------------------------

// Paired vectors with both sides present.
struct PairedSample {
    std::vector<double> x;
    std::vector<double> y;

    size_t size() const { return x.size(); }
};

namespace correlation {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

inline PairedSample valid_pairs(const std::vector<double>& x, const std::vector<double>& y) {
    PairedSample out;
    size_t n = std::min(x.size(), y.size());
    out.x.reserve(n);
    out.y.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(x[i]) || std::isnan(y[i])) continue;
        out.x.push_back(x[i]);
        out.y.push_back(y[i]);
    }
    return out;
}

struct Moments {
    double mean_x = 0.0;
    double mean_y = 0.0;
    double var_x = 0.0;   // n - 1 denominators throughout
    double var_y = 0.0;
    double cov = 0.0;
};

inline Moments moments(const std::vector<double>& x, const std::vector<double>& y) {
    Moments m;
    size_t n = x.size();
    double nf = static_cast<double>(n);
    for (size_t i = 0; i < n; ++i) {
        m.mean_x += x[i];
        m.mean_y += y[i];
    }
    m.mean_x /= nf;
    m.mean_y /= nf;
    for (size_t i = 0; i < n; ++i) {
        double dx = x[i] - m.mean_x;
        double dy = y[i] - m.mean_y;
        m.var_x += dx * dx;
        m.var_y += dy * dy;
        m.cov += dx * dy;
    }
    m.var_x /= (nf - 1.0);
    m.var_y /= (nf - 1.0);
    m.cov /= (nf - 1.0);
    return m;
}

inline double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return NaN;
    auto m = moments(x, y);
    if (!(m.var_x > 0.0) || !(m.var_y > 0.0)) return NaN;
    double r = m.cov / std::sqrt(m.var_x * m.var_y);
    return std::max(-1.0, std::min(1.0, r));
}

// Average ranks for ties (1-based).
inline std::vector<double> compute_ranks(const std::vector<double>& data) {
    size_t n = data.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return data[a] < data[b];
    });

    std::vector<double> ranks(n);
    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n && data[order[j]] == data[order[i]]) ++j;
        double avg_rank = 0.5 * (static_cast<double>(i + 1) + static_cast<double>(j));
        for (size_t k = i; k < j; ++k) {
            ranks[order[k]] = avg_rank;
        }
        i = j;
    }
    return ranks;
}

inline double spearman(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return NaN;
    return pearson(compute_ranks(x), compute_ranks(y));
}

// Lin's concordance correlation coefficient:
//   2 cov(x, y) / (var(x) + var(y) + (mean(x) - mean(y))^2)
inline double concordance(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return NaN;
    auto m = moments(x, y);
    double d = m.mean_x - m.mean_y;
    double denom = m.var_x + m.var_y + d * d;
    if (!(denom > 0.0)) return NaN;
    return 2.0 * m.cov / denom;
}

inline double mean_squared_error(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return NaN;
    double ss = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double d = x[i] - y[i];
        ss += d * d;
    }
    return ss / static_cast<double>(x.size());
}

}  // namespace correlation
