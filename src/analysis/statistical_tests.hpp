#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// TestResult - generic {statistic, p_value} pair
// ---------------------------------------------------------------------------
struct TestResult {
    double statistic = 0.0;
    double p_value = 1.0;
};

namespace detail {

constexpr double SQRT2 = 1.41421356237309504880;
constexpr double INV_SQRT_2PI = 0.39894228040143267794;

inline double normal_pdf(double x) {
    return INV_SQRT_2PI * std::exp(-0.5 * x * x);
}

inline double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / SQRT2);
}

// Normal quantile (inverse CDF), Wichura's AS241 (PPND16), ~1e-16 relative
// accuracy over the open unit interval.
inline double normal_quantile(double p) {
    if (p <= 0.0) return -std::numeric_limits<double>::infinity();
    if (p >= 1.0) return std::numeric_limits<double>::infinity();

    double q = p - 0.5;
    if (std::abs(q) <= 0.425) {
        double r = 0.180625 - q * q;
        return q * (((((((r * 2509.0809287301226727 + 33430.575583588128105) * r +
                         67265.770927008700853) * r + 45921.953931549871457) * r +
                       13731.693765509461125) * r + 1971.5909503065514427) * r +
                     133.14166789178437745) * r + 3.387132872796366608) /
               (((((((r * 5226.495278852545925 + 28729.085735721942674) * r +
                     39307.89580009271061) * r + 21213.794301586595867) * r +
                   5394.1960214247511077) * r + 687.1870074920579083) * r +
                 42.313330701600911252) * r + 1.0);
    }

    double r = (q < 0.0) ? p : 1.0 - p;
    r = std::sqrt(-std::log(r));
    double val;
    if (r <= 5.0) {
        r -= 1.6;
        val = (((((((r * 7.7454501427834140764e-4 + 0.0227238449892691845833) * r +
                    0.24178072517745061177) * r + 1.27045825245236838258) * r +
                  3.64784832476320460504) * r + 5.7694972214606914055) * r +
                4.6303378461565452959) * r + 1.42343711074968357734) /
              (((((((r * 1.05075007164441684324e-9 + 5.475938084995344946e-4) * r +
                    0.0151986665636164571966) * r + 0.14810397642748007459) * r +
                  0.68976733498510000455) * r + 1.6763848301838038494) * r +
                2.05319162663775882187) * r + 1.0);
    } else {
        r -= 5.0;
        val = (((((((r * 2.01033439929228813265e-7 + 2.71155556874348757815e-5) * r +
                    0.0012426609473880784386) * r + 0.026532189526576123093) * r +
                  0.29656057182850489123) * r + 1.7848265399172913358) * r +
                5.4637849111641143699) * r + 6.6579046435011037772) /
              (((((((r * 2.04426310338993978564e-15 + 1.4215117583164458887e-7) * r +
                    1.8463183175100546818e-5) * r + 7.868691311456132591e-4) * r +
                  0.0148753612908506148525) * r + 0.13692988092273580531) * r +
                0.59983220655588793769) * r + 1.0);
    }
    return (q < 0.0) ? -val : val;
}

// Continued fraction for the regularized incomplete beta (modified Lentz).
inline double beta_continued_fraction(double a, double b, double x) {
    constexpr int MAX_ITER = 300;
    constexpr double EPS = 1e-15;
    constexpr double TINY = 1e-300;

    double qab = a + b;
    double qap = a + 1.0;
    double qam = a - 1.0;
    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < TINY) d = TINY;
    d = 1.0 / d;
    double h = d;
    for (int m = 1; m <= MAX_ITER; ++m) {
        double m2 = 2.0 * m;
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < TINY) d = TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        h *= d * c;
        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < TINY) d = TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < EPS) break;
    }
    return h;
}

// I_x(a, b)
inline double regularized_incomplete_beta(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;
    double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                       a * std::log(x) + b * std::log1p(-x);
    double front = std::exp(log_front);
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * beta_continued_fraction(a, b, x) / a;
    }
    return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
}

// P(|T| > |t|) for Student's t with df degrees of freedom.
inline double student_t_two_tailed(double t, double df) {
    if (std::isnan(t) || !(df > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    if (std::isinf(t)) return 0.0;
    double x = df / (df + t * t);
    return std::min(1.0, regularized_incomplete_beta(0.5 * df, 0.5, x));
}

inline double mean(const std::vector<double>& v) {
    if (v.empty()) return std::numeric_limits<double>::quiet_NaN();
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// Sample variance (n - 1 denominator).
inline double variance(const std::vector<double>& v) {
    size_t n = v.size();
    if (n < 2) return std::numeric_limits<double>::quiet_NaN();
    double m = mean(v);
    double ss = 0.0;
    for (double x : v) ss += (x - m) * (x - m);
    return ss / static_cast<double>(n - 1);
}

// Type-7 quantile of an already sorted vector.
inline double quantile_sorted(const std::vector<double>& sorted, double prob) {
    if (sorted.empty()) return std::numeric_limits<double>::quiet_NaN();
    double h = (static_cast<double>(sorted.size()) - 1.0) * prob;
    size_t lo = static_cast<size_t>(std::floor(h));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// Two-sample Student t-test with pooled variance; statistic is mean(b) -
// mean(a) over its standard error.
// ---------------------------------------------------------------------------
inline TestResult two_sample_t_test(const std::vector<double>& a,
                                    const std::vector<double>& b) {
    size_t na = a.size();
    size_t nb = b.size();
    if (na == 0 || nb == 0 || na + nb < 3) {
        return {std::numeric_limits<double>::quiet_NaN(),
                std::numeric_limits<double>::quiet_NaN()};
    }

    double ma = detail::mean(a);
    double mb = detail::mean(b);
    double ss = 0.0;
    for (double x : a) ss += (x - ma) * (x - ma);
    for (double x : b) ss += (x - mb) * (x - mb);
    double df = static_cast<double>(na + nb - 2);
    double s2 = ss / df;
    double se = std::sqrt(s2 * (1.0 / static_cast<double>(na) + 1.0 / static_cast<double>(nb)));
    double diff = mb - ma;

    if (se < 1e-12) {
        // Zero residual variance: identical groups carry no evidence,
        // separated constant groups are a perfect split.
        if (std::abs(diff) < 1e-12) return {0.0, 1.0};
        return {diff > 0 ? std::numeric_limits<double>::infinity()
                         : -std::numeric_limits<double>::infinity(), 0.0};
    }

    double t = diff / se;
    return {t, detail::student_t_two_tailed(t, df)};
}
