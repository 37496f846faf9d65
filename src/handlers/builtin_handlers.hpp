#pragma once

#include "analysis/statistical_tests.hpp"
#include "core/count_matrix.hpp"
#include "handlers/handler.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Reference differential-expression handlers. They exist so the pipeline can
// run end to end; real analyses register their own handlers.
//
//   "linear_model"       two-group linear model on log2-CPM, Student t test
//   "negative_binomial"  median-of-ratios size factors, moment dispersion,
//                        Wald test on the log fold change
//
// Both report coefficient as log2(treated / reference), where the reference
// group is the smaller treatment label, and count as the gene's total reads.
// ---------------------------------------------------------------------------
namespace builtin {

constexpr double LN2 = 0.69314718055994530942;

// Sample indices of the reference and treated groups.
struct TwoGroups {
    std::vector<size_t> reference;
    std::vector<size_t> treated;
};

inline TwoGroups split_treatment(const CountMatrix& matrix, const TreatmentVector& treatment) {
    if (treatment.size() != matrix.n_samples()) {
        throw std::invalid_argument("Treatment has " + std::to_string(treatment.size()) +
                                    " labels for " + std::to_string(matrix.n_samples()) +
                                    " samples");
    }
    std::set<int> levels(treatment.begin(), treatment.end());
    if (levels.size() != 2) {
        throw std::invalid_argument("Treatment must have exactly two levels, found " +
                                    std::to_string(levels.size()));
    }
    int ref_level = *levels.begin();
    TwoGroups groups;
    for (size_t j = 0; j < treatment.size(); ++j) {
        if (treatment[j] == ref_level) groups.reference.push_back(j);
        else groups.treated.push_back(j);
    }
    return groups;
}

inline std::vector<double> row_totals(const CountMatrix& matrix) {
    std::vector<double> totals(matrix.n_genes());
    for (size_t g = 0; g < matrix.n_genes(); ++g) {
        totals[g] = static_cast<double>(matrix.row_sum(g));
    }
    return totals;
}

inline ResultTable linear_model(const CountMatrix& matrix, const TreatmentVector& treatment,
                                const HandlerOptions& /*options*/) {
    auto groups = split_treatment(matrix, treatment);
    auto lib_sizes = matrix.column_sums();

    size_t G = matrix.n_genes();
    ResultTable out;
    out.count = row_totals(matrix);
    auto& coef = out.columns["coefficient"];
    auto& pval = out.columns["pvalue"];
    auto& tstat = out.columns["t"];
    coef.resize(G);
    pval.resize(G);
    tstat.resize(G);

    auto log_cpm = [&](size_t g, size_t j) {
        double lib = static_cast<double>(lib_sizes[j]) + 1.0;
        return std::log2((static_cast<double>(matrix.at(g, j)) + 0.5) / lib * 1e6);
    };

    std::vector<double> a, b;
    for (size_t g = 0; g < G; ++g) {
        a.clear();
        b.clear();
        for (size_t j : groups.reference) a.push_back(log_cpm(g, j));
        for (size_t j : groups.treated) b.push_back(log_cpm(g, j));
        auto test = two_sample_t_test(a, b);
        coef[g] = detail::mean(b) - detail::mean(a);
        pval[g] = test.p_value;
        tstat[g] = test.statistic;
    }
    return out;
}

// Median-of-ratios size factors; falls back to library-size ratios when no
// gene is expressed in every sample.
inline std::vector<double> size_factors(const CountMatrix& matrix) {
    size_t N = matrix.n_samples();
    std::vector<std::vector<double>> ratios(N);
    for (size_t g = 0; g < matrix.n_genes(); ++g) {
        double log_geo = 0.0;
        bool all_positive = true;
        for (size_t j = 0; j < N; ++j) {
            int64_t c = matrix.at(g, j);
            if (c <= 0) {
                all_positive = false;
                break;
            }
            log_geo += std::log(static_cast<double>(c));
        }
        if (!all_positive) continue;
        log_geo /= static_cast<double>(N);
        for (size_t j = 0; j < N; ++j) {
            ratios[j].push_back(std::log(static_cast<double>(matrix.at(g, j))) - log_geo);
        }
    }

    std::vector<double> sf(N, 1.0);
    if (!ratios.empty() && !ratios[0].empty()) {
        for (size_t j = 0; j < N; ++j) {
            std::sort(ratios[j].begin(), ratios[j].end());
            sf[j] = std::exp(detail::quantile_sorted(ratios[j], 0.5));
        }
        return sf;
    }

    auto libs = matrix.column_sums();
    double log_geo = 0.0;
    size_t positive = 0;
    for (int64_t l : libs) {
        if (l > 0) {
            log_geo += std::log(static_cast<double>(l));
            ++positive;
        }
    }
    if (positive == 0) return sf;
    log_geo /= static_cast<double>(positive);
    for (size_t j = 0; j < N; ++j) {
        sf[j] = libs[j] > 0 ? std::exp(std::log(static_cast<double>(libs[j])) - log_geo) : 1.0;
    }
    return sf;
}

inline ResultTable negative_binomial(const CountMatrix& matrix, const TreatmentVector& treatment,
                                     const HandlerOptions& /*options*/) {
    constexpr double MIN_DISPERSION = 1e-8;
    constexpr double PSEUDO = 0.5;

    auto groups = split_treatment(matrix, treatment);
    auto sf = size_factors(matrix);

    size_t G = matrix.n_genes();
    ResultTable out;
    out.count = row_totals(matrix);
    auto& coef = out.columns["coefficient"];
    auto& pval = out.columns["pvalue"];
    auto& disp = out.columns["dispersion"];
    auto& base_mean = out.columns["baseMean"];
    coef.resize(G);
    pval.resize(G);
    disp.resize(G);
    base_mean.resize(G);

    struct GroupStats {
        double mean = 0.0;
        double var = 0.0;
        double mean_inv_sf = 0.0;
        double n = 0.0;
    };
    auto stats_for = [&](size_t g, const std::vector<size_t>& idx) {
        GroupStats s;
        s.n = static_cast<double>(idx.size());
        for (size_t j : idx) {
            s.mean += static_cast<double>(matrix.at(g, j)) / sf[j];
            s.mean_inv_sf += 1.0 / sf[j];
        }
        s.mean /= s.n;
        s.mean_inv_sf /= s.n;
        for (size_t j : idx) {
            double d = static_cast<double>(matrix.at(g, j)) / sf[j] - s.mean;
            s.var += d * d;
        }
        s.var = (idx.size() > 1) ? s.var / (s.n - 1.0) : 0.0;
        return s;
    };

    for (size_t g = 0; g < G; ++g) {
        auto ref = stats_for(g, groups.reference);
        auto trt = stats_for(g, groups.treated);
        base_mean[g] = (ref.mean * ref.n + trt.mean * trt.n) / (ref.n + trt.n);

        if (ref.mean == 0.0 && trt.mean == 0.0) {
            coef[g] = 0.0;
            pval[g] = 1.0;
            disp[g] = std::numeric_limits<double>::quiet_NaN();
            continue;
        }

        // Method of moments: var = mu * E[1/s] + phi * mu^2, pooled across groups.
        double phi_sum = 0.0;
        int phi_terms = 0;
        for (const auto* s : {&ref, &trt}) {
            if (s->mean > 0.0 && s->n > 1.0) {
                phi_sum += (s->var - s->mean * s->mean_inv_sf) / (s->mean * s->mean);
                ++phi_terms;
            }
        }
        double phi = phi_terms > 0 ? phi_sum / phi_terms : MIN_DISPERSION;
        phi = std::max(phi, MIN_DISPERSION);
        disp[g] = phi;

        double mu_ref = ref.mean + PSEUDO;
        double mu_trt = trt.mean + PSEUDO;
        double beta = std::log(mu_trt) - std::log(mu_ref);
        double var_beta = (ref.mean_inv_sf / mu_ref + phi) / ref.n +
                          (trt.mean_inv_sf / mu_trt + phi) / trt.n;
        double z = beta / std::sqrt(var_beta);

        coef[g] = beta / LN2;
        pval[g] = std::erfc(std::abs(z) / detail::SQRT2);
    }
    return out;
}

}  // namespace builtin

// Registry preloaded with the reference handlers.
inline HandlerRegistry default_registry() {
    HandlerRegistry registry;
    registry.add("linear_model", builtin::linear_model);
    registry.add("negative_binomial", builtin::negative_binomial);
    return registry;
}
