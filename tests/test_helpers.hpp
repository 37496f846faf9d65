#pragma once

// test_helpers.hpp - shared fixtures for count matrices, result rows and
// handlers used across the subsampling and summary tests.

#include "core/count_matrix.hpp"
#include "core/results_store.hpp"
#include "handlers/handler.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace test_helpers {

inline std::string gene_id(size_t g) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "gene_%04zu", g);
    return buf;
}

inline std::vector<std::string> gene_ids(size_t n) {
    std::vector<std::string> ids;
    for (size_t g = 0; g < n; ++g) ids.push_back(gene_id(g));
    return ids;
}

inline std::vector<std::string> sample_ids(size_t n) {
    std::vector<std::string> ids;
    for (size_t j = 0; j < n; ++j) ids.push_back("s" + std::to_string(j));
    return ids;
}

// `per_group` reference samples followed by `per_group` treated samples.
inline TreatmentVector two_group_treatment(size_t per_group) {
    TreatmentVector t(2 * per_group, 0);
    for (size_t j = per_group; j < 2 * per_group; ++j) t[j] = 1;
    return t;
}

// Poisson counts with gene-specific means between 20 and ~500. The first
// `n_de` genes are 4x higher in the treated group.
inline CountMatrix make_two_group_matrix(size_t n_genes = 200, size_t per_group = 3,
                                         size_t n_de = 20, uint32_t seed = 7) {
    std::mt19937 rng(seed);
    size_t n_samples = 2 * per_group;
    std::vector<int64_t> counts(n_genes * n_samples);
    for (size_t g = 0; g < n_genes; ++g) {
        double base = 20.0 + static_cast<double>((g * 37) % 480);
        for (size_t j = 0; j < n_samples; ++j) {
            double mean = base;
            if (g < n_de && j >= per_group) mean *= 4.0;
            std::poisson_distribution<int64_t> draw(mean);
            counts[g * n_samples + j] = draw(rng);
        }
    }
    return CountMatrix(gene_ids(n_genes), sample_ids(n_samples), std::move(counts));
}

// Small matrix with explicit counts, row-major.
inline CountMatrix make_matrix(size_t n_genes, size_t n_samples, std::vector<int64_t> counts) {
    return CountMatrix(gene_ids(n_genes), sample_ids(n_samples), std::move(counts));
}

inline ResultRow make_row(const std::string& id, const std::string& method, double coefficient,
                          double pvalue, double qvalue, int64_t depth = 1000,
                          double proportion = 1.0, int replication = 0, double count = 10.0) {
    ResultRow r;
    r.id = id;
    r.method = method;
    r.coefficient = coefficient;
    r.pvalue = pvalue;
    r.qvalue = qvalue;
    r.depth = depth;
    r.proportion = proportion;
    r.replication = replication;
    r.count = count;
    return r;
}

// Handler reporting fixed coefficient = gene index and p = 0.5 for every gene.
inline ResultTable constant_table(const CountMatrix& m) {
    ResultTable t;
    auto& coef = t.columns["coefficient"];
    auto& pval = t.columns["pvalue"];
    for (size_t g = 0; g < m.n_genes(); ++g) {
        coef.push_back(static_cast<double>(g));
        pval.push_back(0.5);
    }
    return t;
}

inline std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace test_helpers
