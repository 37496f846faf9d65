#pragma once

#include "analysis/correlation.hpp"
#include "analysis/multiple_comparison.hpp"
#include "core/results_store.hpp"
#include "core/seed.hpp"
#include "summary/oracle.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SummaryConfig
// ---------------------------------------------------------------------------
struct SummaryConfig {
    double fdr_level = 0.05;
    bool average = false;                    // one row per (proportion, method)
    std::string p_adjust_method = "qvalue";  // or any p_adjust method
};

// ---------------------------------------------------------------------------
// SummaryRow - agreement of one (depth, proportion, method, replication)
// group with its method's oracle. Averaged rows carry replication = -1.
// ---------------------------------------------------------------------------
struct SummaryRow {
    double depth = 0.0;
    double proportion = 1.0;
    std::string method;
    int replication = 0;

    double significant = 0.0;
    double pearson = NA;
    double spearman = NA;
    double concordance = NA;
    double mse = NA;
    double est_fdp = NA;
    double r_fdp = NA;
    double percent = NA;
};

// ---------------------------------------------------------------------------
// SummaryStore - summary rows plus the parameters that produced them
// ---------------------------------------------------------------------------
class SummaryStore {
public:
    SummaryStore() = default;

    SummaryStore(Seed seed, double fdr_level, std::string p_adjust_method, bool averaged,
                 std::vector<SummaryRow> rows)
        : seed_(seed), fdr_level_(fdr_level), p_adjust_method_(std::move(p_adjust_method)),
          averaged_(averaged), rows_(std::move(rows)) {}

    Seed seed() const { return seed_; }
    double fdr_level() const { return fdr_level_; }
    const std::string& p_adjust_method() const { return p_adjust_method_; }
    bool averaged() const { return averaged_; }
    const std::vector<SummaryRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

private:
    Seed seed_ = 0;
    double fdr_level_ = 0.05;
    std::string p_adjust_method_ = "qvalue";
    bool averaged_ = false;
    std::vector<SummaryRow> rows_;
};

namespace metrics {

// (depth, proportion, method, replication)
using SummaryKey = std::tuple<int64_t, double, std::string, int>;

// One gene of a group joined with its oracle row.
struct JoinedRows {
    std::vector<double> coefficient;
    std::vector<double> padj;
    std::vector<double> oracle_coefficient;
    std::vector<double> oracle_padj;
    std::vector<double> oracle_lfdr;

    size_t size() const { return coefficient.size(); }
};

struct OracleEntry {
    double coefficient = NA;
    double padj = NA;
    double lfdr = NA;
};

using OracleIndex = std::unordered_map<std::string, OracleEntry>;

inline void check_config(const SummaryConfig& config) {
    if (!(config.fdr_level > 0.0 && config.fdr_level < 1.0)) {
        throw std::invalid_argument("FDR level must be in (0, 1), got " +
                                    std::to_string(config.fdr_level));
    }
    if (config.p_adjust_method != "qvalue" && !is_p_adjust_method(config.p_adjust_method)) {
        throw std::invalid_argument("Unknown p-value adjustment method: " +
                                    config.p_adjust_method);
    }
}

// Adjusted p-values per row: the stored q-values, or `method` applied within
// each (method, proportion, replication) group.
inline std::vector<double> adjusted_pvalues(const std::vector<ResultRow>& rows,
                                            const std::string& method) {
    std::vector<double> padj(rows.size(), NA);
    if (method == "qvalue") {
        for (size_t i = 0; i < rows.size(); ++i) padj[i] = rows[i].qvalue;
        return padj;
    }

    std::map<GroupKey, std::vector<size_t>> groups;
    for (size_t i = 0; i < rows.size(); ++i) groups[group_key(rows[i])].push_back(i);
    for (const auto& [key, idx] : groups) {
        std::vector<double> p;
        p.reserve(idx.size());
        for (size_t i : idx) p.push_back(rows[i].pvalue);
        auto adj = p_adjust(p, method);
        for (size_t k = 0; k < idx.size(); ++k) padj[idx[k]] = adj[k];
    }
    return padj;
}

// ID → (coefficient, padj, lFDR) for each method's oracle.
inline std::map<std::string, OracleIndex> index_oracles(const OracleSet& oracles,
                                                        const std::string& method) {
    std::map<std::string, OracleIndex> out;
    for (const auto& [name, rows] : oracles) {
        std::vector<double> pvals;
        pvals.reserve(rows.size());
        for (const auto& row : rows) pvals.push_back(row.pvalue);
        auto lfdr = oracle::oracle_lfdr(pvals);
        auto padj = adjusted_pvalues(rows, method);

        auto& index = out[name];
        for (size_t i = 0; i < rows.size(); ++i) {
            index.emplace(rows[i].id, OracleEntry{rows[i].coefficient, padj[i], lfdr[i]});
        }
    }
    return out;
}

// Mean of the non-NaN values; NaN when there are none.
inline double mean_present(const std::vector<double>& v) {
    double sum = 0.0;
    size_t n = 0;
    for (double x : v) {
        if (std::isnan(x)) continue;
        sum += x;
        ++n;
    }
    return n > 0 ? sum / static_cast<double>(n) : NA;
}

// Metric values for one joined group. Key fields are filled by the caller.
inline SummaryRow compute_metrics(const JoinedRows& g, double fdr_level) {
    SummaryRow out;
    auto significant = [&](double padj) { return !std::isnan(padj) && padj < fdr_level; };

    std::vector<double> sig_lfdr;
    size_t n_sig = 0;
    size_t false_disc = 0;
    size_t judged = 0;
    size_t oracle_sig = 0;
    size_t recovered = 0;
    for (size_t i = 0; i < g.size(); ++i) {
        if (significant(g.padj[i])) {
            ++n_sig;
            sig_lfdr.push_back(g.oracle_lfdr[i]);
            if (!std::isnan(g.oracle_padj[i])) {
                ++judged;
                if (g.oracle_padj[i] >= fdr_level) ++false_disc;
            }
        }
        if (significant(g.oracle_padj[i])) {
            ++oracle_sig;
            if (significant(g.padj[i])) ++recovered;
        }
    }

    out.significant = static_cast<double>(n_sig);

    auto pairs = correlation::valid_pairs(g.coefficient, g.oracle_coefficient);
    out.pearson = correlation::pearson(pairs.x, pairs.y);
    out.spearman = correlation::spearman(pairs.x, pairs.y);
    out.concordance = correlation::concordance(pairs.x, pairs.y);
    out.mse = correlation::mean_squared_error(pairs.x, pairs.y);

    // No discoveries means no false discoveries.
    if (n_sig == 0) {
        out.est_fdp = 0.0;
        out.r_fdp = 0.0;
    } else {
        out.est_fdp = mean_present(sig_lfdr);
        out.r_fdp = judged > 0 ? static_cast<double>(false_disc) / static_cast<double>(judged)
                               : NA;
    }
    out.percent = oracle_sig > 0
                      ? static_cast<double>(recovered) / static_cast<double>(oracle_sig)
                      : NA;
    return out;
}

// One row per (proportion, method): NA-aware means of every metric,
// including depth.
inline std::vector<SummaryRow> average_replications(const std::vector<SummaryRow>& rows) {
    std::map<std::pair<double, std::string>, std::vector<const SummaryRow*>> groups;
    for (const auto& row : rows) groups[{row.proportion, row.method}].push_back(&row);

    std::vector<SummaryRow> out;
    out.reserve(groups.size());
    for (const auto& [key, members] : groups) {
        auto avg = [&](double SummaryRow::*field) {
            std::vector<double> v;
            v.reserve(members.size());
            for (const auto* r : members) v.push_back(r->*field);
            return mean_present(v);
        };
        SummaryRow row;
        row.proportion = key.first;
        row.method = key.second;
        row.replication = -1;
        row.depth = avg(&SummaryRow::depth);
        row.significant = avg(&SummaryRow::significant);
        row.pearson = avg(&SummaryRow::pearson);
        row.spearman = avg(&SummaryRow::spearman);
        row.concordance = avg(&SummaryRow::concordance);
        row.mse = avg(&SummaryRow::mse);
        row.est_fdp = avg(&SummaryRow::est_fdp);
        row.r_fdp = avg(&SummaryRow::r_fdp);
        row.percent = avg(&SummaryRow::percent);
        out.push_back(std::move(row));
    }
    return out;
}

// Rows with an observed zero count carry no information about the gene.
inline std::vector<ResultRow> expressed_rows(const ResultsStore& store) {
    std::vector<ResultRow> rows;
    rows.reserve(store.size());
    for (const auto& row : store.rows()) {
        if (row.count != 0.0) rows.push_back(row);
    }
    return rows;
}

inline SummaryStore summarize_rows(const ResultsStore& store, const std::vector<ResultRow>& rows,
                                   const OracleSet& oracles, const SummaryConfig& config) {
    auto oracle_index = index_oracles(oracles, config.p_adjust_method);
    auto padj = adjusted_pvalues(rows, config.p_adjust_method);

    // Single grouping pass; map order is the output order.
    std::map<SummaryKey, std::vector<size_t>> groups;
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& r = rows[i];
        groups[{r.depth, r.proportion, r.method, r.replication}].push_back(i);
    }

    std::vector<const SummaryKey*> keys;
    std::vector<const std::vector<size_t>*> members;
    keys.reserve(groups.size());
    members.reserve(groups.size());
    for (const auto& [key, idx] : groups) {
        keys.push_back(&key);
        members.push_back(&idx);
    }

    std::vector<SummaryRow> computed(keys.size());
    std::vector<char> joined(keys.size(), 0);
    long n_groups = static_cast<long>(keys.size());

    #pragma omp parallel for schedule(dynamic)
    for (long k = 0; k < n_groups; ++k) {
        const auto& [depth, proportion, method, replication] = *keys[k];
        auto index_it = oracle_index.find(method);
        if (index_it == oracle_index.end()) continue;
        const OracleIndex& index = index_it->second;

        JoinedRows g;
        for (size_t i : *members[k]) {
            auto hit = index.find(rows[i].id);
            if (hit == index.end()) continue;
            g.coefficient.push_back(rows[i].coefficient);
            g.padj.push_back(padj[i]);
            g.oracle_coefficient.push_back(hit->second.coefficient);
            g.oracle_padj.push_back(hit->second.padj);
            g.oracle_lfdr.push_back(hit->second.lfdr);
        }
        if (g.size() == 0) continue;

        SummaryRow row = compute_metrics(g, config.fdr_level);
        row.depth = static_cast<double>(depth);
        row.proportion = proportion;
        row.method = method;
        row.replication = replication;
        computed[k] = std::move(row);
        joined[k] = 1;
    }

    std::vector<SummaryRow> out;
    out.reserve(computed.size());
    for (size_t k = 0; k < computed.size(); ++k) {
        if (joined[k]) out.push_back(std::move(computed[k]));
    }
    if (config.average) out = average_replications(out);

    return SummaryStore(store.seed(), config.fdr_level, config.p_adjust_method, config.average,
                        std::move(out));
}

}  // namespace metrics

// Compare every depth of `store` against each method's deepest rows.
inline SummaryStore summarize(const ResultsStore& store, const SummaryConfig& config = {}) {
    metrics::check_config(config);
    auto rows = metrics::expressed_rows(store);
    auto oracles = oracle::resolve_automatic(rows);
    return metrics::summarize_rows(store, rows, oracles, config);
}

// Compare every depth of `store` against one explicit oracle shared by all
// methods.
inline SummaryStore summarize(const ResultsStore& store, const ResultsStore& oracle_rows,
                              const SummaryConfig& config = {}) {
    metrics::check_config(config);
    auto rows = metrics::expressed_rows(store);
    auto oracles = oracle::resolve_explicit(oracle_rows.rows(), rows);
    return metrics::summarize_rows(store, rows, oracles, config);
}

// ---------------------------------------------------------------------------
// Plot contract - the four depth-indexed panels of a summary. Rendering is
// left to the consumer.
// ---------------------------------------------------------------------------
struct PlotPoint {
    double depth = 0.0;
    std::string method;
    double value = NA;
};

struct PlotPanel {
    std::string metric;
    std::string y_label;
    std::vector<PlotPoint> points;  // sorted by method, then depth
};

inline std::vector<PlotPanel> plot_panels(const SummaryStore& summary) {
    struct PanelSpec {
        const char* metric;
        const char* y_label;
        double SummaryRow::*field;
    };
    const PanelSpec specs[] = {
        {"significant", "Number of significant genes", &SummaryRow::significant},
        {"estFDP", "Estimated false discovery proportion", &SummaryRow::est_fdp},
        {"spearman", "Spearman correlation with oracle", &SummaryRow::spearman},
        {"MSE", "Mean squared error against oracle", &SummaryRow::mse},
    };

    std::vector<const SummaryRow*> ordered;
    ordered.reserve(summary.size());
    for (const auto& row : summary.rows()) ordered.push_back(&row);
    std::stable_sort(ordered.begin(), ordered.end(), [](const SummaryRow* a, const SummaryRow* b) {
        if (a->method != b->method) return a->method < b->method;
        return a->depth < b->depth;
    });

    std::vector<PlotPanel> panels;
    for (const auto& spec : specs) {
        PlotPanel panel;
        panel.metric = spec.metric;
        panel.y_label = spec.y_label;
        panel.points.reserve(ordered.size());
        for (const auto* row : ordered) {
            panel.points.push_back({row->depth, row->method, row->*spec.field});
        }
        panels.push_back(std::move(panel));
    }
    return panels;
}
