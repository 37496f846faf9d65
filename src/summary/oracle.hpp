#pragma once

#include "analysis/qvalue.hpp"
#include "core/errors.hpp"
#include "core/results_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// Reference rows each method's subsamples are compared against, keyed by
// method.
using OracleSet = std::map<std::string, std::vector<ResultRow>>;

// ---------------------------------------------------------------------------
// oracle namespace - resolving the reference result set and its local FDR
// ---------------------------------------------------------------------------
namespace oracle {

// Per method: the rows at the method's maximum realized depth. When several
// (proportion, replication) groups reach that depth, the lowest replication
// wins and then the largest proportion.
inline OracleSet resolve_automatic(const std::vector<ResultRow>& rows) {
    struct Pick {
        int64_t depth = -1;
        int replication = 0;
        double proportion = 0.0;
    };
    std::map<std::string, Pick> picks;
    for (const auto& row : rows) {
        auto [it, inserted] = picks.try_emplace(row.method);
        Pick& p = it->second;
        bool better = inserted || row.depth > p.depth ||
                      (row.depth == p.depth &&
                       (row.replication < p.replication ||
                        (row.replication == p.replication && row.proportion > p.proportion)));
        if (better) p = {row.depth, row.replication, row.proportion};
    }

    OracleSet out;
    for (const auto& row : rows) {
        const Pick& p = picks.at(row.method);
        if (row.depth == p.depth && row.replication == p.replication &&
            row.proportion == p.proportion) {
            out[row.method].push_back(row);
        }
    }
    return out;
}

// One explicit oracle applied to every method. The rows are regrouped under
// each method's name; a gene listed twice keeps its first row. A method whose
// rows share no gene with the oracle cannot be compared.
inline OracleSet resolve_explicit(const std::vector<ResultRow>& oracle_rows,
                                  const std::vector<ResultRow>& rows) {
    std::vector<ResultRow> unique;
    std::set<std::string> seen;
    for (const auto& row : oracle_rows) {
        if (seen.insert(row.id).second) unique.push_back(row);
    }

    std::map<std::string, bool> overlaps;
    std::vector<std::string> methods;
    for (const auto& row : rows) {
        auto [it, inserted] = overlaps.try_emplace(row.method, false);
        if (inserted) methods.push_back(row.method);
        if (!it->second && seen.count(row.id)) it->second = true;
    }

    OracleSet out;
    for (const auto& method : methods) {
        if (!overlaps[method]) throw OracleJoinFailure(method);
        auto& set = out[method];
        set = unique;
        for (auto& row : set) row.method = method;
    }
    return out;
}

// Local FDR of oracle p-values. p = 1 is left out of the density estimate and
// then given the largest local FDR of the other p-values; NaN stays NaN.
inline std::vector<double> oracle_lfdr(const std::vector<double>& pvals,
                                       const qvalue::LfdrConfig& config = {}) {
    std::vector<double> estimable;
    std::vector<size_t> where;
    for (size_t i = 0; i < pvals.size(); ++i) {
        if (std::isnan(pvals[i]) || pvals[i] == 1.0) continue;
        estimable.push_back(pvals[i]);
        where.push_back(i);
    }

    std::vector<double> out(pvals.size(), NA);
    if (estimable.empty()) {
        for (size_t i = 0; i < pvals.size(); ++i) {
            if (!std::isnan(pvals[i])) out[i] = 1.0;
        }
        return out;
    }

    auto lfdr = qvalue::local_fdr(estimable, config);
    double max_lfdr = *std::max_element(lfdr.begin(), lfdr.end());
    for (size_t i = 0; i < pvals.size(); ++i) {
        if (pvals[i] == 1.0) out[i] = max_lfdr;
    }
    for (size_t k = 0; k < where.size(); ++k) out[where[k]] = lfdr[k];
    return out;
}

}  // namespace oracle
