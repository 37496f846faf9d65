#pragma once

#include "core/seed.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// Missing-value marker for every numeric field.
constexpr double NA = std::numeric_limits<double>::quiet_NaN();

inline bool is_na(double v) { return std::isnan(v); }

// ---------------------------------------------------------------------------
// ResultRow - one gene × depth × replication × method
// ---------------------------------------------------------------------------
struct ResultRow {
    std::string id;
    double count = NA;
    int64_t depth = 0;
    double proportion = 1.0;
    int replication = 0;
    std::string method;
    double coefficient = NA;
    double pvalue = NA;
    double qvalue = NA;

    // Optional numeric columns a handler chose to report.
    std::map<std::string, double> extra;

    double extension(const std::string& name) const {
        auto it = extra.find(name);
        return it == extra.end() ? NA : it->second;
    }
};

// (method, proportion, replication) - the unit q-values are computed over.
using GroupKey = std::tuple<std::string, double, int>;

inline GroupKey group_key(const ResultRow& row) {
    return {row.method, row.proportion, row.replication};
}

// ---------------------------------------------------------------------------
// ResultsStore - long-format results of one or more runs plus the seed that
// produced them. Immutable after construction.
// ---------------------------------------------------------------------------
class ResultsStore {
public:
    ResultsStore() = default;

    ResultsStore(Seed seed, std::vector<ResultRow> rows)
        : seed_(seed), rows_(std::move(rows)) {
        // Every row carries every extension column; absent values become NA.
        for (const auto& row : rows_) {
            for (const auto& [name, value] : row.extra) extension_columns_.insert(name);
        }
        for (auto& row : rows_) {
            for (const auto& name : extension_columns_) row.extra.emplace(name, NA);
        }
    }

    Seed seed() const { return seed_; }
    const std::vector<ResultRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    std::vector<std::string> extension_columns() const {
        return {extension_columns_.begin(), extension_columns_.end()};
    }

    std::vector<std::string> methods() const {
        std::vector<std::string> out;
        std::set<std::string> seen;
        for (const auto& row : rows_) {
            if (seen.insert(row.method).second) out.push_back(row.method);
        }
        return out;
    }

    std::set<GroupKey> group_keys() const {
        std::set<GroupKey> keys;
        for (const auto& row : rows_) keys.insert(group_key(row));
        return keys;
    }

private:
    Seed seed_ = 0;
    std::vector<ResultRow> rows_;
    std::set<std::string> extension_columns_;
};

inline Seed get_seed(const ResultsStore& store) { return store.seed(); }

// Rows matching `keep`, same seed.
inline ResultsStore filter_rows(const ResultsStore& store,
                                const std::function<bool(const ResultRow&)>& keep) {
    std::vector<ResultRow> rows;
    for (const auto& row : store.rows()) {
        if (keep(row)) rows.push_back(row);
    }
    return ResultsStore(store.seed(), std::move(rows));
}
