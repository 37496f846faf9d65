#pragma once

#include "core/count_matrix.hpp"
#include "core/errors.hpp"
#include "core/results_store.hpp"
#include "handlers/handler.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace dispatch {

// ---------------------------------------------------------------------------
// check_arguments - fail fast on handler/option combinations that cannot run
// in a single call. Handlers that need options cannot share a call with
// handlers that take none; options passed to options-free handlers and
// missing required options are rejected too.
// ---------------------------------------------------------------------------
inline void check_arguments(const std::vector<const HandlerSpec*>& handlers,
                            const HandlerOptions& options) {
    const HandlerSpec* with_options = nullptr;
    const HandlerSpec* without_options = nullptr;
    for (const auto* h : handlers) {
        if (h->takes_options()) {
            if (!with_options) with_options = h;
        } else if (!without_options) {
            without_options = h;
        }
    }

    if (with_options && without_options) {
        throw IncompatibleHandlerArguments(
            "Handler '" + with_options->name + "' requires extra options but '" +
            without_options->name + "' takes none; run them in separate calls and "
            "combine the stores");
    }
    if (without_options && !options.empty()) {
        throw IncompatibleHandlerArguments(
            "Options were supplied but handler '" + without_options->name + "' takes none");
    }
    for (const auto* h : handlers) {
        for (const auto& name : h->required_options) {
            if (options.count(name) == 0) {
                throw IncompatibleHandlerArguments("Handler '" + h->name +
                                                   "' requires option '" + name + "'");
            }
        }
    }
}

// ---------------------------------------------------------------------------
// normalize - validate a ResultTable against the handler contract and turn
// it into rows. Only the per-gene fields are set; the caller stamps depth,
// proportion, replication, method and q-values.
// ---------------------------------------------------------------------------
inline std::vector<ResultRow> normalize(const HandlerSpec& handler, const CountMatrix& matrix,
                                        const ResultTable& table) {
    auto coef_it = table.columns.find("coefficient");
    if (coef_it == table.columns.end()) {
        throw HandlerContractViolation(handler.name, "coefficient", "column missing");
    }
    auto p_it = table.columns.find("pvalue");
    if (p_it == table.columns.end()) {
        throw HandlerContractViolation(handler.name, "pvalue", "column missing");
    }

    bool explicit_ids = !table.ids.empty();
    size_t n_rows = explicit_ids ? table.ids.size() : matrix.n_genes();
    if (!explicit_ids && coef_it->second.size() != matrix.n_genes()) {
        throw HandlerContractViolation(
            handler.name, "row count",
            std::to_string(coef_it->second.size()) + " rows for " +
                std::to_string(matrix.n_genes()) + " genes and no ID column");
    }
    for (const auto& [name, column] : table.columns) {
        if (column.size() != n_rows) {
            throw HandlerContractViolation(handler.name, name,
                                           "length " + std::to_string(column.size()) +
                                               ", expected " + std::to_string(n_rows));
        }
    }
    if (!table.count.empty() && table.count.size() != n_rows) {
        throw HandlerContractViolation(handler.name, "count",
                                       "length " + std::to_string(table.count.size()) +
                                           ", expected " + std::to_string(n_rows));
    }
    if (explicit_ids && !handler.set_level) {
        for (const auto& id : table.ids) {
            if (!matrix.has_gene(id)) {
                throw HandlerContractViolation(handler.name, "ID", "unknown gene '" + id + "'");
            }
        }
    }

    // A handler may report count as an ordinary column.
    const std::vector<double>* count = table.count.empty() ? nullptr : &table.count;
    auto count_it = table.columns.find("count");
    if (!count && count_it != table.columns.end()) count = &count_it->second;

    std::vector<ResultRow> rows(n_rows);
    for (size_t i = 0; i < n_rows; ++i) {
        auto& row = rows[i];
        row.id = explicit_ids ? table.ids[i] : matrix.gene_ids()[i];
        row.count = count ? (*count)[i] : NA;
        row.method = handler.name;
        row.coefficient = coef_it->second[i];
        row.pvalue = p_it->second[i];
        for (const auto& [name, column] : table.columns) {
            if (name == "coefficient" || name == "pvalue" || name == "count") continue;
            row.extra[name] = column[i];
        }
    }
    return rows;
}

// Run one handler against a (sub)matrix and normalize its output.
inline std::vector<ResultRow> run_handler(const HandlerSpec& handler, const CountMatrix& matrix,
                                          const TreatmentVector& treatment,
                                          const HandlerOptions& options) {
    ResultTable table = handler.fn(matrix, treatment, options);
    return normalize(handler, matrix, table);
}

}  // namespace dispatch
