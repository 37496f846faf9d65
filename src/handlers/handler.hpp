#pragma once

#include "core/count_matrix.hpp"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Named numeric options forwarded to every handler of a dispatch call
// (covariates, blocking factors, tuning constants).
using HandlerOptions = std::map<std::string, std::vector<double>>;

// ---------------------------------------------------------------------------
// ResultTable - raw handler output. `columns` must hold "coefficient" and
// "pvalue"; any other column is carried through as an extension field.
// `ids` and `count` are optional: leave them empty to have the dispatcher
// fill IDs from the matrix rows and count with the missing marker.
// ---------------------------------------------------------------------------
struct ResultTable {
    std::vector<std::string> ids;
    std::vector<double> count;
    std::map<std::string, std::vector<double>> columns;
};

using AnalysisHandler = std::function<ResultTable(const CountMatrix&, const TreatmentVector&,
                                                  const HandlerOptions&)>;

// ---------------------------------------------------------------------------
// HandlerSpec - a handler plus what it expects from a dispatch call
// ---------------------------------------------------------------------------
struct HandlerSpec {
    std::string name;
    AnalysisHandler fn;

    // Option names the handler cannot run without. A handler with no
    // required options takes none at all.
    std::vector<std::string> required_options;

    // Reports named entities (gene sets, exon bins) instead of matrix genes;
    // its IDs are not checked against the matrix.
    bool set_level = false;

    bool takes_options() const { return !required_options.empty(); }
};

// ---------------------------------------------------------------------------
// HandlerRegistry - string identifier → handler
// ---------------------------------------------------------------------------
class HandlerRegistry {
public:
    void add(HandlerSpec spec) {
        if (spec.name.empty()) throw std::invalid_argument("Handler name must not be empty");
        if (!spec.fn) throw std::invalid_argument("Handler '" + spec.name + "' has no function");
        std::string name = spec.name;
        handlers_[name] = std::move(spec);
    }

    void add(const std::string& name, AnalysisHandler fn) {
        HandlerSpec spec;
        spec.name = name;
        spec.fn = std::move(fn);
        add(std::move(spec));
    }

    bool contains(const std::string& name) const { return handlers_.count(name) > 0; }

    const HandlerSpec& get(const std::string& name) const {
        auto it = handlers_.find(name);
        if (it == handlers_.end()) throw std::invalid_argument("Unknown handler: " + name);
        return it->second;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& [name, spec] : handlers_) out.push_back(name);
        return out;
    }

private:
    std::map<std::string, HandlerSpec> handlers_;
};
