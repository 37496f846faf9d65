#pragma once

#include "analysis/qvalue.hpp"
#include "core/count_matrix.hpp"
#include "core/errors.hpp"
#include "core/results_store.hpp"
#include "core/seed.hpp"
#include "handlers/builtin_handlers.hpp"
#include "handlers/dispatcher.hpp"
#include "handlers/handler.hpp"
#include "pipeline/combine.hpp"
#include "subsample/subsampler.hpp"

#include <omp.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TaskProgress - reported once per finished (proportion, replication) task
// ---------------------------------------------------------------------------
struct TaskProgress {
    size_t completed = 0;
    size_t total = 0;
    double proportion = 1.0;
    int replication = 0;
    int64_t depth = 0;
    size_t rows = 0;
};

using ProgressCallback = std::function<void(const TaskProgress&)>;

// ---------------------------------------------------------------------------
// SubsampleConfig - one subsampling run
// ---------------------------------------------------------------------------
struct SubsampleConfig {
    std::vector<double> proportions;
    std::vector<std::string> methods;
    int replications = 1;
    int first_replication = 0;       // replication indices run from here upward
    std::optional<Seed> seed;        // generated when absent
    HandlerOptions options;          // forwarded to every handler
    int n_threads = 0;               // 0 = OpenMP default
    bool verbose = false;            // progress lines on stderr
    ProgressCallback on_progress;
    const std::atomic<bool>* cancel = nullptr;
    bool return_partial_on_cancel = false;
};

// ---------------------------------------------------------------------------
// SubsampleRunner - proportions × replications tasks, each one subsampled
// matrix shared by every requested method
// ---------------------------------------------------------------------------
class SubsampleRunner {
public:
    SubsampleRunner(const SubsampleConfig& config, const HandlerRegistry& registry)
        : config_(config), registry_(registry) {}

    ResultsStore run(const CountMatrix& matrix, const TreatmentVector& treatment) {
        auto handlers = validate(matrix, treatment);
        Seed run_seed = config_.seed.has_value() ? *config_.seed : seed::generate();

        struct Task {
            double proportion;
            int replication;
        };
        std::vector<Task> tasks;
        for (double p : config_.proportions) {
            for (int r = 0; r < config_.replications; ++r) {
                tasks.push_back({p, config_.first_replication + r});
            }
        }

        size_t total = tasks.size();
        std::vector<std::vector<ResultRow>> outputs(total);
        std::vector<char> done(total, 0);
        size_t completed = 0;

        auto finish = [&](size_t t, std::vector<ResultRow> rows) {
            TaskProgress progress;
            progress.total = total;
            progress.proportion = tasks[t].proportion;
            progress.replication = tasks[t].replication;
            progress.depth = rows.empty() ? 0 : rows.front().depth;
            progress.rows = rows.size();
            outputs[t] = std::move(rows);
            done[t] = 1;
            progress.completed = ++completed;
            report(progress);
        };

        // The first task runs alone so a handler that breaks the result
        // contract fails the call before any other method or task executes.
        if (!cancelled() && total > 0) {
            finish(0, run_task(matrix, treatment, handlers, run_seed,
                               tasks[0].proportion, tasks[0].replication));
        }

        std::atomic<bool> abort{false};
        std::exception_ptr failure;
        // Exceptions may not leave a worker or a critical section; the first
        // one is kept and rethrown on this thread.
        auto record_failure = [&](std::exception_ptr e) {
            #pragma omp critical(subseq_task_failure)
            {
                if (!failure) failure = e;
            }
            abort.store(true);
        };
        int threads = config_.n_threads > 0 ? config_.n_threads : omp_get_max_threads();
        long n_tasks = static_cast<long>(total);

        #pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
        for (long t = 1; t < n_tasks; ++t) {
            if (abort.load() || cancelled()) continue;
            std::vector<ResultRow> rows;
            try {
                rows = run_task(matrix, treatment, handlers, run_seed,
                                tasks[t].proportion, tasks[t].replication);
            } catch (...) {
                record_failure(std::current_exception());
                continue;
            }
            #pragma omp critical(subseq_task_done)
            {
                try {
                    finish(static_cast<size_t>(t), std::move(rows));
                } catch (...) {
                    record_failure(std::current_exception());
                }
            }
        }
        if (failure) std::rethrow_exception(failure);

        if (completed < total) {
            if (!config_.return_partial_on_cancel) throw SubsampleCancelled(completed, total);
            if (config_.verbose) {
                std::cerr << "Cancelled: returning " << completed << " of " << total
                          << " tasks\n";
            }
        }

        std::vector<ResultRow> rows;
        for (size_t t = 0; t < total; ++t) {
            if (!done[t]) continue;
            rows.insert(rows.end(), std::make_move_iterator(outputs[t].begin()),
                        std::make_move_iterator(outputs[t].end()));
        }
        return ResultsStore(run_seed, std::move(rows));
    }

    // One (proportion, replication) task: subsample once, run every handler
    // on the same matrix, q-values per method. All rows or none.
    std::vector<ResultRow> run_task(const CountMatrix& matrix, const TreatmentVector& treatment,
                                    const std::vector<const HandlerSpec*>& handlers,
                                    Seed run_seed, double proportion, int replication) const {
        CountMatrix sub = subsample_matrix(matrix, proportion, run_seed, replication);
        int64_t depth = sub.total();

        std::vector<ResultRow> rows;
        for (const auto* h : handlers) {
            auto method_rows = dispatch::run_handler(*h, sub, treatment, config_.options);

            std::vector<double> pvals;
            pvals.reserve(method_rows.size());
            for (const auto& row : method_rows) pvals.push_back(row.pvalue);
            auto qvals = qvalue::compute_qvalues(pvals);

            for (size_t i = 0; i < method_rows.size(); ++i) {
                auto& row = method_rows[i];
                row.depth = depth;
                row.proportion = proportion;
                row.replication = replication;
                row.qvalue = qvals[i];
                rows.push_back(std::move(row));
            }
        }
        return rows;
    }

private:
    SubsampleConfig config_;
    const HandlerRegistry& registry_;

    // All input checks happen here, before any subsampling.
    std::vector<const HandlerSpec*> validate(const CountMatrix& matrix,
                                             const TreatmentVector& treatment) const {
        if (config_.proportions.empty()) {
            throw std::invalid_argument("At least one proportion is required");
        }
        for (double p : config_.proportions) subsampler::check_proportion(p);
        std::set<double> unique_props(config_.proportions.begin(), config_.proportions.end());
        if (unique_props.size() != config_.proportions.size()) {
            throw std::invalid_argument("Proportions must be distinct");
        }
        if (config_.replications < 1) {
            throw std::invalid_argument("replications must be at least 1");
        }
        if (config_.first_replication < 0) {
            throw std::invalid_argument("first_replication must be non-negative");
        }
        if (config_.methods.empty()) {
            throw std::invalid_argument("At least one method is required");
        }
        if (treatment.size() != matrix.n_samples()) {
            throw std::invalid_argument("Treatment has " + std::to_string(treatment.size()) +
                                        " labels for " + std::to_string(matrix.n_samples()) +
                                        " samples");
        }

        std::vector<const HandlerSpec*> handlers;
        std::set<std::string> seen;
        for (const auto& name : config_.methods) {
            if (!seen.insert(name).second) {
                throw std::invalid_argument("Method listed twice: " + name);
            }
            handlers.push_back(&registry_.get(name));
        }
        dispatch::check_arguments(handlers, config_.options);
        return handlers;
    }

    bool cancelled() const {
        return config_.cancel != nullptr && config_.cancel->load();
    }

    void report(const TaskProgress& progress) const {
        if (config_.verbose) {
            std::cerr << "  proportion " << progress.proportion
                      << ", replication " << progress.replication
                      << ": depth " << progress.depth << ", " << progress.rows << " rows ("
                      << progress.completed << "/" << progress.total << ")\n"
                      << std::flush;
        }
        if (config_.on_progress) config_.on_progress(progress);
    }
};

// Subsample `matrix` at every proportion × replication and run every method.
inline ResultsStore subsample(const CountMatrix& matrix, const TreatmentVector& treatment,
                              const SubsampleConfig& config,
                              const HandlerRegistry& registry = default_registry()) {
    SubsampleRunner runner(config, registry);
    return runner.run(matrix, treatment);
}

// ---------------------------------------------------------------------------
// extend_subsamples - more proportions or replications under the seed of an
// existing store, combined with it. Re-running a key the store already holds
// or passing a different seed is rejected.
// ---------------------------------------------------------------------------
inline ResultsStore extend_subsamples(const ResultsStore& store, const CountMatrix& matrix,
                                      const TreatmentVector& treatment,
                                      const SubsampleConfig& config,
                                      const HandlerRegistry& registry = default_registry()) {
    if (config.seed.has_value() && *config.seed != store.seed()) {
        throw InvalidSeedReuse("Store was produced with seed " + std::to_string(store.seed()) +
                               ", extension requested seed " + std::to_string(*config.seed));
    }
    auto existing = store.group_keys();
    for (const auto& method : config.methods) {
        for (double p : config.proportions) {
            for (int r = 0; r < config.replications; ++r) {
                GroupKey key{method, p, config.first_replication + r};
                if (existing.count(key)) {
                    throw InvalidSeedReuse("Store already holds method '" + method +
                                           "' at proportion " + std::to_string(p) +
                                           ", replication " +
                                           std::to_string(config.first_replication + r));
                }
            }
        }
    }

    SubsampleConfig extended = config;
    extended.seed = store.seed();
    auto added = subsample(matrix, treatment, extended, registry);
    return combine_subsamples(store, added);
}
