#pragma once

#include "core/results_store.hpp"

#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// combine_subsamples - concatenate stores into a new one. The first store's
// seed is kept as provenance. Overlapping (method, proportion, replication)
// keys are not deduplicated.
// ---------------------------------------------------------------------------
inline ResultsStore combine_subsamples(const std::vector<ResultsStore>& stores) {
    if (stores.empty()) {
        throw std::invalid_argument("combine_subsamples needs at least one store");
    }
    size_t total = 0;
    for (const auto& s : stores) total += s.size();

    std::vector<ResultRow> rows;
    rows.reserve(total);
    for (const auto& s : stores) {
        rows.insert(rows.end(), s.rows().begin(), s.rows().end());
    }
    return ResultsStore(stores.front().seed(), std::move(rows));
}

inline ResultsStore combine_subsamples(const ResultsStore& a, const ResultsStore& b) {
    return combine_subsamples(std::vector<ResultsStore>{a, b});
}
