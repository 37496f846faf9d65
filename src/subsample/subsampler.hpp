#pragma once

#include "core/count_matrix.hpp"
#include "core/errors.hpp"
#include "core/seed.hpp"

#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

namespace subsampler {

inline bool valid_proportion(double proportion) {
    return !std::isnan(proportion) && proportion > 0.0 && proportion <= 1.0;
}

inline void check_proportion(double proportion) {
    if (!valid_proportion(proportion)) throw InvalidProportion(proportion);
}

}  // namespace subsampler

// ---------------------------------------------------------------------------
// subsample_matrix - binomial thinning of every entry.
//
//   Y[m,n] ~ Binomial(X[m,n], proportion)
//
// The draw uses the stream seed::stream_for(seed, proportion, replication),
// walking the entries in row-major order. proportion == 1 returns an exact
// copy without touching the generator.
// ---------------------------------------------------------------------------
inline CountMatrix subsample_matrix(const CountMatrix& matrix, double proportion,
                                    Seed seed, int replication) {
    subsampler::check_proportion(proportion);
    if (proportion == 1.0) return matrix;

    auto rng = seed::stream_for(seed, proportion, replication);
    const auto& in = matrix.data();
    std::vector<int64_t> out(in.size(), 0);
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == 0) continue;
        std::binomial_distribution<int64_t> draw(in[i], proportion);
        out[i] = draw(rng);
    }
    return matrix.with_counts(std::move(out));
}

// Re-derive the matrix a run used for (proportion, replication), for
// inspection after the fact.
inline CountMatrix generate_subsampled_matrix(const CountMatrix& matrix, double proportion,
                                              Seed seed, int replication = 0) {
    return subsample_matrix(matrix, proportion, seed, replication);
}
