// subsampler_test.cpp - tests for CountMatrix and binomial-thinning subsampling
//
// Covers matrix validation, proportion checks, exactness at full depth,
// determinism per (seed, proportion, replication), entry-wise bounds and
// conservation of expected depth.

#include <gtest/gtest.h>

#include "core/count_matrix.hpp"
#include "core/errors.hpp"
#include "core/seed.hpp"
#include "subsample/subsampler.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

using test_helpers::make_matrix;
using test_helpers::make_two_group_matrix;

constexpr Seed SEED = 20240617ULL;

}  // namespace

// ===========================================================================
// 1. CountMatrix construction
// ===========================================================================
TEST(CountMatrixTest, ExposesShapeAndTotals) {
    auto m = make_matrix(2, 3, {1, 2, 3, 4, 5, 6});
    EXPECT_EQ(m.n_genes(), 2u);
    EXPECT_EQ(m.n_samples(), 3u);
    EXPECT_EQ(m.at(1, 2), 6);
    EXPECT_EQ(m.row_sum(0), 6);
    EXPECT_EQ(m.row_sum(1), 15);
    EXPECT_EQ(m.column_sums(), (std::vector<int64_t>{5, 7, 9}));
    EXPECT_EQ(m.total(), 21);
    EXPECT_TRUE(m.has_gene("gene_0001"));
    EXPECT_FALSE(m.has_gene("gene_0002"));
}

TEST(CountMatrixTest, RejectsWrongBufferSize) {
    EXPECT_THROW(make_matrix(2, 2, {1, 2, 3}), std::invalid_argument);
}

TEST(CountMatrixTest, RejectsNegativeCounts) {
    EXPECT_THROW(make_matrix(1, 2, {1, -1}), std::invalid_argument);
}

TEST(CountMatrixTest, RejectsDuplicateGeneIds) {
    EXPECT_THROW(CountMatrix({"a", "a"}, {"s0"}, {1, 2}), std::invalid_argument);
}

// ===========================================================================
// 2. Proportion validation
// ===========================================================================
TEST(SubsamplerTest, RejectsProportionsOutsideUnitInterval) {
    auto m = make_matrix(1, 2, {10, 20});
    for (double p : {0.0, -0.1, 1.5, std::numeric_limits<double>::quiet_NaN()}) {
        EXPECT_THROW(subsample_matrix(m, p, SEED, 0), InvalidProportion) << "p = " << p;
    }
}

TEST(SubsamplerTest, InvalidProportionIsAnInvalidArgument) {
    auto m = make_matrix(1, 1, {10});
    try {
        subsample_matrix(m, 2.0, SEED, 0);
        FAIL() << "expected InvalidProportion";
    } catch (const std::invalid_argument& e) {
        auto* ip = dynamic_cast<const InvalidProportion*>(&e);
        ASSERT_NE(ip, nullptr);
        EXPECT_DOUBLE_EQ(ip->proportion(), 2.0);
    }
}

// ===========================================================================
// 3. Full depth and determinism
// ===========================================================================
TEST(SubsamplerTest, FullDepthIsExactCopyForAnySeed) {
    auto m = make_two_group_matrix(50, 3, 5);
    for (Seed s : {Seed{0}, Seed{1}, SEED, std::numeric_limits<Seed>::max()}) {
        EXPECT_EQ(subsample_matrix(m, 1.0, s, 0), m);
        EXPECT_EQ(subsample_matrix(m, 1.0, s, 7), m);
    }
}

TEST(SubsamplerTest, SameKeyGivesIdenticalMatrix) {
    auto m = make_two_group_matrix(100, 3, 10);
    auto a = subsample_matrix(m, 0.3, SEED, 2);
    auto b = subsample_matrix(m, 0.3, SEED, 2);
    EXPECT_EQ(a, b);
}

TEST(SubsamplerTest, GenerateSubsampledMatrixReproducesDraw) {
    auto m = make_two_group_matrix(100, 3, 10);
    EXPECT_EQ(generate_subsampled_matrix(m, 0.25, SEED), subsample_matrix(m, 0.25, SEED, 0));
    EXPECT_EQ(generate_subsampled_matrix(m, 0.25, SEED, 3), subsample_matrix(m, 0.25, SEED, 3));
}

TEST(SubsamplerTest, ReplicationsSeedsAndProportionsDrawDifferently) {
    auto m = make_two_group_matrix(200, 3, 10);
    auto base = subsample_matrix(m, 0.5, SEED, 0);
    EXPECT_NE(base, subsample_matrix(m, 0.5, SEED, 1));
    EXPECT_NE(base, subsample_matrix(m, 0.5, SEED + 1, 0));
    EXPECT_NE(base.data(), subsample_matrix(m, 0.5000001, SEED, 0).data());
}

TEST(SubsamplerTest, KeepsIdsAndShape) {
    auto m = make_two_group_matrix(30, 2, 3);
    auto s = subsample_matrix(m, 0.1, SEED, 0);
    EXPECT_EQ(s.gene_ids(), m.gene_ids());
    EXPECT_EQ(s.sample_ids(), m.sample_ids());
    EXPECT_TRUE(s.has_gene(m.gene_ids().front()));
}

// ===========================================================================
// 4. Distributional properties
// ===========================================================================
TEST(SubsamplerTest, EntriesNeverExceedOriginalAndZerosStayZero) {
    auto m = make_matrix(2, 3, {0, 5, 100, 0, 0, 1000});
    for (int r = 0; r < 20; ++r) {
        auto s = subsample_matrix(m, 0.5, SEED, r);
        for (size_t i = 0; i < m.data().size(); ++i) {
            EXPECT_GE(s.data()[i], 0);
            EXPECT_LE(s.data()[i], m.data()[i]);
        }
        EXPECT_EQ(s.at(0, 0), 0);
        EXPECT_EQ(s.at(1, 0), 0);
        EXPECT_EQ(s.at(1, 1), 0);
    }
}

TEST(SubsamplerTest, ConservesDepthInExpectation) {
    auto m = make_two_group_matrix(300, 3, 0);
    double total = static_cast<double>(m.total());
    for (double p : {0.1, 0.5, 0.9}) {
        double sum = 0.0;
        constexpr int REPS = 10;
        for (int r = 0; r < REPS; ++r) {
            sum += static_cast<double>(subsample_matrix(m, p, SEED, r).total());
        }
        double mean = sum / REPS;
        double expected = p * total;
        // Binomial sd of the total is sqrt(total p (1-p)); the mean of 10
        // draws is far inside 1% of the expectation for ~500k reads.
        EXPECT_NEAR(mean, expected, 0.01 * expected) << "p = " << p;
    }
}

TEST(SubsamplerTest, SmallProportionThinsHeavily) {
    auto m = make_matrix(1, 1, {100000});
    auto s = subsample_matrix(m, 0.01, SEED, 0);
    EXPECT_GT(s.total(), 800);
    EXPECT_LT(s.total(), 1200);
}

// ===========================================================================
// 5. Seed streams
// ===========================================================================
TEST(SeedTest, StreamDependsOnlyOnItsKey) {
    auto a = seed::stream_for(SEED, 0.5, 1);
    auto b = seed::stream_for(SEED, 0.5, 1);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(a(), b());

    auto c = seed::stream_for(SEED, 0.5, 2);
    auto d = seed::stream_for(SEED, 0.5, 1);
    EXPECT_NE(c(), d());
}

TEST(SeedTest, GeneratedSeedsDiffer) {
    // Two 64-bit draws from the device colliding is not a realistic outcome.
    EXPECT_NE(seed::generate(), seed::generate());
}
