#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// One condition label per sample.
using TreatmentVector = std::vector<int>;

// ---------------------------------------------------------------------------
// CountMatrix - genes × samples read counts, row-major
// ---------------------------------------------------------------------------
class CountMatrix {
public:
    CountMatrix() = default;

    CountMatrix(std::vector<std::string> gene_ids,
                std::vector<std::string> sample_ids,
                std::vector<int64_t> counts)
        : gene_ids_(std::move(gene_ids)),
          sample_ids_(std::move(sample_ids)),
          counts_(std::move(counts)) {
        if (counts_.size() != gene_ids_.size() * sample_ids_.size()) {
            throw std::invalid_argument(
                "Count buffer has " + std::to_string(counts_.size()) +
                " entries, expected " +
                std::to_string(gene_ids_.size() * sample_ids_.size()));
        }
        for (int64_t c : counts_) {
            if (c < 0) throw std::invalid_argument("Counts must be non-negative");
        }
        index_.reserve(gene_ids_.size());
        for (size_t g = 0; g < gene_ids_.size(); ++g) {
            if (!index_.emplace(gene_ids_[g], g).second) {
                throw std::invalid_argument("Duplicate gene ID: " + gene_ids_[g]);
            }
        }
    }

    // Same shape and IDs as `shape`, new counts. Used by the subsampler.
    CountMatrix with_counts(std::vector<int64_t> counts) const {
        CountMatrix out;
        out.gene_ids_ = gene_ids_;
        out.sample_ids_ = sample_ids_;
        out.index_ = index_;
        out.counts_ = std::move(counts);
        if (out.counts_.size() != counts_.size()) {
            throw std::invalid_argument("with_counts: buffer size mismatch");
        }
        return out;
    }

    size_t n_genes() const { return gene_ids_.size(); }
    size_t n_samples() const { return sample_ids_.size(); }

    int64_t at(size_t gene, size_t sample) const {
        return counts_[gene * sample_ids_.size() + sample];
    }

    const std::vector<std::string>& gene_ids() const { return gene_ids_; }
    const std::vector<std::string>& sample_ids() const { return sample_ids_; }
    const std::vector<int64_t>& data() const { return counts_; }

    bool has_gene(const std::string& id) const { return index_.count(id) > 0; }

    int64_t row_sum(size_t gene) const {
        int64_t s = 0;
        size_t n = sample_ids_.size();
        for (size_t j = 0; j < n; ++j) s += counts_[gene * n + j];
        return s;
    }

    std::vector<int64_t> column_sums() const {
        size_t n = sample_ids_.size();
        std::vector<int64_t> sums(n, 0);
        for (size_t g = 0; g < gene_ids_.size(); ++g) {
            for (size_t j = 0; j < n; ++j) sums[j] += counts_[g * n + j];
        }
        return sums;
    }

    // Realized sequencing depth.
    int64_t total() const {
        int64_t s = 0;
        for (int64_t c : counts_) s += c;
        return s;
    }

    bool operator==(const CountMatrix& other) const {
        return gene_ids_ == other.gene_ids_ &&
               sample_ids_ == other.sample_ids_ &&
               counts_ == other.counts_;
    }

private:
    std::vector<std::string> gene_ids_;
    std::vector<std::string> sample_ids_;
    std::vector<int64_t> counts_;
    std::unordered_map<std::string, size_t> index_;
};
