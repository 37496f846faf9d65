#pragma once

#include <cstdint>
#include <cstring>
#include <random>

using Seed = uint64_t;

namespace seed {

// Fresh seed for a run that did not supply one.
inline Seed generate() {
    std::random_device rd;
    return (static_cast<Seed>(rd()) << 32) | static_cast<Seed>(rd());
}

// Random stream for one (proportion, replication) draw. The stream depends on
// nothing else, so new proportions or replications under the same seed never
// shift the draws of existing ones.
inline std::mt19937_64 stream_for(Seed seed, double proportion, int replication) {
    uint64_t p_bits = 0;
    std::memcpy(&p_bits, &proportion, sizeof(p_bits));
    std::seed_seq seq{
        static_cast<uint32_t>(seed & 0xffffffffULL),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(p_bits & 0xffffffffULL),
        static_cast<uint32_t>(p_bits >> 32),
        static_cast<uint32_t>(replication),
    };
    return std::mt19937_64(seq);
}

}  // namespace seed
