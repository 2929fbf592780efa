#include "rng.hpp"

namespace resil {

PCG32::PCG32(uint64_t seed) : PCG32(seed, 1) {}

PCG32::PCG32(uint64_t seed, uint64_t stream)
    : state_(0), inc_((stream << 1) | 1) {
    next();
    state_ += seed;
    next();
}

uint32_t PCG32::next() {
    uint64_t oldstate = state_;
    state_ = oldstate * MULTIPLIER + inc_;
    uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
    uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31u));
}

int PCG32::integers(int low, int high) {
    if (high <= low) return low;
    uint32_t range = static_cast<uint32_t>(static_cast<int64_t>(high) - low);
    // Reject the low end so every residue is equally likely
    uint32_t threshold = (0u - range) % range;
    uint32_t r;
    do {
        r = next();
    } while (r < threshold);
    return low + static_cast<int>(r % range);
}

void PCG32::seed(uint64_t new_seed) {
    state_ = 0;
    next();
    state_ += new_seed;
    next();
}

}  // namespace resil
