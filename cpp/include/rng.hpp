#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace resil {

// PCG-XSH-RR: 64-bit state, 32-bit output.
class PCG32 {
public:
    explicit PCG32(uint64_t seed);
    PCG32(uint64_t seed, uint64_t stream);

    uint32_t next();
    // Uniform integer in [low, high).
    int integers(int low, int high);

    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (int i = static_cast<int>(items.size()) - 1; i > 0; i--) {
            int j = integers(0, i + 1);
            std::swap(items[i], items[j]);
        }
    }

    void seed(uint64_t new_seed);

private:
    uint64_t state_;
    uint64_t inc_;

    static constexpr uint64_t MULTIPLIER = 6364136223846793005ULL;
};

}  // namespace resil
