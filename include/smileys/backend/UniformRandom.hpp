#pragma once

#include <cstdint>
#include <random>

namespace SM::Backend {

class UniformRandom {
public:
    explicit UniformRandom(std::uint64_t seed)
        : rng_(static_cast<std::mt19937::result_type>(seed)) {}

    // Uniform integer in [0, n); 0 when n <= 0.
    auto next(int n) -> int {
        if (n <= 0) {
            return 0;
        }
        std::uniform_int_distribution<int> dist(0, n - 1);
        return dist(rng_);
    }

private:
    std::mt19937 rng_;
};

} // namespace SM::Backend
