#pragma once

#include "interfaces/i_sample_source.hpp"
#include <cstdint>
#include <random>

namespace panedash {

// Uniform [0, 1) samples from a 64-bit Mersenne Twister
class RandomSampleSource : public ISampleSource {
public:
    // Seeded from std::random_device
    RandomSampleSource();
    explicit RandomSampleSource(uint64_t seed);

    double next() override;

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

} // namespace panedash
