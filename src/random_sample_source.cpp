#include "random_sample_source.hpp"
#include <cmath>

namespace panedash {

RandomSampleSource::RandomSampleSource()
    : engine_(std::random_device{}())
{
}

RandomSampleSource::RandomSampleSource(uint64_t seed)
    : engine_(seed)
{
}

double RandomSampleSource::next() {
    // Some standard libraries can round the distribution up to exactly 1.0
    double v = distribution_(engine_);
    if (v >= 1.0) {
        v = std::nextafter(1.0, 0.0);
    }
    return v;
}

} // namespace panedash
