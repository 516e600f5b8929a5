#pragma once

namespace panedash {

// Source of uniformly distributed samples in [0, 1)
class ISampleSource {
public:
    virtual ~ISampleSource() = default;

    virtual double next() = 0;
};

} // namespace panedash
