#ifndef SMOSVM_RANDOM_SOURCE_HPP
#define SMOSVM_RANDOM_SOURCE_HPP

#include <cstdint>
#include <memory>
#include <random>

namespace smosvm {

// Uniform integer in [0, n) from a 32 bit URBG. Rejection sampling instead of
// std::uniform_int_distribution so the sequence is the same on every standard
// library. n must be positive.
template <class URBG>
int uniform_index(URBG& g, int n) {
    static_assert(URBG::max() - URBG::min() == 0xffffffffu, "URBG must produce 32 bits");
    const std::uint64_t range_g = std::uint64_t(1) << 32;
    const std::uint64_t range_d = static_cast<std::uint64_t>(n);
    // largest multiple of n not above 2^32, samples at or past it are biased
    const std::uint64_t limit = range_g - range_g % range_d;
    std::uint64_t sample = static_cast<std::uint64_t>(g() - URBG::min());
    while (sample >= limit) {
        sample = static_cast<std::uint64_t>(g() - URBG::min());
    }
    return static_cast<int>(sample % range_d);
}

// Source of uniform indices for SMO partner selection
class RandomSource {
public:
    RandomSource() = default;
    virtual ~RandomSource() = default;
    // uniform integer in [0, n), n > 0
    virtual int next_index(int n) = 0;
    // independent source in the same state
    virtual std::shared_ptr<RandomSource> clone() const = 0;
};

class Mt19937Source : public RandomSource {
public:
    // seeded from std::random_device
    Mt19937Source();
    explicit Mt19937Source(std::uint32_t seed);

    int next_index(int n) override;
    std::shared_ptr<RandomSource> clone() const override;
    void seed(std::uint32_t seed);

private:
    std::mt19937 _engine;
};

}

#endif
