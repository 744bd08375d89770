#include "../include/smosvm_bits/random_source.hpp"
#include "../include/smosvm_bits/errors.hpp"

#include <string>

namespace smosvm {

Mt19937Source::Mt19937Source() {
    std::random_device rd;
    this->_engine.seed(rd());
}

Mt19937Source::Mt19937Source(std::uint32_t seed) : _engine(seed) {}

void Mt19937Source::seed(std::uint32_t seed) {
    this->_engine.seed(seed);
}

int Mt19937Source::next_index(int n) {
    if (n <= 0) {
        throw InvalidParameter("index range must be positive, got " + std::to_string(n));
    }
    return uniform_index(_engine, n);
}

std::shared_ptr<RandomSource> Mt19937Source::clone() const {
    return std::make_shared<Mt19937Source>(*this);
}

}
