#include "random.hpp"
#include "distribution.hpp"

namespace cryptorand::crypto {

CryptoRandom& Random::instance() {
    static CryptoRandom shared;
    return shared;
}

bytes Random::generate(size_t size) {
    bytes result(size);
    instance().next_bytes(result);
    return result;
}

uint32_t Random::generate_uint32() {
    fixed_bytes<4> buf;
    instance().next_bytes(buf);
    return distribution::load_le32(buf.data());
}

uint64_t Random::generate_uint64() {
    return instance()();
}

void Random::generate_into(byte* buffer, size_t size) {
    instance().next_bytes(buffer, size);
}

uint32_t Random::uniform(uint32_t upper_bound) {
    return static_cast<uint32_t>(instance().next_int64(0, static_cast<int64_t>(upper_bound)));
}

} // namespace cryptorand::crypto
