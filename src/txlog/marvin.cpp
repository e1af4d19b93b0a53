// ==============================================================================
// marvin.cpp - Marvin32 (хэш записей журналов транзакций)
// ==============================================================================

#include "reghive/cursor.hpp"
#include "reghive/txlog.hpp"

namespace reghive::txlog {

namespace {

inline std::uint32_t rotl(std::uint32_t value, int shift) {
    return (value << shift) | (value >> (32 - shift));
}

inline void block(std::uint32_t& lo, std::uint32_t& hi) {
    hi ^= lo;
    lo = rotl(lo, 20);
    lo += hi;
    hi = rotl(hi, 9);
    hi ^= lo;
    lo = rotl(lo, 27);
    lo += hi;
    hi = rotl(hi, 19);
}

}  // anonymous namespace

std::uint64_t marvin32(const std::uint8_t* data, std::size_t length, std::uint64_t seed) {
    std::uint32_t lo = static_cast<std::uint32_t>(seed);
    std::uint32_t hi = static_cast<std::uint32_t>(seed >> 32);

    std::size_t pos = 0;
    while (length - pos >= 4) {
        lo += format::read_u32_le(data + pos);
        block(lo, hi);
        pos += 4;
    }

    std::uint32_t final_word = 0x80;
    switch (length - pos) {
    case 3:
        final_word = (final_word << 8) | data[pos + 2];
        [[fallthrough]];
    case 2:
        final_word = (final_word << 8) | data[pos + 1];
        [[fallthrough]];
    case 1:
        final_word = (final_word << 8) | data[pos];
        break;
    default:
        break;
    }

    lo += final_word;
    block(lo, hi);
    block(lo, hi);

    return (static_cast<std::uint64_t>(hi) << 32) | lo;
}

}  // namespace reghive::txlog
