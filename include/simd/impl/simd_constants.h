#pragma once

#include <cstddef>
#include <cstdint>

// Plain scalars only: every ISA translation unit includes this header, and
// vector-typed globals would be initialized with that unit's instruction set.
namespace simd_constants {

constexpr char CHAR_NEWLINE = '\n';

constexpr size_t SCALAR_WORD_BYTES = sizeof(uint64_t);
constexpr size_t SSE_LANES = 16;
constexpr size_t NEON_LANES = 16;
constexpr size_t AVX2_LANES = 32;
constexpr size_t AVX512_LANES = 64;

// SWAR helpers: one bit set in every byte / the high bit of every byte
constexpr uint64_t SWAR_ONES = 0x0101010101010101ULL;
constexpr uint64_t SWAR_HIGH_BITS = 0x8080808080808080ULL;

}
