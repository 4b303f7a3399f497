#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "grid.hpp"

namespace pdf417 {

// 18 for the last column of a line (stop pattern), 17 otherwise.
unsigned target_bit_width(size_t column, size_t columns);

// Binary digit count of v; 0 counts as one digit.
unsigned natural_bit_width(uint64_t v);

// Appends target_bits digits (MSB first, 0/1) for cw to bits.
// An absent codeword appends CODEWORD_BITS zeros whatever target_bits is.
// Fails with MALFORMED_CODEWORD when v needs more than target_bits digits;
// bits is left unchanged in that case.
bool expand_codeword(const Codeword& cw, unsigned target_bits, std::vector<uint8_t>& bits, Error& err);

} // namespace pdf417
