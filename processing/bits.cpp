#include "bits.hpp"
#include "geometry.hpp"

namespace pdf417 {

unsigned target_bit_width(size_t column, size_t columns){
  return (column+1==columns) ? STOP_PATTERN_BITS : CODEWORD_BITS;
}

unsigned natural_bit_width(uint64_t v){
  unsigned n=1;
  while(v>>=1) n++;
  return n;
}

bool expand_codeword(const Codeword& cw, unsigned target_bits, std::vector<uint8_t>& bits, Error& err){
  if(!cw){
    bits.insert(bits.end(), CODEWORD_BITS, 0);
    return true;
  }
  const uint64_t v = *cw;
  const unsigned n = natural_bit_width(v);
  if(n>target_bits)
    return fail(err, ErrorKind::MALFORMED_CODEWORD,
                "codeword "+std::to_string(v)+" needs "+std::to_string(n)+
                " bits, target width is "+std::to_string(target_bits));
  bits.insert(bits.end(), target_bits-n, 0);
  for(unsigned i=n;i-->0;) bits.push_back((uint8_t)((v>>i) & 1u));
  return true;
}

} // namespace pdf417
