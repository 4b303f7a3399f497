// Geometry formulas and codeword bit expansion.
//   ./minitest_geometry_bits  -> OK/FAIL per group, exit code 0 when all pass

#include <cstdint>
#include <iostream>
#include <vector>

#include "../processing/geometry.hpp"
#include "../processing/bits.hpp"

using namespace pdf417;

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static Grid make_grid(size_t lines, size_t cols, uint64_t v=1){
  return Grid(lines, Line(cols, Codeword(v)));
}

static uint64_t bits_to_value(const std::vector<uint8_t>& bits){
  uint64_t v=0;
  for(uint8_t b: bits) v = (v<<1) | b;
  return v;
}

// ------------------ A : geometry ---------------------------------------------
static bool test_line_bit_count(){
  T_ASSERT(line_bit_count(2)==35);
  T_ASSERT(line_bit_count(3)==52);
  T_ASSERT(line_bit_count(10)==8*17+17+18);
  T_ASSERT(line_bit_count(1)==0);
  T_ASSERT(line_bit_count(0)==0);
  return true;
}

static bool test_width_height_formula(){
  for(unsigned bw=1; bw<=6; ++bw){
    RenderParams P; P.bar_width=bw;
    for(size_t lines=1; lines<=5; ++lines){
      for(size_t n=2; n<=12; ++n){
        Grid g = make_grid(lines, n);
        unsigned qz = 2*bw;
        T_ASSERT(image_width(g,P) == ((n-2)*17 + 17 + 18)*bw + 2*qz);
        T_ASSERT(image_height(g,P) == lines*4*bw + 2*qz);
      }
    }
  }
  return true;
}

static bool test_reference_scenario_size(){
  RenderParams P;
  Grid g{ Line{Codeword(3), Codeword(5)} };
  T_ASSERT(quiet_zone_px(P)==10);
  T_ASSERT(row_height_px(P)==20);
  T_ASSERT(image_width(g,P)==195);
  T_ASSERT(image_height(g,P)==40);
  return true;
}

static bool test_params_validation(){
  Error err;
  RenderParams P;
  T_ASSERT(validate_params(P, err));
  P.bar_width=0;
  T_ASSERT(!validate_params(P, err));
  T_ASSERT(err.kind==ErrorKind::BAD_PARAMS);
  P.bar_width=3; P.row_height_modules=0;
  T_ASSERT(!validate_params(P, err));
  return true;
}

static bool test_size_math_is_wide(){
  RenderParams P; P.bar_width=200000000;
  Grid g{ Line{Codeword(3), Codeword(5)} };
  T_ASSERT(image_width(g,P) == uint64_t(35)*200000000u + 4*uint64_t(200000000));
  P = RenderParams{}; P.bar_width=1; P.row_height_modules=1u<<31;
  Grid two = make_grid(2, 2);
  T_ASSERT(image_height(two,P) == 2*(uint64_t(1)<<31) + 4);
  return true;
}

static bool test_checked_image_size(){
  Grid g{ Line{Codeword(3), Codeword(5)} };
  unsigned w=0, h=0; Error err;
  RenderParams P;
  T_ASSERT(checked_image_size(g, P, w, h, err));
  T_ASSERT(w==195 && h==40);

  P.bar_width=200000000;
  w=h=0;
  T_ASSERT(!checked_image_size(g, P, w, h, err));
  T_ASSERT(err.kind==ErrorKind::BAD_PARAMS);
  T_ASSERT(w==0 && h==0);

  P = RenderParams{}; P.bar_width=1; P.row_height_modules=1u<<31;
  err = Error{};
  T_ASSERT(!checked_image_size(make_grid(2,2), P, w, h, err));
  T_ASSERT(err.kind==ErrorKind::BAD_PARAMS);

  P = RenderParams{}; P.bar_width=~0u; P.quiet_zone_modules=~0u;
  err = Error{};
  T_ASSERT(!checked_image_size(g, P, w, h, err));
  T_ASSERT(err.kind==ErrorKind::BAD_PARAMS);

  // one line just under and just over the side limit
  P = RenderParams{}; P.bar_width=1; P.quiet_zone_modules=0;
  Grid wide = make_grid(1, (size_t)((MAX_IMAGE_DIM-1)/17));
  T_ASSERT(checked_image_size(wide, P, w, h, err));
  T_ASSERT(w==image_width(wide,P) && w<=MAX_IMAGE_DIM);
  Grid too_wide = make_grid(1, (size_t)(MAX_IMAGE_DIM/17 + 1));
  T_ASSERT(!checked_image_size(too_wide, P, w, h, err));
  return true;
}

// ------------------ B : bit expansion ----------------------------------------
static bool test_target_widths(){
  T_ASSERT(target_bit_width(0,2)==17);
  T_ASSERT(target_bit_width(1,2)==18);
  T_ASSERT(target_bit_width(3,5)==17);
  T_ASSERT(target_bit_width(4,5)==18);
  return true;
}

static bool test_natural_width(){
  T_ASSERT(natural_bit_width(0)==1);
  T_ASSERT(natural_bit_width(1)==1);
  T_ASSERT(natural_bit_width(2)==2);
  T_ASSERT(natural_bit_width(131071)==17);
  T_ASSERT(natural_bit_width(131072)==18);
  T_ASSERT(natural_bit_width(~uint64_t(0))==64);
  return true;
}

static bool test_expand_roundtrip(){
  const uint64_t values[] = {0, 1, 2, 3, 5, 1000, 65535, 130728, 131071};
  for(unsigned target: {17u, 18u}){
    for(uint64_t v: values){
      std::vector<uint8_t> bits; Error err;
      T_ASSERT(expand_codeword(Codeword(v), target, bits, err));
      T_ASSERT(bits.size()==target);
      T_ASSERT(bits_to_value(bits)==v);
      unsigned pad = target - natural_bit_width(v);
      for(unsigned i=0;i<pad;i++) T_ASSERT(bits[i]==0);
      if(v) T_ASSERT(bits[pad]==1);
    }
  }
  // widest stop pattern
  std::vector<uint8_t> bits; Error err;
  T_ASSERT(expand_codeword(Codeword(262143), 18, bits, err));
  T_ASSERT(bits==std::vector<uint8_t>(18,1));
  return true;
}

static bool test_expand_appends(){
  std::vector<uint8_t> bits{1,1}; Error err;
  T_ASSERT(expand_codeword(Codeword(1), 17, bits, err));
  T_ASSERT(bits.size()==19);
  T_ASSERT(bits[0]==1 && bits[1]==1 && bits[2]==0 && bits[18]==1);
  return true;
}

static bool test_absent_codeword(){
  Error err;
  std::vector<uint8_t> a, b;
  T_ASSERT(expand_codeword(Codeword(), 17, a, err));
  T_ASSERT(a==std::vector<uint8_t>(17,0));
  // stop position still gets 17 bits
  T_ASSERT(expand_codeword(Codeword(), 18, b, err));
  T_ASSERT(b==std::vector<uint8_t>(17,0));
  return true;
}

static bool test_expand_overflow(){
  Error err;
  std::vector<uint8_t> bits{1};
  T_ASSERT(!expand_codeword(Codeword(131072), 17, bits, err));
  T_ASSERT(err.kind==ErrorKind::MALFORMED_CODEWORD);
  T_ASSERT(bits.size()==1);
  err = Error{};
  T_ASSERT(!expand_codeword(Codeword(262144), 18, bits, err));
  T_ASSERT(err.kind==ErrorKind::MALFORMED_CODEWORD);
  T_ASSERT(err.message.find("262144")!=std::string::npos);
  return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main(){
  bool ok = true;

  ok &= test_line_bit_count();
  ok &= test_width_height_formula();
  ok &= test_reference_scenario_size();
  ok &= test_params_validation();
  ok &= test_size_math_is_wide();
  ok &= test_checked_image_size();
  std::cout << "[A] geometry : " << (ok? "OK":"FAIL") << "\n";

  ok &= test_target_widths();
  ok &= test_natural_width();
  ok &= test_expand_roundtrip();
  ok &= test_expand_appends();
  ok &= test_absent_codeword();
  ok &= test_expand_overflow();
  std::cout << "[B] bit expansion : " << (ok? "OK":"FAIL") << "\n";

  std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
  return ok? 0 : 1;
}
