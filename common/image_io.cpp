#include "image_io.hpp"
#include <fstream>
#include <cctype>
#include <cstddef>
#include <climits>
#include <lodepng.h>

namespace pdf417 {

bool write_file(const std::string& path, const std::vector<uint8_t>& bytes, std::string& err){
  std::ofstream f(path, std::ios::binary);
  if(!f){ err="Could not open "+path+" for write"; return false; }
  f.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
  if(!f){ err="Short write to "+path; return false; }
  return true;
}

bool decode_png_gray(const std::vector<uint8_t>& png, ImageGray& img, std::string& err){
  std::vector<unsigned char> px;
  unsigned w=0, h=0;
  unsigned code = lodepng::decode(px, w, h, png, LCT_GREY, 8);
  if(code){ err=std::string("PNG decode error: ")+lodepng_error_text(code); return false; }
  img.w=w; img.h=h;
  img.g.assign(px.begin(), px.end());
  return true;
}

static void skip_ws_and_comments(const std::vector<uint8_t>& b, size_t& i){
  while(i<b.size()){
    if(b[i]=='#'){ while(i<b.size() && b[i]!='\n') i++; continue; }
    if(std::isspace(b[i])){ i++; continue; }
    break;
  }
}

static bool read_uint(const std::vector<uint8_t>& b, size_t& i, unsigned& v){
  skip_ws_and_comments(b, i);
  size_t start=i;
  v=0;
  while(i<b.size() && std::isdigit(b[i])){
    unsigned d = (unsigned)(b[i]-'0');
    if(v > (UINT_MAX-d)/10) return false;
    v = v*10 + d;
    i++;
  }
  return i>start;
}

bool parse_pgm(const std::vector<uint8_t>& b, ImageGray& img, std::string& err){
  if(b.size()<2 || b[0]!='P' || b[1]!='5'){ err="Expected binary PGM (P5)"; return false; }
  size_t i=2;
  unsigned w=0,h=0,maxv=0;
  if(!read_uint(b,i,w) || !read_uint(b,i,h) || !read_uint(b,i,maxv)){ err="Truncated or oversized PGM header"; return false; }
  if(maxv!=255){ err="PGM maxval must be 255"; return false; }
  i++; // single whitespace char after header
  if(b.size() < i + (size_t)w*h){ err="Unexpected EOF reading pixels"; return false; }
  img.w=w; img.h=h;
  img.g.assign(b.begin()+(std::ptrdiff_t)i, b.begin()+(std::ptrdiff_t)(i+(size_t)w*h));
  return true;
}

} // namespace pdf417
