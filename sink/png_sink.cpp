#include "png_sink.hpp"
#include <lodepng.h>

namespace pdf417 {

bool PngSink::on_open(std::string&){
  pixels_.clear();
  pixels_.reserve((size_t)options().width*options().height);
  return true;
}

bool PngSink::on_row(const std::vector<uint8_t>& row, std::string&){
  pixels_.insert(pixels_.end(), row.begin(), row.end());
  return true;
}

bool PngSink::on_close(std::vector<uint8_t>& out, std::string& err){
  unsigned code = lodepng::encode(out, pixels_, options().width, options().height, LCT_GREY, 8);
  std::vector<uint8_t>().swap(pixels_);
  if(code){
    err=std::string("PNG encode error ")+std::to_string(code)+": "+lodepng_error_text(code);
    return false;
  }
  return true;
}

void PngSink::on_release() noexcept {
  std::vector<uint8_t>().swap(pixels_);
}

} // namespace pdf417
