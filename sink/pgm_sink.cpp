#include "pgm_sink.hpp"

namespace pdf417 {

bool PgmSink::on_open(std::string&){
  std::string hdr = "P5\n"+std::to_string(options().width)+" "+std::to_string(options().height)+"\n255\n";
  buf_.assign(hdr.begin(), hdr.end());
  buf_.reserve(hdr.size() + (size_t)options().width*options().height);
  return true;
}

bool PgmSink::on_row(const std::vector<uint8_t>& row, std::string&){
  buf_.insert(buf_.end(), row.begin(), row.end());
  return true;
}

bool PgmSink::on_close(std::vector<uint8_t>& out, std::string&){
  out.swap(buf_);
  buf_.clear();
  return true;
}

void PgmSink::on_release() noexcept {
  std::vector<uint8_t>().swap(buf_);
}

} // namespace pdf417
