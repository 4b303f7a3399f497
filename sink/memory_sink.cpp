#include "memory_sink.hpp"

namespace pdf417 {

bool MemorySink::on_open(std::string&){
  img_.w = options().width;
  img_.h = options().height;
  img_.g.clear();
  img_.g.reserve((size_t)img_.w*img_.h);
  return true;
}

bool MemorySink::on_row(const std::vector<uint8_t>& row, std::string&){
  img_.g.insert(img_.g.end(), row.begin(), row.end());
  return true;
}

bool MemorySink::on_close(std::vector<uint8_t>& out, std::string&){
  out = img_.g;
  return true;
}

void MemorySink::on_release() noexcept {
  img_ = ImageGray{};
}

} // namespace pdf417
