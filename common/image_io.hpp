#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pdf417 {

struct ImageGray {
  unsigned w=0, h=0;
  std::vector<uint8_t> g; // w*h
};

bool write_file(const std::string& path, const std::vector<uint8_t>& bytes, std::string& err);

// Readers for rendered output; 8-bit single channel only.
bool decode_png_gray(const std::vector<uint8_t>& png, ImageGray& img, std::string& err);
bool parse_pgm(const std::vector<uint8_t>& bytes, ImageGray& img, std::string& err);

} // namespace pdf417
