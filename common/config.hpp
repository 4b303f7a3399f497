#pragma once
#include <string>

namespace pdf417 {

struct RenderParams;

struct Config {
  // Symbol geometry
  int bar_width = 5;          // pixels per module
  int quiet_zone_modules = 2; // quiet zone = quiet_zone_modules * bar_width
  int row_height_modules = 4; // data row height = row_height_modules * bar_width
  // Samples
  int black = 0;
  int white = 255;
  // IO
  std::string grid_path = "grid.txt";
  std::string out_path = "out/symbol.png";
  std::string format = "png"; // png | pgm | raw
  std::string log_path = "out/logs/pdf417_render.log";
  std::string log_level = "INFO";
};

// Keys present in the file override the defaults already held by C.
bool load_config_json(const std::string& path, Config& C, std::string& err);
bool parse_config_json(const std::string& text, Config& C, std::string& err);

bool config_to_params(const Config& C, RenderParams& P, std::string& err);

} // namespace pdf417
