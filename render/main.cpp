// PDF417 raster renderer: codeword grid (text) -> PNG/PGM/raw grayscale image.
// Build:
//   cmake -S . -B build && cmake --build build
// Run:
//   ./pdf417_render --config ../config/config.json [--grid grid.txt] [--out symbol.png] [--format png|pgm|raw]
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../common/logger.hpp"
#include "../common/config.hpp"
#include "../common/image_io.hpp"
#include "../processing/grid.hpp"
#include "../processing/raster_encoder.hpp"
#include "../sink/png_sink.hpp"
#include "../sink/pgm_sink.hpp"
#include "../sink/memory_sink.hpp"

namespace fs = std::filesystem;
using pdf417::Logger;
using pdf417::LogLevel;

static void usage(){
  std::cerr<<"Usage: pdf417_render --config path/to/config.json [--grid file] [--out file] [--format png|pgm|raw]\n";
}

static std::unique_ptr<pdf417::ImageSink> make_sink(const std::string& format){
  if(format=="pgm") return std::make_unique<pdf417::PgmSink>();
  if(format=="raw") return std::make_unique<pdf417::MemorySink>();
  return std::make_unique<pdf417::PngSink>();
}

int main(int argc, char** argv){
  std::string cfgPath="config/config.json";
  std::string gridArg, outArg, formatArg;
  for(int i=1;i<argc;i++){
    std::string a=argv[i];
    if(a=="--config" && i+1<argc) cfgPath=argv[++i];
    else if(a=="--grid" && i+1<argc) gridArg=argv[++i];
    else if(a=="--out" && i+1<argc) outArg=argv[++i];
    else if(a=="--format" && i+1<argc) formatArg=argv[++i];
    else if(a=="-h"||a=="--help"){ usage(); return 0; }
    else { usage(); return 1; }
  }

  pdf417::Config C; std::string err;
  if(!pdf417::load_config_json(cfgPath, C, err)){
    std::cerr<<"Config load failed: "<<err<<"\n";
    return 1;
  }
  if(!gridArg.empty()) C.grid_path=gridArg;
  if(!outArg.empty()) C.out_path=outArg;
  if(!formatArg.empty()) C.format=formatArg;
  if(C.format!="png" && C.format!="pgm" && C.format!="raw"){
    std::cerr<<"Unknown format \""<<C.format<<"\"\n";
    return 1;
  }

  Logger log;
  LogLevel level=LogLevel::INFO;
  if(!pdf417::parse_level(C.log_level, level))
    std::cerr<<"Unknown log_level \""<<C.log_level<<"\", using INFO\n";
  log.set_level(level);
  std::error_code ec;
  fs::path logPath(C.log_path);
  if(logPath.has_parent_path()) fs::create_directories(logPath.parent_path(), ec);
  if(ec || !log.open(C.log_path))
    std::cerr<<"Could not open log "<<C.log_path<<", logging to stderr\n";

  pdf417::RenderParams P;
  if(!pdf417::config_to_params(C, P, err)){
    log.log(LogLevel::ERROR, "Bad render parameters: %s", err.c_str());
    return 1;
  }
  log.log(LogLevel::INFO, "Loaded config: bar_width=%u quiet_zone=%u modules row_height=%u modules format=%s",
          P.bar_width, P.quiet_zone_modules, P.row_height_modules, C.format.c_str());

  pdf417::Grid grid; pdf417::Error gerr;
  if(!pdf417::load_grid_text(C.grid_path, grid, gerr)){
    log.log(LogLevel::ERROR, "Grid load failed: %s", gerr.message.c_str());
    return 1;
  }
  log.log(LogLevel::INFO, "Loaded grid %s: %zu line(s)", C.grid_path.c_str(), grid.size());

  auto sink = make_sink(C.format);
  pdf417::RasterEncoder enc(P, &log);
  std::vector<uint8_t> bytes; pdf417::Error eerr;
  if(!enc.encode(grid, *sink, bytes, eerr)){
    log.log(LogLevel::ERROR, "Encode failed [%s]: %s", pdf417::kind_str(eerr.kind), eerr.message.c_str());
    return 1;
  }
  log.log(LogLevel::INFO, "Rendered %llux%llu px",
          (unsigned long long)pdf417::image_width(grid, P), (unsigned long long)pdf417::image_height(grid, P));

  fs::path outPath(C.out_path);
  if(outPath.has_parent_path()) fs::create_directories(outPath.parent_path(), ec);
  if(!pdf417::write_file(C.out_path, bytes, err)){
    log.log(LogLevel::ERROR, "Write failed: %s", err.c_str());
    return 1;
  }
  log.log(LogLevel::INFO, "Wrote %zu bytes to %s", bytes.size(), C.out_path.c_str());
  return 0;
}
