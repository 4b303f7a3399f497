#include "grid.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <utility>

namespace pdf417 {

bool validate_grid(const Grid& grid, Error& err){
  if(grid.empty()) return fail(err, ErrorKind::IRREGULAR_GRID, "irregular grid: no lines");
  const size_t cols = grid.front().size();
  if(cols<2)
    return fail(err, ErrorKind::IRREGULAR_GRID,
                "irregular grid: "+std::to_string(cols)+" codeword(s) per line, need at least 2");
  for(size_t r=1;r<grid.size();r++){
    if(grid[r].size()!=cols)
      return fail(err, ErrorKind::IRREGULAR_GRID,
                  "irregular grid: line "+std::to_string(r)+" has "+std::to_string(grid[r].size())+
                  " codewords, line 0 has "+std::to_string(cols));
  }
  return true;
}

static bool parse_token(const std::string& tok, size_t lineno, Codeword& cw, Error& err){
  if(tok=="nil" || tok=="-"){ cw.reset(); return true; }
  for(char c: tok){
    if(!std::isdigit((unsigned char)c))
      return fail(err, ErrorKind::IO, "grid line "+std::to_string(lineno)+": bad codeword \""+tok+"\"");
  }
  errno = 0;
  unsigned long long v = std::strtoull(tok.c_str(), nullptr, 10);
  if(errno==ERANGE)
    return fail(err, ErrorKind::IO, "grid line "+std::to_string(lineno)+": codeword out of range \""+tok+"\"");
  cw = (uint64_t)v;
  return true;
}

bool parse_grid_text(const std::string& text, Grid& grid, Error& err){
  grid.clear();
  std::istringstream in(text);
  std::string raw;
  size_t lineno=0;
  while(std::getline(in, raw)){
    lineno++;
    auto hash = raw.find('#');
    if(hash!=std::string::npos) raw.erase(hash);
    for(char& c: raw) if(c==',') c=' ';
    std::istringstream ls(raw);
    Line line;
    std::string tok;
    while(ls>>tok){
      Codeword cw;
      if(!parse_token(tok, lineno, cw, err)) return false;
      line.push_back(cw);
    }
    if(!line.empty()) grid.push_back(std::move(line));
  }
  return true;
}

bool load_grid_text(const std::string& path, Grid& grid, Error& err){
  std::ifstream f(path);
  if(!f) return fail(err, ErrorKind::IO, "Could not open grid: "+path);
  std::ostringstream ss; ss<<f.rdbuf();
  return parse_grid_text(ss.str(), grid, err);
}

} // namespace pdf417
