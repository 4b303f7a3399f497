#include "config.hpp"
#include "../processing/geometry.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <climits>

namespace pdf417 {

// Positions pos just after the ':' that follows "key". False if key is absent.
static bool find_value(const std::string& s, const std::string& key, size_t& pos){
  pos = s.find("\""+key+"\"");
  if(pos==std::string::npos) return false;
  pos = s.find(":", pos);
  if(pos==std::string::npos) return false;
  pos++;
  while(pos<s.size() && std::isspace((unsigned char)s[pos])) pos++;
  return true;
}

static bool parse_int(const std::string& s, const std::string& key, int& out, std::string& err){
  size_t pos=0;
  if(!find_value(s,key,pos)) return false;
  size_t end=pos;
  if(end<s.size() && (s[end]=='-' || s[end]=='+')) end++;
  while(end<s.size() && std::isdigit((unsigned char)s[end])) end++;
  std::string num = s.substr(pos, end-pos);
  if(num.empty() || num=="-" || num=="+"){
    err += "bad integer for \""+key+"\"; ";
    return false;
  }
  errno = 0;
  long v = std::strtol(num.c_str(), nullptr, 10);
  if(errno==ERANGE || v<INT_MIN || v>INT_MAX){
    err += "integer out of range for \""+key+"\"; ";
    return false;
  }
  out = (int)v;
  return true;
}

static bool parse_string(const std::string& s, const std::string& key, std::string& out, std::string& err){
  size_t pos=0;
  if(!find_value(s,key,pos)) return false;
  if(pos>=s.size() || s[pos]!='"'){ err += "expected string for \""+key+"\"; "; return false; }
  pos++;
  size_t end = s.find("\"", pos);
  if(end==std::string::npos){ err += "unterminated string for \""+key+"\"; "; return false; }
  out = s.substr(pos, end-pos);
  return true;
}

bool parse_config_json(const std::string& s, Config& C, std::string& err){
  err.clear();
  parse_int(s,"bar_width", C.bar_width, err);
  parse_int(s,"quiet_zone_modules", C.quiet_zone_modules, err);
  parse_int(s,"row_height_modules", C.row_height_modules, err);
  parse_int(s,"black", C.black, err);
  parse_int(s,"white", C.white, err);
  parse_string(s,"grid_path", C.grid_path, err);
  parse_string(s,"out_path", C.out_path, err);
  parse_string(s,"format", C.format, err);
  parse_string(s,"log_path", C.log_path, err);
  parse_string(s,"log_level", C.log_level, err);
  if(C.format!="png" && C.format!="pgm" && C.format!="raw")
    err += "unknown format \""+C.format+"\"; ";
  return err.empty();
}

bool load_config_json(const std::string& path, Config& C, std::string& err){
  std::ifstream f(path);
  if(!f){ err="Could not open config: "+path; return false; }
  std::ostringstream ss; ss<<f.rdbuf();
  if(!parse_config_json(ss.str(), C, err)){
    err = path+": "+err;
    return false;
  }
  return true;
}

bool config_to_params(const Config& C, RenderParams& P, std::string& err){
  if(C.bar_width<1){ err="bar_width must be >= 1"; return false; }
  if(C.quiet_zone_modules<0){ err="quiet_zone_modules must be >= 0"; return false; }
  if(C.row_height_modules<1){ err="row_height_modules must be >= 1"; return false; }
  if(C.black<0 || C.black>255 || C.white<0 || C.white>255){
    err="black/white samples must be in 0..255";
    return false;
  }
  P.bar_width = (unsigned)C.bar_width;
  P.quiet_zone_modules = (unsigned)C.quiet_zone_modules;
  P.row_height_modules = (unsigned)C.row_height_modules;
  P.black = (uint8_t)C.black;
  P.white = (uint8_t)C.white;
  return true;
}

} // namespace pdf417
