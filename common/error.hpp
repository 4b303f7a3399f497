#pragma once
#include <string>

namespace pdf417 {

enum class ErrorKind { NONE, IRREGULAR_GRID, MALFORMED_CODEWORD, BAD_PARAMS, SINK_FAILURE, CONFIG, IO };

inline const char* kind_str(ErrorKind K) {
  switch(K){
    case ErrorKind::NONE:               return "NONE";
    case ErrorKind::IRREGULAR_GRID:     return "IRREGULAR_GRID";
    case ErrorKind::MALFORMED_CODEWORD: return "MALFORMED_CODEWORD";
    case ErrorKind::BAD_PARAMS:         return "BAD_PARAMS";
    case ErrorKind::SINK_FAILURE:       return "SINK_FAILURE";
    case ErrorKind::CONFIG:             return "CONFIG";
    case ErrorKind::IO:                 return "IO";
  }
  return "NONE";
}

struct Error {
  ErrorKind kind = ErrorKind::NONE;
  std::string message;
};

// Fills err and returns false so call sites can write `return fail(err, ...)`.
inline bool fail(Error& err, ErrorKind K, const std::string& msg) {
  err.kind = K;
  err.message = msg;
  return false;
}

} // namespace pdf417
