#pragma once
#include <cstdio>
#include <string>

namespace scbfa {

// Tagged stderr lines, e.g. "[BfaEngine] sweep 3: ..."
inline void log_line(const char* tag, const std::string& s) {
  std::fprintf(stderr, "[%s] %s\n", tag, s.c_str());
}

inline void log_info(bool verbose, const char* tag, const std::string& s) {
  if (verbose) log_line(tag, s);
}

inline void log_warn(const char* tag, const std::string& s) {
  log_line(tag, "Warning: " + s);
}

} // namespace scbfa
