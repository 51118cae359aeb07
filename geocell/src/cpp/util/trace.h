//
// geocell - geohash encoding and distance measurement.
//
// Copyright 2015 Hendrik Muhs<hendrik.muhs@gmail.com>
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

/*
 * trace.h
 *
 * Tracing is switched on per translation unit:
 *
 *   #define ENABLE_TRACING
 *   #include "util/trace.h"
 *
 * Without ENABLE_TRACING the TRACE macro expands to nothing.
 */

#ifndef GEOCELL_UTIL_TRACE_H_
#define GEOCELL_UTIL_TRACE_H_

#include <cstdarg>
#include <cstdio>

namespace geocell {
namespace util {

inline void Trace(const char* file, int line, const char* format, ...) {
  va_list args;
  va_start(args, format);
  std::fprintf(stderr, "[trace] %s:%d: ", file, line);
  std::vfprintf(stderr, format, args);
  std::fputc('\n', stderr);
  va_end(args);
}

} /* namespace util */
} /* namespace geocell */

#endif /* GEOCELL_UTIL_TRACE_H_ */

// not guarded, every include re-evaluates ENABLE_TRACING
#undef TRACE
#ifdef ENABLE_TRACING
#define TRACE(...) ::geocell::util::Trace(__FILE__, __LINE__, __VA_ARGS__)
#else
#define TRACE(...)
#endif
