//===----------------------------------------------------------------------===//
//
//                         HLL
//
// logger.h
//
// Identification: src/include/common/logger.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdio>
#include <ctime>

namespace hll {

// https://blog.galowicz.de/2016/02/20/short_file_macro/
using cstr = const char *;

static constexpr auto PastLastSlash(cstr a, cstr b) -> cstr {
  return *a == '\0' ? b : *a == '/' ? PastLastSlash(a + 1, a + 1) : PastLastSlash(a + 1, b);
}

static constexpr auto PastLastSlash(cstr a) -> cstr { return PastLastSlash(a, a); }

#define __SHORT_FILE__                                  \
  ({                                                    \
    constexpr hll::cstr sf__{hll::PastLastSlash(__FILE__)}; \
    sf__;                                               \
  })

// Log levels.
static constexpr int LOG_LEVEL_OFF = 1000;
static constexpr int LOG_LEVEL_ERROR = 500;
static constexpr int LOG_LEVEL_WARN = 400;
static constexpr int LOG_LEVEL_INFO = 300;
static constexpr int LOG_LEVEL_DEBUG = 200;
static constexpr int LOG_LEVEL_TRACE = 100;
static constexpr int LOG_LEVEL_ALL = 0;

#define LOG_LOG_TIME_FORMAT "%Y-%m-%d %H:%M:%S"
#define LOG_OUTPUT_STREAM stdout

// Compile with -DLOG_LEVEL=hll::LOG_LEVEL_OFF (or another level) to override.
#ifndef LOG_LEVEL
#ifndef NDEBUG
#define LOG_LEVEL hll::LOG_LEVEL_DEBUG
#else
#define LOG_LEVEL hll::LOG_LEVEL_INFO
#endif
#endif

// Output log message header in this format: time [file:line:function] type -
// ex: 2024-07-06 10:00:00 [redis_codec.cpp:123:Encode] DEBUG -
inline void OutputLogHeader(const char *file, int line, const char *func, int level) {
  time_t t = ::time(nullptr);
  tm *cur_time = localtime(&t);  // NOLINT
  char time_str[32];
  ::strftime(time_str, 32, LOG_LOG_TIME_FORMAT, cur_time);
  const char *type;
  switch (level) {
    case LOG_LEVEL_ERROR:
      type = "ERROR";
      break;
    case LOG_LEVEL_WARN:
      type = "WARN ";
      break;
    case LOG_LEVEL_INFO:
      type = "INFO ";
      break;
    case LOG_LEVEL_DEBUG:
      type = "DEBUG";
      break;
    case LOG_LEVEL_TRACE:
      type = "TRACE";
      break;
    default:
      type = "UNKWN";
  }
  ::fprintf(LOG_OUTPUT_STREAM, "%s [%s:%d:%s] %s - ", time_str, file, line, func, type);
}

#define HLL_LOG_AT(level, ...)                                          \
  do {                                                                  \
    if (LOG_LEVEL <= (level)) {                                         \
      hll::OutputLogHeader(__SHORT_FILE__, __LINE__, __FUNCTION__, level); \
      ::fprintf(LOG_OUTPUT_STREAM, __VA_ARGS__);                        \
      ::fprintf(LOG_OUTPUT_STREAM, "\n");                               \
      ::fflush(LOG_OUTPUT_STREAM);                                      \
    }                                                                   \
  } while (0)

#define LOG_ERROR(...) HLL_LOG_AT(hll::LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_WARN(...) HLL_LOG_AT(hll::LOG_LEVEL_WARN, __VA_ARGS__)
#define LOG_INFO(...) HLL_LOG_AT(hll::LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_DEBUG(...) HLL_LOG_AT(hll::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_TRACE(...) HLL_LOG_AT(hll::LOG_LEVEL_TRACE, __VA_ARGS__)

}  // namespace hll
