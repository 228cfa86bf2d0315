// node_log.cpp - implementation for node_log.hpp
// Formatting happens on the stack; the sink decides where the line goes.

#include "node_log.hpp"

#include <cstdarg>              // va_list for the printf-style entry point
#include <cstdio>               // snprintf / vsnprintf

// Current sink. Null means "drop everything".
static node_log_sink_t s_sink = nullptr;

void node_log_set_sink(node_log_sink_t sink) {
  s_sink = sink;
}

//
// node_log()
// ----------
// Phases:
//   1) Bail early if nobody is listening (skip the formatting cost).
//   2) Write "[tag] " prefix, then the caller's message after it.
//   3) Hand the NUL-terminated line to the sink.
//
// vsnprintf truncates and always terminates, so an over-long message is
// clipped rather than overrunning the buffer.
//
void node_log(const char* tag, const char* fmt, ...) {
  if (!s_sink) return;

  char line[NODE_LOG_LINE_MAX];
  int n = snprintf(line, sizeof(line), "[%s] ", tag ? tag : "LOG");
  if (n < 0) return;
  size_t off = static_cast<size_t>(n);
  if (off >= sizeof(line)) off = sizeof(line) - 1;

  if (fmt) {
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(line + off, sizeof(line) - off, fmt, ap);
    va_end(ap);
  }

  s_sink(line);
}
