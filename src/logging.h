#pragma once

// Logging macros for libmpaframe internals, written to stderr as
// "[LEVEL] tag: message". msg is a stream expression.
#include <iostream>

#define MPAFRAME_LOG(level, tag, msg) \
    do { std::cerr << "[" level "] " tag ": " << msg << std::endl; } while(0)

// Per-byte scanner tracing is compiled in only with MPAFRAME_DEBUG
#ifdef MPAFRAME_DEBUG
#define LOG_DEBUG(tag, msg) MPAFRAME_LOG("DEBUG", tag, msg)
#else
#define LOG_DEBUG(tag, msg) do { } while(0)
#endif
#define LOG_INFO(tag, msg)  MPAFRAME_LOG("INFO", tag, msg)
#define LOG_WARN(tag, msg)  MPAFRAME_LOG("WARN", tag, msg)
#define LOG_ERROR(tag, msg) MPAFRAME_LOG("ERROR", tag, msg)

// Component tags
#define SCANNER "scanner"
#define SOURCE  "source"
#define CAPI    "capi"
