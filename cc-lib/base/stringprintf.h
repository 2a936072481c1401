// printf-style formatting into std::string.

#ifndef _CC_LIB_BASE_STRINGPRINTF_H
#define _CC_LIB_BASE_STRINGPRINTF_H

#include <stdarg.h>
#include <string>

#if defined(__GNUC__) || defined(__clang__)
#  define CC_LIB_PRINTF_ATTRIBUTE(fmt, first) \
  __attribute__((format(printf, fmt, first)))
#else
#  define CC_LIB_PRINTF_ATTRIBUTE(fmt, first)
#endif

// Return a C++ string.
std::string StringPrintf(const char *format, ...)
  CC_LIB_PRINTF_ATTRIBUTE(1, 2);

// Append result to a supplied string.
void StringAppendF(std::string *dst, const char *format, ...)
  CC_LIB_PRINTF_ATTRIBUTE(2, 3);

// Lower-level routine that takes a va_list and appends to a specified
// string. All other routines are just convenience wrappers around it.
void StringAppendV(std::string *dst, const char *format, va_list ap);

#endif
