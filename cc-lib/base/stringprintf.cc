#include "base/stringprintf.h"

#include <stdarg.h>
#include <stdio.h>
#include <string>
#include <vector>

using namespace std;

void StringAppendV(string *dst, const char *format, va_list ap) {
  // First try with a small fixed size buffer.
  static constexpr int SPACE = 1024;
  char space[SPACE];

  // It's possible for methods that use a va_list to invalidate
  // the data in it upon use. So copy it first.
  va_list backup_ap;
  va_copy(backup_ap, ap);
  int result = vsnprintf(space, SPACE, format, backup_ap);
  va_end(backup_ap);

  if (result < 0) {
    // Encoding error. Nothing sensible to append.
    return;
  }

  if (result < SPACE) {
    dst->append(space, result);
    return;
  }

  // Now we know exactly how much space we need (plus the terminator).
  vector<char> buf(result + 1);
  va_copy(backup_ap, ap);
  result = vsnprintf(buf.data(), buf.size(), format, backup_ap);
  va_end(backup_ap);

  if (result >= 0 && result < (int)buf.size()) {
    dst->append(buf.data(), result);
  }
}

string StringPrintf(const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  string result;
  StringAppendV(&result, format, ap);
  va_end(ap);
  return result;
}

void StringAppendF(string *dst, const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  StringAppendV(dst, format, ap);
  va_end(ap);
}
